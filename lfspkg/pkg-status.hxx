// file      : lfspkg/pkg-status.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_STATUS_HXX
#define LFSPKG_PKG_STATUS_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/pkg-status-options.hxx>

namespace lfspkg
{
  // Also used for the is-installed command.
  //
  int
  pkg_status (const pkg_status_options&, cli::scanner& args);
}

#endif // LFSPKG_PKG_STATUS_HXX
