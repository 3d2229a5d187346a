// file      : lfspkg/pkg-info.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_INFO_HXX
#define LFSPKG_PKG_INFO_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/state.hxx>

#include <lfspkg/pkg-info-options.hxx>

namespace lfspkg
{
  int
  pkg_info (const pkg_info_options&, cli::scanner& args);

  // Print the package metadata, one `<key>: <value>` pair per line, or the
  // `<name> is not installed` line.
  //
  void
  pkg_info (ostream&, const state_store&, const string& name);
}

#endif // LFSPKG_PKG_INFO_HXX
