// file      : lfspkg/pkg-list.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_LIST_HXX
#define LFSPKG_PKG_LIST_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/pkg-list-options.hxx>

namespace lfspkg
{
  // Print the installed package names, sorted, one per line.
  //
  int
  pkg_list (const pkg_list_options&, cli::scanner& args);
}

#endif // LFSPKG_PKG_LIST_HXX
