// file      : lfspkg/pkg-remove.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_REMOVE_HXX
#define LFSPKG_PKG_REMOVE_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/state.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/pkg-remove-options.hxx>

namespace lfspkg
{
  int
  pkg_remove (const pkg_remove_options&, cli::scanner& args);

  // Remove the package's manifest paths from the target root, run its
  // post-removal hook, and mark it as not installed. Return false (after
  // issuing a warning) if the package is not installed.
  //
  // The manifest is processed in the reverse order so that the directory
  // contents are removed before the directory itself. Directories that are
  // not empty are left behind. If any other path cannot be removed, then
  // fail leaving the package installed. A toolchain-phase package has no
  // manifest and only its install marker is cleared.
  //
  // Fail with failure::manifest_missing if the manifest is not on record.
  //
  bool
  pkg_remove (const configuration&,
              state_store&,
              const string& name,
              bool run_hook = true);
}

#endif // LFSPKG_PKG_REMOVE_HXX
