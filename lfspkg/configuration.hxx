// file      : lfspkg/configuration.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_CONFIGURATION_HXX
#define LFSPKG_CONFIGURATION_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/common-options.hxx>

namespace lfspkg
{
  // The root directories all the commands operate relative to. All the
  // paths are absolute and normalized.
  //
  struct configuration
  {
    dir_path recipes;  // Recipe repository root.
    dir_path sources;  // Source archives and patches.
    dir_path work;     // Extracted source trees, one per package id.
    dir_path stage;    // Staged installation (shared, wiped per install).
    dir_path packages; // Package archives.
    dir_path root;     // Target root.
    dir_path state;    // Package state store.
    dir_path logs;     // Build logs.

    // Keep the working and staging directories after a successful build.
    //
    bool keep_build = false;
  };

  // Resolve each root from its option, environment variable, or default,
  // in this order.
  //
  configuration
  load_configuration (const common_options&);

  // Create the directories that the build and state operations write into,
  // if they don't exist. The target root is expected to exist.
  //
  void
  create_directories (const configuration&);
}

#endif // LFSPKG_CONFIGURATION_HXX
