// file      : lfspkg/pkg-build.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_BUILD_HXX
#define LFSPKG_PKG_BUILD_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/state.hxx>
#include <lfspkg/recipe.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/pkg-build-options.hxx>

namespace lfspkg
{
  int
  pkg_build (const pkg_build_options&, cli::scanner& args);

  // Return the recipe's dependencies that are not installed.
  //
  strings
  unmet_dependencies (const state_store&, const recipe&);

  // Build the recipe, install it into the staging directory, and, unless it
  // belongs to the toolchain phase, package and deploy it into the target
  // root. On success record the package metadata and manifests and mark the
  // package as installed.
  //
  // Fail with failure::unmet_dependencies before doing anything if any of
  // the recipe dependencies is not installed. The output of all the
  // external programs goes to the <logs>/<artifact>-<version>.log file.
  //
  void
  pkg_build (const common_options&,
             const configuration&,
             state_store&,
             const recipe&,
             bool no_strip = false);

  // Return the paths of the directory tree entries (files, symlinks, and
  // directories) as absolute target paths. Every directory is listed before
  // its contents and the entries of a directory are sorted. The directory
  // itself is not listed.
  //
  strings
  staged_paths (const dir_path&);

  // Return true if the file is an ELF executable or shared object.
  //
  bool
  elf_binary (const path&);
}

#endif // LFSPKG_PKG_BUILD_HXX
