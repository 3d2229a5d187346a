// file      : lfspkg/pkg-rebuild.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_REBUILD_HXX
#define LFSPKG_PKG_REBUILD_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/state.hxx>
#include <lfspkg/recipe.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/pkg-rebuild-options.hxx>

namespace lfspkg
{
  int
  pkg_rebuild (const pkg_rebuild_options&, cli::scanner& args);

  // Recipe that could not be built because some of its dependencies never
  // got installed (unsatisfiable or cyclic dependencies).
  //
  struct unresolved_recipe
  {
    path file;
    string name;
    strings missing; // Dependencies that are not installed.
  };

  struct rebuild_result
  {
    strings built;    // Names in the build order.
    strings failures; // Names whose build failed (--keep-going only).
    vector<unresolved_recipe> unresolved;
  };

  // Return all the *.recipe files found in the directory recursively,
  // sorted.
  //
  paths
  find_recipes (const dir_path&);

  // Remove (if installed) and rebuild the recipes in the dependency order.
  //
  // Scan the recipe list in order repeatedly. During a scan a recipe whose
  // dependencies are all installed is built and dropped from the list. Stop
  // when a scan builds nothing and return the recipes that are left as
  // unresolved.
  //
  // Unless keep_going is true, the first build failure is propagated.
  // Otherwise, the failed recipe is dropped and recorded in the result.
  //
  rebuild_result
  rebuild_all (const common_options&,
               const configuration&,
               state_store&,
               const recipes&,
               bool keep_going = false,
               bool no_strip = false);
}

#endif // LFSPKG_PKG_REBUILD_HXX
