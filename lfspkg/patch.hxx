// file      : lfspkg/patch.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PATCH_HXX
#define LFSPKG_PATCH_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/recipe.hxx>
#include <lfspkg/build-log.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/common-options.hxx>

namespace lfspkg
{
  // Resolve the patch name first against the sources directory and then as
  // a literal path (relative to the recipe directory if not absolute).
  // Return empty path if neither exists.
  //
  path
  find_patch (const configuration&, const recipe&, const string& name);

  // Apply the recipe's patches to the source root in the declaration order,
  // each with one leading path component stripped. Stop on the first
  // failure.
  //
  // Fail with failure::patch_not_found if a patch cannot be resolved and
  // with failure::patch_rejected if the patch program fails.
  //
  void
  apply_patches (const common_options&,
                 const configuration&,
                 const recipe&,
                 const dir_path& src_root,
                 build_log&);
}

#endif // LFSPKG_PATCH_HXX
