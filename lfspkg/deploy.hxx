// file      : lfspkg/deploy.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_DEPLOY_HXX
#define LFSPKG_DEPLOY_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/recipe.hxx>
#include <lfspkg/build-log.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/common-options.hxx>

namespace lfspkg
{
  // Return the package archive path for the recipe:
  //
  // <packages>/<artifact>-<version>.pkg.tar.gz
  //
  path
  package_archive (const configuration&, const recipe&);

  // Package the staging directory contents into the recipe's package
  // archive, replacing the existing one. The archive is created in a
  // temporary file and moved into place on success.
  //
  // Fail with failure::tool_missing if the fakeroot wrapper (unless
  // disabled with --no-fakeroot) or tar cannot be found and with
  // failure::deploy_failed if tar fails.
  //
  path
  package (const common_options&,
           const configuration&,
           const recipe&,
           build_log&);

  // Extract the package archive into the target root and return the list
  // of the deployed absolute paths (the target manifest) in the archive
  // order. The root entry itself is never listed.
  //
  // Fail as above.
  //
  strings
  deploy (const common_options&,
          const configuration&,
          const path& archive,
          build_log&);

  // Convert the archive listing entry (./usr/bin/, usr/bin/foo, etc) into
  // the absolute target path. Return empty string for the root entry.
  //
  string
  target_path (const string& entry);

  // Return the ownership-normalizing wrapper program or NULL if disabled.
  //
  const char*
  fakeroot_program (const common_options&);
}

#endif // LFSPKG_DEPLOY_HXX
