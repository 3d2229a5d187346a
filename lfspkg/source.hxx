// file      : lfspkg/source.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_SOURCE_HXX
#define LFSPKG_SOURCE_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/recipe.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/common-options.hxx>

namespace lfspkg
{
  // Return the URL if the source reference is an http, https, or ftp URL
  // and nullopt otherwise.
  //
  optional<url>
  source_url (const string&);

  // Resolve the recipe's source reference to the local archive path in the
  // sources directory, downloading it if the reference is a URL and the
  // archive is not there yet. The fetch program output goes to the log file
  // descriptor.
  //
  // Fail with failure::source_not_found if the reference is empty or the
  // archive doesn't exist, failure::download_failed if unable to download,
  // and failure::checksum_mismatch if the recipe specifies the checksum and
  // it doesn't match.
  //
  path
  resolve_source (const common_options&,
                  const configuration&,
                  const recipe&,
                  int log = 2);

  // Return the SHA256 checksum of the file contents.
  //
  string
  file_checksum (const path&);

  // Extract the archive into the recipe's working directory (wiping it
  // first) and return the source root: the WORKDIR_SUBDIR subdirectory if
  // specified and exists and the first (in the lexicographical order)
  // extracted entry otherwise.
  //
  dir_path
  unpack_source (const common_options&,
                 const configuration&,
                 const recipe&,
                 const path& archive,
                 int log = 2);

  // Return the recipe's working directory.
  //
  inline dir_path
  work_directory (const configuration& c, const recipe& r)
  {
    return c.work / dir_path (r.package_id ());
  }
}

#endif // LFSPKG_SOURCE_HXX
