// file      : lfspkg/archive.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_ARCHIVE_HXX
#define LFSPKG_ARCHIVE_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/common-options.hxx>

namespace lfspkg
{
  enum class archive_format
  {
    tar,
    tar_gz,
    tar_bz2,
    tar_xz,
    tar_zst,
    zip
  };

  // Determine the archive format from the file name extension (.tar.gz,
  // .tgz, .tar.bz2, .tbz2, .tar.xz, .txz, .tar.zst, .tzst, .zip, .tar).
  // Return nullopt if the extension is not recognized.
  //
  optional<archive_format>
  archive_type (const path& archive);

  // Return the program that unpacks the archive of this format: the
  // decompressor whose output is piped into tar, unzip for the zip format,
  // or NULL for the uncompressed tar.
  //
  const char*
  archive_program (archive_format);

  // Start the process of extracting the archive to the specified directory
  // with the processes' stdout and stderr redirected to the out file
  // descriptor. If the wrapper program is not NULL, then run tar via this
  // program (think fakeroot).
  //
  // Fail with failure::unsupported_format if the archive format is not
  // recognized and with failure::tool_missing if the decompressor or tar
  // cannot be found.
  //
  // Return a pair of processes that form a pipe. Wait on the second first.
  //
  pair<process, process>
  start_extract (const common_options&,
                 const path& archive,
                 const dir_path&,
                 int out = 2,
                 const char* wrapper = nullptr);

  // Start as above, wait for the completion, and fail if unsuccessful.
  //
  void
  extract (const common_options&,
           const path& archive,
           const dir_path&,
           int out = 2,
           const char* wrapper = nullptr);

  // Execute tar in the archive contents listing mode (-t) and return its
  // stdout lines as is (for example, ./usr/bin/). The names are listed
  // unescaped so a name containing a newline cannot be represented.
  //
  strings
  archive_contents (const common_options&, const path& archive);

  // Create the gzip-compressed tar archive of the directory contents with
  // the entries owned by root. The entries are relative to the directory
  // (./usr/bin/foo). If the wrapper program is not NULL, then run tar via
  // this program.
  //
  void
  create_archive (const common_options&,
                  const dir_path&,
                  const path& archive,
                  int out = 2,
                  const char* wrapper = nullptr);
}

#endif // LFSPKG_ARCHIVE_HXX
