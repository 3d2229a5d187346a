// file      : lfspkg/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_UTILITY_HXX
#define LFSPKG_UTILITY_HXX

#include <string>    // to_string()
#include <cstring>   // strcmp()
#include <utility>   // move(), make_pair()
#include <cassert>   // assert()
#include <algorithm> // *

#include <libbutl/utility.hxx>         // icasecmp(), reverse_iterate(), etc
#include <libbutl/process.hxx>
#include <libbutl/filesystem.hxx>

#include <lfspkg/types.hxx>
#include <lfspkg/version.hxx>

namespace lfspkg
{
  using std::move;

  using std::make_pair;
  using std::to_string;

  using std::strcmp;

  // <libbutl/utility.hxx>
  //
  using butl::icasecmp;
  using butl::reverse_iterate;

  using butl::lcase;

  using butl::alpha;
  using butl::alnum;
  using butl::xdigit;

  using butl::next_word;

  using butl::getenv;

  using butl::eof;

  // <libbutl/filesystem.hxx>
  //
  using butl::auto_rmfile;
  using butl::auto_rmdir;

  extern const dir_path empty_dir_path;

  // Path.
  //
  // Normalize a path. Also make the relative path absolute using the current
  // directory.
  //
  path&
  normalize (path&, const char* what);

  inline path
  normalize (const path& f, const char* what)
  {
    path r (f);
    return move (normalize (r, what));
  }

  dir_path&
  normalize (dir_path&, const char* what);

  inline dir_path
  normalize (const dir_path& d, const char* what)
  {
    dir_path r (d);
    return move (normalize (r, what));
  }

  // Filesystem.
  //
  bool
  exists (const path&, bool ignore_error = false);

  bool
  exists (const dir_path&, bool ignore_error = false);

  bool
  empty (const dir_path&);

  void
  mk_p (const dir_path&);

  void
  rm (const path&, uint16_t verbosity = 3);

  void
  rm_r (const dir_path&, bool dir_itself = true, uint16_t verbosity = 3);

  // Note that if ignore_error is true, the diagnostics is still issued.
  //
  bool
  mv (const path& from, const path& to, bool ignore_errors = false);

  // Return the directory entries (names only) sorted lexicographically.
  // Skip the dot-entries.
  //
  paths
  dir_entries (const dir_path&);

  // File descriptor streams.
  //
  auto_fd
  open_null ();

  // Processes.
  //
  // Search for the program in PATH failing with failure::tool_missing if it
  // is not found. The what argument describes the program's purpose in the
  // diagnostics (for example, "zstd archive decompression").
  //
  process_path
  search_program (const char* program, const char* what);

  // As above but return empty process path if the program is not found.
  //
  process_path
  try_search_program (const char* program);

  // Run the process redirecting its stdout and stderr to the specified file
  // descriptor (normally a build log) and wait for its completion. Return
  // false if it didn't terminate normally with zero exit status. The
  // environment is specified as a NULL-terminated list of NAME=VALUE
  // assignments.
  //
  bool
  run_process (const process_path&,
               const cstrings& args,
               int out,
               const dir_path& cwd = empty_dir_path,
               const char* const* env = nullptr);

  // Quote the string for use in a POSIX shell command line.
  //
  string
  sh_quote (const string&);
}

#endif // LFSPKG_UTILITY_HXX
