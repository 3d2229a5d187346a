// file      : lfspkg/fetch.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_FETCH_HXX
#define LFSPKG_FETCH_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/common-options.hxx>

namespace lfspkg
{
  // Download the file at the specified URL into the output file. The fetch
  // program's stdout and stderr are redirected to the out file descriptor.
  //
  // The download goes into a temporary file beside the output file which is
  // moved into place only if the fetch program succeeds. If the program is
  // specified with --fetch, then only this program is used. Otherwise, curl
  // is tried first and wget second.
  //
  // Issue diagnostics and throw failed(failure::download_failed) if none of
  // the programs is available or succeeded.
  //
  void
  fetch_file (const common_options&,
              const string& url,
              const path& out_file,
              int out = 2);
}

#endif // LFSPKG_FETCH_HXX
