// file      : lfspkg/build-log.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_BUILD_LOG_HXX
#define LFSPKG_BUILD_LOG_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

namespace lfspkg
{
  // Per-build log file.
  //
  // The log is opened in the append mode so that the output of several
  // builds of the same package id accumulates. The output of external
  // processes is redirected to fd() while the step header lines are
  // written with step().
  //
  class build_log
  {
  public:
    // Create the log directory if it doesn't exist and open the log file.
    //
    explicit
    build_log (path file);

    const path&
    file () const {return file_;}

    int
    fd () const {return fd_.get ();}

    // Write the step header, optionally followed by the command line.
    //
    void
    step (const string& what);

    void
    step (const string& what, const cstrings& args);

    void
    close ();

  private:
    void
    write (const string& what, const cstrings* args);

  private:
    path file_;
    auto_fd fd_;
  };
}

#endif // LFSPKG_BUILD_LOG_HXX
