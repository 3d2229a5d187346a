// file      : lfspkg/build-log.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/build-log.hxx>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  static const fdopen_mode append_mode (fdopen_mode::out    |
                                        fdopen_mode::create |
                                        fdopen_mode::append);

  build_log::
  build_log (path f)
      : file_ (move (f))
  {
    dir_path d (file_.directory ());

    if (!d.empty () && !exists (d))
      mk_p (d);

    try
    {
      fd_ = fdopen (file_, append_mode);
    }
    catch (const io_error& e)
    {
      fail << "unable to open build log " << file_ << ": " << e;
    }
  }

  void build_log::
  step (const string& what)
  {
    write (what, nullptr);
  }

  void build_log::
  step (const string& what, const cstrings& args)
  {
    write (what, &args);
  }

  void build_log::
  write (const string& what, const cstrings* args)
  {
    // Note that the header is written via a separate descriptor which is
    // also in the append mode so it cannot overwrite the processes output.
    //
    try
    {
      ofdstream os (file_, append_mode);

      os << "=== " << what;

      if (args != nullptr)
      {
        os << ": ";
        process::print (os, args->data (), args->size () - 1);
      }

      to_stream (os << " [",
                 timestamp::clock::now (),
                 "%Y-%m-%dT%H:%M:%S",
                 false /* special */,
                 true  /* local */);

      os << "]\n";
      os.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to build log " << file_ << ": " << e;
    }
  }

  void build_log::
  close ()
  {
    try
    {
      fd_.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to close build log " << file_ << ": " << e;
    }
  }
}
