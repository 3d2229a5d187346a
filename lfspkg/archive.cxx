// file      : lfspkg/archive.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/archive.hxx>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  optional<archive_format>
  archive_type (const path& a)
  {
    string e (a.extension ());

    // Second-level extension is .tar (e.g., .tar.bz2).
    //
    bool t (a.base ().extension () == "tar");

    if (e == "tgz"  || (t && e == "gz"))  return archive_format::tar_gz;
    if (e == "tbz2" || (t && e == "bz2")) return archive_format::tar_bz2;
    if (e == "txz"  || (t && e == "xz"))  return archive_format::tar_xz;
    if (e == "tzst" || (t && e == "zst")) return archive_format::tar_zst;
    if (e == "tar")                       return archive_format::tar;
    if (e == "zip")                       return archive_format::zip;

    return nullopt;
  }

  const char*
  archive_program (archive_format f)
  {
    switch (f)
    {
    case archive_format::tar:     return nullptr;
    case archive_format::tar_gz:  return "gzip";
    case archive_format::tar_bz2: return "bzip2";
    case archive_format::tar_xz:  return "xz";
    case archive_format::tar_zst: return "zstd";
    case archive_format::zip:     return "unzip";
    }

    return nullptr;
  }

  static archive_format
  format (const path& a)
  {
    optional<archive_format> r (archive_type (a));

    if (!r)
    {
      error << "unsupported archive format of " << a <<
        info << "supported formats are .tar.gz (.tgz), .tar.bz2 (.tbz2), "
             << ".tar.xz (.txz), .tar.zst (.tzst), .zip, and .tar";

      throw failed (failure::unsupported_format);
    }

    return *r;
  }

  static inline const char*
  tar_program (const common_options& co)
  {
    return co.tar_specified () ? co.tar ().string ().c_str () : "tar";
  }

  // Only the extract ('x') and list ('t') operations are supported.
  //
  // Return the command line (as a pipe if decompression is required) and
  // the tar command line start.
  //
  static pair<cstrings, size_t>
  start (const common_options& co,
         char op,
         const path& a,
         archive_format f,
         const char* wrapper)
  {
    assert (op == 'x' || op == 't');
    assert (f != archive_format::zip);

    cstrings args;

    // See if we need to decompress.
    //
    if (const char* d = archive_program (f))
    {
      args.push_back (d);
      args.push_back ("-dc");
      args.push_back (a.string ().c_str ());
      args.push_back (nullptr);
    }

    size_t i (args.size ()); // The tar command line start.

    if (wrapper != nullptr)
      args.push_back (wrapper);

    args.push_back (tar_program (co));

    // Add user's extra options.
    //
    if (op == 'x')
    {
      for (const string& o: co.tar_option ())
        args.push_back (o.c_str ());
    }
    else
    {
      // List the names as is rather than with the backslashes and
      // non-printable characters escaped.
      //
      args.push_back ("--quoting-style=literal");
    }

    args.push_back (op == 'x' ? "-xf" : "-tf");
    args.push_back (i == 0 ? a.string ().c_str () : "-");

    return make_pair (move (args), i);
  }

  // Search for the programs and start the (possibly piped) processes. The
  // command line must be terminated with the pipe end.
  //
  static pair<process, process>
  start (const cstrings& args, size_t i, const path& a, int out, int in_out)
  {
    const char* what (i != 0 ? "decompression of " : "extraction of ");

    process_path dpp;
    process_path tpp;

    // Note that we are looking for either the wrapper or tar here.
    //
    if (i != 0)
      dpp = search_program (args[0], (what + a.string ()).c_str ());

    tpp = search_program (args[i], ("extraction of " + a.string ()).c_str ());

    size_t w (0);
    try
    {
      if (verb >= 2)
        print_process (args);

      process dpr;
      process tpr;

      if (i != 0)
      {
        dpr = process (dpp, &args[w = 0], 0,   -1,     out);
        tpr = process (tpp, &args[w = i], dpr, in_out, out);
      }
      else
      {
        dpr = process (process_exit (0)); // Successfully exited.
        tpr = process (tpp, &args[w = 0], 0, in_out, out);
      }

      return make_pair (move (dpr), move (tpr));
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[w] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  pair<process, process>
  start_extract (const common_options& co,
                 const path& a,
                 const dir_path& d,
                 int out,
                 const char* wrapper)
  {
    archive_format f (format (a));

    if (f == archive_format::zip)
    {
      // unzip -q -o <archive> -d <dir>
      //
      cstrings args {archive_program (f),
                     "-q", "-o",
                     a.string ().c_str (),
                     "-d", d.string ().c_str (),
                     nullptr, nullptr};

      return start (args, 0, a, out, out);
    }

    pair<cstrings, size_t> args_i (start (co, 'x', a, f, wrapper));
    cstrings& args (args_i.first);
    size_t i (args_i.second);

    // -C/--directory -- change to directory.
    //
    args.push_back ("-C");
    args.push_back (d.string ().c_str ());

    args.push_back (nullptr);
    args.push_back (nullptr); // Pipe end.

    return start (args, i, a, out, out);
  }

  void
  extract (const common_options& co,
           const path& a,
           const dir_path& d,
           int out,
           const char* wrapper)
  {
    pair<process, process> pr (start_extract (co, a, d, out, wrapper));

    try
    {
      // Wait on the second first, see start_extract() for details.
      //
      bool r (pr.second.wait ());
      if (pr.first.wait () && r)
        return;
    }
    catch (const process_error& e)
    {
      fail << "unable to extract " << a << ": " << e;
    }

    // While it is reasonable to assuming the child process issued
    // diagnostics if exited with an error status, tar, specifically,
    // doesn't mention the archive name.
    //
    error << "unable to extract " << a << " into " << d;
    throw failed ();
  }

  strings
  archive_contents (const common_options& co, const path& a)
  try
  {
    archive_format f (format (a));

    if (f == archive_format::zip)
      fail << "unable to list contents of zip archive " << a;

    pair<cstrings, size_t> args_i (start (co, 't', a, f, nullptr));
    cstrings& args (args_i.first);

    args.push_back (nullptr);
    args.push_back (nullptr); // Pipe end.

    pair<process, process> pr (start (args, args_i.second, a, 2, -1));

    try
    {
      strings r;

      // Do not throw when eofbit is set (end of stream reached), and
      // when failbit is set (getline() failed to extract any character).
      //
      ifdstream is (move (pr.second.in_ofd), ifdstream::badbit);

      for (string l; !eof (getline (is, l)); )
        r.push_back (move (l));

      is.close ();

      if (pr.second.wait () && pr.first.wait ())
        return r;

      // Fall through.
    }
    catch (const io_error&)
    {
      // Child exit status doesn't matter. Just wait for the process
      // completion and fall through.
      //
      pr.second.wait (); pr.first.wait (); // Check throw.
    }

    error << "unable to obtain contents for " << a;
    throw failed ();
  }
  catch (const process_error& e)
  {
    fail << "unable to obtain contents for " << a << ": " << e << endf;
  }

  void
  create_archive (const common_options& co,
                  const dir_path& d,
                  const path& a,
                  int out,
                  const char* wrapper)
  {
    cstrings args;

    if (wrapper != nullptr)
      args.push_back (wrapper);

    args.push_back (tar_program (co));

    // Normalize the entries ownership regardless of who runs us.
    //
    args.push_back ("--owner=0");
    args.push_back ("--group=0");
    args.push_back ("--numeric-owner");

    args.push_back ("-czf");
    args.push_back (a.string ().c_str ());

    args.push_back ("-C");
    args.push_back (d.string ().c_str ());
    args.push_back (".");

    args.push_back (nullptr);

    process_path pp (search_program (args[0], "package archive creation"));

    if (!run_process (pp, args, out))
      fail << "unable to create package archive " << a << " from " << d;
  }
}
