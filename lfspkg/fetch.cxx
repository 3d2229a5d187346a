// file      : lfspkg/fetch.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/fetch.hxx>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

#define LFSPKG_USER_AGENT "lfspkg/" LFSPKG_VERSION_ID

namespace lfspkg
{
  enum class fetch_kind {curl, wget};

  static const char*
  to_string (fetch_kind k)
  {
    return k == fetch_kind::curl ? "curl" : "wget";
  }

  // Run `<prog> --version` and check that the first line starts with the
  // expected prefix. Return false if the program cannot be found or doesn't
  // look like what we expect.
  //
  static bool
  check_program (const path& prog, const char* prefix)
  {
    tracer trace ("check_program");

    const char* args[] = {prog.string ().c_str (), "--version", nullptr};

    process_path pp (try_search_program (args[0]));

    if (pp.empty ())
    {
      l4 ([&]{trace << prog << " not found";});
      return false;
    }

    try
    {
      if (verb >= 3)
        print_process (args);

      // Redirect stdout to a pipe and stderr to /dev/null.
      //
      process pr (pp, args, 0, -1, open_null ().get ());

      try
      {
        ifdstream is (move (pr.in_ofd), fdstream_mode::skip);

        string l;
        getline (is, l);
        is.close ();

        bool r (pr.wait () && l.compare (0, strlen (prefix), prefix) == 0);

        l4 ([&]{trace << prog << ": '" << l << "'";});
        return r;
      }
      catch (const io_error&)
      {
        // Fall through.
      }

      pr.wait ();
    }
    catch (const process_error& e)
    {
      if (e.child)
        exit (1);

      // Fall through.
    }

    return false;
  }

  // curl
  //
  static bool
  check_curl (const path& prog)
  {
    // The first line of the version output starts with "curl X.Y.Z".
    //
    return check_program (prog, "curl ");
  }

  static bool
  start_curl (const common_options& co,
              const path& prog,
              const string& url,
              const path& out,
              int log)
  {
    cstrings args {
      prog.string ().c_str (),
      "-L",       // Follow redirects.
      "-f",       // Fail on HTTP errors.
      "-s", "-S", // No progress but show errors.
      "-A", LFSPKG_USER_AGENT " curl"
    };

    if (verb > 3)
      args.push_back ("-v");

    string tm;
    if (co.fetch_timeout_specified ())
    {
      tm = std::to_string (co.fetch_timeout ());
      args.push_back ("--max-time");
      args.push_back (tm.c_str ());
    }

    // Add extra options. The idea is that they may override what we have
    // set before this point but not after.
    //
    for (const string& o: co.fetch_option ())
      args.push_back (o.c_str ());

    args.push_back ("-o");
    args.push_back (out.string ().c_str ());

    args.push_back (url.c_str ());
    args.push_back (nullptr);

    return run_process (search_program (args[0], "source download"),
                        args,
                        log);
  }

  // wget
  //
  static bool
  check_wget (const path& prog)
  {
    // The first line of the version output starts with "GNU Wget X.Y[.Z]".
    //
    return check_program (prog, "GNU Wget ");
  }

  static bool
  start_wget (const common_options& co,
              const path& prog,
              const string& url,
              const path& out,
              int log)
  {
    cstrings args {
      prog.string ().c_str (),
      "-U", LFSPKG_USER_AGENT " wget"
    };

    // In the wget world quiet means don't print anything, not even error
    // messages. So run it non-verbose which still prints errors.
    //
    args.push_back (verb > 3 ? "-d" : "--no-verbose");

    string tm;
    if (co.fetch_timeout_specified ())
    {
      tm = "--timeout=" + std::to_string (co.fetch_timeout ());
      args.push_back (tm.c_str ());
    }

    for (const string& o: co.fetch_option ())
      args.push_back (o.c_str ());

    args.push_back ("-O");
    args.push_back (out.string ().c_str ());

    args.push_back (url.c_str ());
    args.push_back (nullptr);

    return run_process (search_program (args[0], "source download"),
                        args,
                        log);
  }

  // Return the fetch program kind deduced from its name or nullopt if it is
  // not recognized.
  //
  static optional<fetch_kind>
  program_kind (const path& prog)
  {
    const string& s (prog.leaf ().string ());

    if (s.find ("curl") != string::npos) return fetch_kind::curl;
    if (s.find ("wget") != string::npos) return fetch_kind::wget;

    return nullopt;
  }

  void
  fetch_file (const common_options& co,
              const string& url,
              const path& f,
              int log)
  {
    tracer trace ("fetch_file");

    vector<pair<fetch_kind, path>> progs;

    if (co.fetch_specified ())
    {
      const path& p (co.fetch ());
      optional<fetch_kind> k (program_kind (p));

      if (!k)
        fail << "unknown fetch program " << p <<
          info << "use --fetch to specify a curl or wget program";

      progs.emplace_back (*k, p);
    }
    else
    {
      progs.emplace_back (fetch_kind::curl, path ("curl"));
      progs.emplace_back (fetch_kind::wget, path ("wget"));
    }

    path t (f + ".part");
    auto_rmfile rm (t);

    bool found (false);

    for (const pair<fetch_kind, path>& p: progs)
    {
      fetch_kind k (p.first);

      if (!(k == fetch_kind::curl ? check_curl (p.second)
                                  : check_wget (p.second)))
        continue;

      found = true;

      if (verb >= 1)
        text << "fetching " << url << " using " << to_string (k);

      bool r (k == fetch_kind::curl
              ? start_curl (co, p.second, url, t, log)
              : start_wget (co, p.second, url, t, log));

      if (r)
      {
        mv (t, f);
        rm.cancel ();
        return;
      }

      // Note that both programs truncate the output file so whatever the
      // failed attempt left there is overwritten by the next one.
      //
      l4 ([&]{trace << to_string (k) << " failed to fetch " << url;});
    }

    {
      diag_record dr (error);
      dr << "unable to download " << url;

      if (!found)
        dr << info << "no usable fetch program found (curl or wget)";
    }

    throw failed (failure::download_failed);
  }
}
