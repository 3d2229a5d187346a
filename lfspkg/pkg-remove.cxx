// file      : lfspkg/pkg-remove.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-remove.hxx>

#include <lfspkg/recipe.hxx>
#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  // Run the post-removal hook if it is recorded and is executable. Its
  // failure is not fatal.
  //
  static void
  run_hook (const state_store& st, const string& n)
  {
    tracer trace ("run_hook");

    optional<string> h (st.get (n, "post-remove-hook"));

    if (!h || h->empty ())
      return;

    path f;

    try
    {
      f = path (*h);

      if (!file_exists (f) ||
          (path_permissions (f) & permissions::xu) == permissions::none)
      {
        l4 ([&]{trace << "skipping non-executable hook " << f;});
        return;
      }
    }
    catch (const invalid_path& e)
    {
      warn << "invalid post-removal hook path '" << e.path << "' for " << n;
      return;
    }
    catch (const system_error& e)
    {
      warn << "unable to stat post-removal hook " << f << ": " << e;
      return;
    }

    cstrings args {f.string ().c_str (), n.c_str (), nullptr};

    try
    {
      process_path pp (process::path_search (f));

      if (!run_process (pp, args, 2 /* stderr */))
        warn << "post-removal hook " << f << " failed for " << n;
    }
    catch (const process_error& e)
    {
      warn << "unable to execute post-removal hook " << f << ": " << e;
    }
    catch (const failed&)
    {
      // Diagnostics has already been issued.
      //
      warn << "post-removal hook " << f << " failed for " << n;
    }
  }

  bool
  pkg_remove (const configuration& c,
              state_store& st,
              const string& n,
              bool hook)
  {
    tracer trace ("pkg_remove");

    if (!st.installed (n))
    {
      warn << "package " << n << " is not installed";
      return false;
    }

    optional<strings> ms (st.manifest (n));

    if (!ms)
    {
      optional<string> ph (st.get (n, "phase"));

      if (!ph || *ph != toolchain_phase)
      {
        error << "no manifest recorded for installed package " << n <<
          info << "state directory " << st.directory ();

        throw failed (failure::manifest_missing);
      }

      l4 ([&]{trace << n << " is a toolchain package";});
    }
    else
    {
      paths fs; // Paths that cannot be removed.

      for (const string& m: reverse_iterate (*ms))
      {
        if (m.empty () || m[0] != '/')
        {
          l4 ([&]{trace << "skipping invalid manifest entry '" << m << "'";});
          continue;
        }

        path f;

        try
        {
          f = c.root / path (string (m, 1));

          pair<bool, entry_stat> pe (path_entry (f, false /* follow */));

          if (!pe.first)
            continue;

          if (verb >= 3)
            text << "rm " << f;

          if (pe.second.type == entry_type::directory)
          {
            // May still be used by other packages.
            //
            if (try_rmdir (path_cast<dir_path> (f)) == rmdir_status::not_empty)
              l5 ([&]{trace << "leaving non-empty " << f;});
          }
          else
            try_rmfile (f);
        }
        catch (const invalid_path& e)
        {
          l4 ([&]{trace << "skipping invalid path '" << e.path << "'";});
        }
        catch (const system_error& e)
        {
          error << "unable to remove " << f << ": " << e;
          fs.push_back (move (f));
        }
      }

      if (!fs.empty ())
      {
        error << "unable to remove " << fs.size () << " path(s) of " << n <<
          info << "package " << n << " is left installed";

        throw failed ();
      }
    }

    if (hook)
      run_hook (st, n);

    st.mark_uninstalled (n);
    return true;
  }

  int
  pkg_remove (const pkg_remove_options& o, cli::scanner& args)
  {
    tracer trace ("pkg_remove");

    if (!args.more ())
      fail << "package name argument expected" <<
        info << "run 'lfspkg help remove' for more information";

    strings ns;

    while (args.more ())
    {
      string n (args.next ());
      validate_package_name (n);
      ns.push_back (move (n));
    }

    configuration c (load_configuration (o));
    state_store st (c.state);

    for (const string& n: ns)
    {
      if (pkg_remove (c, st, n, !o.no_hook ()) && verb)
        text << "removed " << n;
    }

    return 0;
  }
}
