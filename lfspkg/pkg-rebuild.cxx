// file      : lfspkg/pkg-rebuild.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-rebuild.hxx>

#include <lfspkg/pkg-build.hxx>
#include <lfspkg/pkg-remove.hxx>
#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  static void
  find_recipes (const dir_path& d, paths& r)
  {
    try
    {
      for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
      {
        const path& n (de.path ());

        // Skip hidden entries (.git/, editor backups, etc).
        //
        if (n.string ().front () == '.')
          continue;

        switch (de.ltype ())
        {
        case entry_type::directory:
          {
            find_recipes (d / path_cast<dir_path> (n), r);
            break;
          }
        case entry_type::regular:
          {
            if (n.extension () == "recipe")
              r.push_back (d / n);

            break;
          }
        default:
          break;
        }
      }
    }
    catch (const system_error& e)
    {
      fail << "unable to scan directory " << d << ": " << e;
    }
  }

  paths
  find_recipes (const dir_path& d)
  {
    paths r;
    find_recipes (d, r);
    sort (r.begin (), r.end ());
    return r;
  }

  rebuild_result
  rebuild_all (const common_options& co,
               const configuration& c,
               state_store& st,
               const recipes& rs,
               bool keep_going,
               bool no_strip)
  {
    tracer trace ("rebuild_all");

    rebuild_result r;

    vector<reference_wrapper<const recipe>> q (rs.begin (), rs.end ());

    // Note that a pass either builds something (and so shrinks the queue) or
    // terminates the loop.
    //
    for (size_t pass (1); !q.empty (); ++pass)
    {
      size_t n (q.size ());

      l4 ([&]{trace << "pass " << pass << ": " << n << " recipe(s) queued";});

      for (auto i (q.begin ()); i != q.end (); )
      {
        const recipe& rc (*i);

        try
        {
          // Rebuild from scratch.
          //
          if (st.installed (rc.name))
            pkg_remove (c, st, rc.name);

          if (!unmet_dependencies (st, rc).empty ())
          {
            l5 ([&]{trace << "deferring " << rc.name;});
            ++i;
            continue;
          }

          pkg_build (co, c, st, rc, no_strip);

          if (verb)
            text << (rc.toolchain () ? "staged " : "installed ") << rc.name
                 << ' ' << rc.version;

          r.built.push_back (rc.name);
        }
        catch (const failed&)
        {
          if (!keep_going)
            throw;

          // Diagnostics has already been issued.
          //
          r.failures.push_back (rc.name);
        }

        i = q.erase (i);
      }

      if (q.size () == n)
        break;
    }

    for (const recipe& rc: q)
      r.unresolved.push_back (
        unresolved_recipe {rc.file, rc.name, unmet_dependencies (st, rc)});

    return r;
  }

  int
  pkg_rebuild (const pkg_rebuild_options& o, cli::scanner& args)
  {
    tracer trace ("pkg_rebuild");

    if (args.more ())
      fail << "unexpected argument '" << args.next () << "'" <<
        info << "run 'lfspkg help rebuild-all' for more information";

    configuration c (load_configuration (o));

    if (!exists (c.recipes))
      fail << "recipe repository " << c.recipes << " does not exist";

    // Load all the recipes before removing or building anything.
    //
    recipes rs;
    for (const path& f: find_recipes (c.recipes))
      rs.push_back (load_recipe (f));

    l4 ([&]{trace << rs.size () << " recipe(s) in " << c.recipes;});

    create_directories (c);
    state_store st (c.state);

    rebuild_result r (
      rebuild_all (o, c, st, rs, o.keep_going (), o.no_strip ()));

    if (verb)
      text << "built " << r.built.size () << " of " << rs.size ()
           << " recipe(s)";

    if (!r.failures.empty ())
    {
      diag_record dr (error);
      dr << "unable to build " << r.failures.size () << " recipe(s):";

      for (const string& n: r.failures)
        dr << ' ' << n;
    }

    if (!r.unresolved.empty ())
    {
      {
        diag_record dr (error);
        dr << "unable to resolve dependencies of " << r.unresolved.size ()
           << " recipe(s)";

        for (const unresolved_recipe& u: r.unresolved)
        {
          dr << info << u.file << ": " << u.name << " requires";

          for (const string& m: u.missing)
            dr << ' ' << m;
        }

        dr << info << "dependencies are either unsatisfiable or cyclic";
      }

      throw failed (failure::unresolved_set);
    }

    if (!r.failures.empty ())
      throw failed (failure::build_failed);

    return 0;
  }
}
