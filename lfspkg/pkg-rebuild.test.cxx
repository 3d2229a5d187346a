// file      : lfspkg/pkg-rebuild.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-rebuild.hxx>

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/state.hxx>
#include <lfspkg/diagnostics.hxx>

#include <lfspkg/pkg-build.test.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace lfspkg
{
  static int
  main (int, char*[])
  {
    verb = 0;

    // Recipe discovery.
    //
    {
      test_tree t ("find");

      t.write (t.config.recipes / path ("b/b.recipe"), "");
      t.write (t.config.recipes / path ("a/a.recipe"), "");
      t.write (t.config.recipes / path ("a/patches/a.patch"), "");
      t.write (t.config.recipes / path ("core/c/c.recipe"), "");
      t.write (t.config.recipes / path (".git/x.recipe"), "");
      t.write (t.config.recipes / path ("README"), "");

      paths fs (find_recipes (t.config.recipes));

      assert ((fs == paths {t.config.recipes / path ("a/a.recipe"),
                            t.config.recipes / path ("b/b.recipe"),
                            t.config.recipes / path ("core/c/c.recipe")}));
    }

    // Dependency order regardless of the recipe order.
    //
    {
      test_tree t ("order");
      state_store st (t.config.state);

      recipes rs;
      rs.push_back (load_recipe (t.package ("c", "1.0", "DEPENDS=b\n")));
      rs.push_back (load_recipe (t.package ("b", "1.0", "DEPENDS=a\n")));
      rs.push_back (load_recipe (t.package ("a", "1.0")));

      rebuild_result r (rebuild_all (t.options, t.config, st, rs));

      assert ((r.built == strings {"a", "b", "c"}));
      assert (r.failures.empty ());
      assert (r.unresolved.empty ());
      assert ((st.list_installed () == strings {"a", "b", "c"}));

      // Everything installed is removed and rebuilt.
      //
      r = rebuild_all (t.options, t.config, st, rs);

      assert (r.built.size () == 3);
      assert (r.unresolved.empty ());
      assert ((st.list_installed () == strings {"a", "b", "c"}));
      assert (exists (t.config.root / path ("usr/bin/c")));
    }

    // Cyclic and unsatisfiable dependencies are left unresolved.
    //
    {
      test_tree t ("cycle");
      state_store st (t.config.state);

      recipes rs;
      rs.push_back (load_recipe (t.package ("x", "1.0", "DEPENDS=y\n")));
      rs.push_back (load_recipe (t.package ("y", "1.0", "DEPENDS=x\n")));
      rs.push_back (load_recipe (t.package ("z", "1.0", "DEPENDS=missing\n")));
      rs.push_back (load_recipe (t.package ("w", "1.0")));
      rs.push_back (load_recipe (t.package ("s", "1.0", "DEPENDS=\"w s\"\n")));

      rebuild_result r (rebuild_all (t.options, t.config, st, rs));

      assert ((r.built == strings {"w"}));
      assert (r.unresolved.size () == 4);

      assert (r.unresolved[0].name == "x");
      assert ((r.unresolved[0].missing == strings {"y"}));
      assert (r.unresolved[0].file == rs[0].file);

      assert (r.unresolved[1].name == "y");
      assert ((r.unresolved[1].missing == strings {"x"}));

      assert (r.unresolved[2].name == "z");
      assert ((r.unresolved[2].missing == strings {"missing"}));

      assert (r.unresolved[3].name == "s");
      assert ((r.unresolved[3].missing == strings {"s"}));

      assert ((st.list_installed () == strings {"w"}));
    }

    // Build failures.
    //
    {
      test_tree t ("failure");
      state_store st (t.config.state);

      path f (t.config.recipes / path ("bad/bad.recipe"));
      t.write (f,
               "NAME=bad\n"
               "VERSION=1.0\n"
               "SOURCE=bad-1.0.tar.gz\n");

      recipes rs;
      rs.push_back (load_recipe (f));
      rs.push_back (load_recipe (t.package ("good", "1.0")));
      rs.push_back (load_recipe (t.package ("user", "1.0", "DEPENDS=bad\n")));

      // Stop on the first failure.
      //
      try
      {
        rebuild_all (t.options, t.config, st, rs);
        assert (false);
      }
      catch (const failed& e)
      {
        assert (e == failure::source_not_found);
      }

      assert (st.list_installed ().empty ());

      // Keep going.
      //
      rebuild_result r (rebuild_all (t.options,
                                     t.config,
                                     st,
                                     rs,
                                     true /* keep_going */));

      assert ((r.built == strings {"good"}));
      assert ((r.failures == strings {"bad"}));
      assert (r.unresolved.size () == 1 && r.unresolved[0].name == "user");
      assert ((st.list_installed () == strings {"good"}));
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return lfspkg::main (argc, argv);
}
