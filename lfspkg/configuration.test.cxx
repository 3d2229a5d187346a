// file      : lfspkg/configuration.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/configuration.hxx>

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace lfspkg
{
  static const dir_path base (dir_path::temp_directory () /
                              dir_path ("lfspkg-configuration"));

  // Load the configuration with every root specified under the base
  // directory, followed by the overrides. Return NULL if loading fails.
  //
  static unique_ptr<configuration>
  load (const strings& overrides = strings ())
  {
    strings args;

    for (const char* n: {"recipes", "sources", "work", "stage", "packages",
                         "root", "state", "logs"})
    {
      args.push_back (string ("--") + n);
      args.push_back ((base / dir_path (n)).string ());
    }

    args.insert (args.end (), overrides.begin (), overrides.end ());

    cli::vector_scanner s (args);

    common_options o;
    o.parse (s);

    try
    {
      return unique_ptr<configuration> (
        new configuration (load_configuration (o)));
    }
    catch (const failed&)
    {
      return nullptr;
    }
  }

  static string
  sub (const char* d)
  {
    return (base / dir_path (d)).string ();
  }

  static int
  main (int, char*[])
  {
    verb = 0;

    // Distinct roots.
    //
    {
      unique_ptr<configuration> c (load ());

      assert (c != nullptr);
      assert (c->stage == base / dir_path ("stage"));
      assert (c->root == base / dir_path ("root"));
      assert (c->root.absolute () && c->logs.absolute ());
    }

    // Relative roots are completed and normalized.
    //
    {
      unique_ptr<configuration> c (load ({"--work", "build/../work"}));

      assert (c != nullptr);
      assert (c->work.absolute () && c->work.normalized ());
      assert (c->work.leaf () == dir_path ("work"));
    }

    // The staging directory may be inside the target root.
    //
    assert (load ({"--root", base.string (),
                   "--stage", sub ("stage")}) != nullptr);

    // But never the other way around.
    //
    assert (load ({"--stage", sub ("root")}) == nullptr);
    assert (load ({"--stage", base.string (),
                   "--root", sub ("mnt/lfs")}) == nullptr);
    assert (load ({"--stage", sub ("mnt"),
                   "--root", sub ("mnt/lfs")}) == nullptr);

    // Nor may it contain any other root.
    //
    assert (load ({"--state", sub ("stage/var/lib/lfspkg")}) == nullptr);
    assert (load ({"--packages", sub ("stage/packages")}) == nullptr);
    assert (load ({"--logs", sub ("stage")}) == nullptr);
    assert (load ({"--recipes", sub ("stage/recipes")}) == nullptr);

    assert (load ({"--stage", "/"}) == nullptr);

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return lfspkg::main (argc, argv);
}
