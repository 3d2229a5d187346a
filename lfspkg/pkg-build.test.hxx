// file      : lfspkg/pkg-build.test.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_PKG_BUILD_TEST_HXX
#define LFSPKG_PKG_BUILD_TEST_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/diagnostics.hxx>
#include <lfspkg/configuration.hxx>

#include <lfspkg/common-options.hxx>

#undef NDEBUG
#include <cassert>

namespace lfspkg
{
  // Private directory tree for the pipeline tests, removed on destruction.
  //
  // <tmp>/lfspkg-<test>-<pid>/
  //   recipes/ sources/ work/ destdir/ packages/ root/ state/ logs/
  //
  struct test_tree
  {
    dir_path dir;
    configuration config;
    common_options options;

    auto_rmdir rm;

    explicit
    test_tree (const string& test)
    {
      dir = dir_path::temp_directory () /
            dir_path ("lfspkg-" + test + '-' +
                      std::to_string (process::current_id ()));

      if (exists (dir))
        rm_r (dir);

      mk_p (dir);
      rm = auto_rmdir (dir);

      config.recipes  = dir / dir_path ("recipes");
      config.sources  = dir / dir_path ("sources");
      config.work     = dir / dir_path ("work");
      config.stage    = dir / dir_path ("destdir");
      config.packages = dir / dir_path ("packages");
      config.root     = dir / dir_path ("root");
      config.state    = dir / dir_path ("state");
      config.logs     = dir / dir_path ("logs");

      create_directories (config);
      mk_p (config.recipes);
      mk_p (config.root);

      // Run without the ownership-normalizing wrapper so that only sh and
      // tar are required.
      //
      strings args {"--no-fakeroot"};
      cli::vector_scanner s (args);
      options.parse (s);
    }

    // Write the file creating its directory if required.
    //
    void
    write (const path& f, const string& text) const
    {
      dir_path d (f.directory ());
      if (!exists (d))
        mk_p (d);

      try
      {
        ofdstream os (f);
        os << text;
        os.close ();
      }
      catch (const io_error& e)
      {
        fail << "unable to write to " << f << ": " << e;
      }
    }

    // Create the <name>-<version>.tar.gz source archive in the sources
    // directory containing the <name>-<version>/ directory with the
    // specified files.
    //
    path
    source_archive (const string& name,
                    const string& version,
                    const vector<pair<string, string>>& files) const
    {
      string id (name + '-' + version);
      dir_path src (dir / dir_path ("src") / dir_path (id));

      for (const pair<string, string>& f: files)
        write (src / path (f.first), f.second);

      path a (config.sources / path (id + ".tar.gz"));
      dir_path p (src.directory ());

      cstrings args {"tar",
                     "-czf", a.string ().c_str (),
                     "-C", p.string ().c_str (),
                     id.c_str (),
                     nullptr};

      assert (run_process (search_program ("tar", "test"), args, 2));
      return a;
    }

    // Write the recipe that installs its files with the custom routines.
    // The extra lines are added after the standard assignments.
    //
    path
    recipe_file (const string& name,
                 const string& version,
                 const string& extra = string ()) const
    {
      path f (config.recipes / dir_path (name) /
              path (name + ".recipe"));

      write (f,
             "NAME=" + name + "\n"
             "VERSION=" + version + "\n"
             "SOURCE=\"$NAME-$VERSION.tar.gz\"\n" +
             extra +
             "\n"
             "build_step ()\n"
             "{\n"
             "  echo \"$NAME\" > built.txt\n"
             "}\n"
             "\n"
             "install_step ()\n"
             "{\n"
             "  mkdir -p \"$DESTDIR/usr/bin\" \"$DESTDIR/usr/share/$NAME\"\n"
             "  cp run.sh \"$DESTDIR/usr/bin/$NAME\"\n"
             "  cp built.txt \"$DESTDIR/usr/share/$NAME/\"\n"
             "}\n");

      return f;
    }

    // Create both the source archive and the recipe.
    //
    path
    package (const string& name,
             const string& version,
             const string& extra = string ()) const
    {
      source_archive (name, version,
                      {{"run.sh", "#!/bin/sh\necho " + name + "\n"}});

      return recipe_file (name, version, extra);
    }
  };

  // Return the sorted copy.
  //
  inline strings
  sorted (strings s)
  {
    sort (s.begin (), s.end ());
    return s;
  }

  inline bool
  contains (const strings& s, const string& v)
  {
    return find (s.begin (), s.end (), v) != s.end ();
  }
}

#endif // LFSPKG_PKG_BUILD_TEST_HXX
