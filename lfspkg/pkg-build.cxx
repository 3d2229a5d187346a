// file      : lfspkg/pkg-build.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-build.hxx>

#include <lfspkg/patch.hxx>
#include <lfspkg/deploy.hxx>
#include <lfspkg/source.hxx>
#include <lfspkg/build-log.hxx>
#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  strings
  unmet_dependencies (const state_store& s, const recipe& r)
  {
    strings ms;

    for (const string& d: r.depends)
    {
      if (!s.installed (d))
        ms.push_back (d);
    }

    return ms;
  }

  static void
  staged_paths (const dir_path& d, const string& prefix, strings& r)
  {
    vector<pair<path, bool>> es; // Entry name and whether it is a directory.

    try
    {
      for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
        es.emplace_back (de.path (), de.ltype () == entry_type::directory);
    }
    catch (const system_error& e)
    {
      fail << "unable to scan directory " << d << ": " << e;
    }

    sort (es.begin (), es.end ());

    for (const pair<path, bool>& e: es)
    {
      string p (prefix + '/' + e.first.string ());

      r.push_back (p);

      if (e.second)
        staged_paths (d / path_cast<dir_path> (e.first), p, r);
    }
  }

  strings
  staged_paths (const dir_path& d)
  {
    strings r;
    staged_paths (d, string (), r);
    return r;
  }

  bool
  elf_binary (const path& f)
  {
    tracer trace ("elf_binary");

    try
    {
      ifdstream is (f, fdopen_mode::binary, ifdstream::badbit);

      // The identification bytes followed by e_type and e_machine.
      //
      char h[18];
      is.read (h, sizeof (h));

      if (is.gcount () != sizeof (h))
        return false;

      is.close ();

      if (!(h[0] == 0x7f && h[1] == 'E' && h[2] == 'L' && h[3] == 'F'))
        return false;

      // EI_DATA: 1 is little-endian, 2 is big-endian.
      //
      unsigned char lo (static_cast<unsigned char> (h[16]));
      unsigned char hi (static_cast<unsigned char> (h[17]));

      uint16_t t (h[5] == 2 ? (lo << 8 | hi) : (hi << 8 | lo));

      return t == 2 /* ET_EXEC */ || t == 3 /* ET_DYN */;
    }
    catch (const io_error& e)
    {
      l4 ([&]{trace << "unable to read " << f << ": " << e;});
    }

    return false;
  }

  // Strip the staged executables and shared libraries. Failures are not
  // fatal.
  //
  static void
  strip_binaries (const common_options& co, const dir_path& stage,
                  build_log& log)
  {
    tracer trace ("strip_binaries");

    const char* prog (co.strip_specified ()
                      ? co.strip ().string ().c_str ()
                      : "strip");

    process_path pp (try_search_program (prog));

    if (pp.empty ())
    {
      warn << "unable to find '" << prog << "', binaries are not stripped";
      return;
    }

    log.step ("strip");

    for (const string& s: staged_paths (stage))
    {
      path f (stage / path (string (s, 1)));

      try
      {
        pair<bool, entry_stat> pe (path_entry (f, false /* follow */));

        if (!pe.first || pe.second.type != entry_type::regular)
          continue;

        if ((path_permissions (f) & permissions::xu) == permissions::none)
          continue;
      }
      catch (const system_error& e)
      {
        l4 ([&]{trace << "unable to stat " << f << ": " << e;});
        continue;
      }

      if (!elf_binary (f))
        continue;

      cstrings args {prog, "-s", f.string ().c_str (), nullptr};

      try
      {
        if (!run_process (pp, args, log.fd ()))
          l4 ([&]{trace << "unable to strip " << f;});
      }
      catch (const failed&)
      {
        // Diagnostics has already been issued.
        //
        l4 ([&]{trace << "unable to execute " << prog << " for " << f;});
      }
    }
  }

  void
  pkg_build (const common_options& co,
             const configuration& c,
             state_store& st,
             const recipe& r,
             bool no_strip)
  {
    tracer trace ("pkg_build");

    l4 ([&]{trace << r.name << ' ' << r.version << " from " << r.file;});

    // Verify the dependencies before touching anything.
    //
    {
      strings ms (unmet_dependencies (st, r));

      if (!ms.empty ())
      {
        diag_record dr (error);
        dr << "unable to build " << r.name << ": unmet dependencies";

        for (const string& m: ms)
          dr << info << "dependency " << m << " is not installed";

        dr << info << "recipe " << r.file;
        dr.flush ();

        throw failed (failure::unmet_dependencies);
      }
    }

    build_log log (c.logs / path (r.package_id () + ".log"));
    log.step ("build " + r.name + ' ' + r.version + " (" + r.file.string () +
              ')');

    try
    {
      // Fetch, extract, and patch.
      //
      log.step ("resolve " + r.source);
      path a (resolve_source (co, c, r, log.fd ()));

      log.step ("extract " + a.string ());
      dir_path src (unpack_source (co, c, r, a, log.fd ()));

      l4 ([&]{trace << "source root: " << src;});

      apply_patches (co, c, r, src, log);

      // The build and install steps are run via the shell in the source
      // root.
      //
      const char* sh (co.sh_specified () ? co.sh ().string ().c_str () : "sh");
      process_path pp (search_program (sh, "build step execution"));

      string destdir ("DESTDIR=" + c.stage.string ());
      string sources ("SOURCES=" + c.sources.string ());
      string srcdir  ("SRCDIR="  + src.string ());

      const char* env[] = {
        destdir.c_str (), sources.c_str (), srcdir.c_str (), nullptr};

      auto run = [&r, &pp, &src, &env, &log] (const char* what,
                                               const cstrings& args)
      {
        log.step (what, args);

        if (verb >= 2)
          text << what << ' ' << r.package_id ();

        if (!run_process (pp, args, log.fd (), src, env))
        {
          error << what << " step failed for " << r.name << ' ' << r.version;
          throw failed (failure::build_failed);
        }
      };

      // The recipe's routines are run with the descriptor sourced. Note that
      // the descriptor path is passed as $0.
      //
      string rf (r.file.string ());
      string bcmd (". \"$0\" && " + build_step_function);
      string icmd (". \"$0\" && " + install_step_function);

      // Configure and compile.
      //
      if (r.custom_build)
        run ("build",
             cstrings {sh, "-c", bcmd.c_str (), rf.c_str (), nullptr});
      else
      {
        if (!r.configure.empty ())
        {
          string cmd (r.configure);

          // Run the configure script via the shell if it is not executable.
          //
          size_t b (0), e (0);
          next_word (cmd, b, e, ' ', '\t');

          try
          {
            path s (string (cmd, b, e - b));

            if (s.relative ())
              s = src / s;

            pair<bool, entry_stat> pe (path_entry (s, true /* follow */));

            if (pe.first                                         &&
                pe.second.type == entry_type::regular            &&
                (path_permissions (s) & permissions::xu) == permissions::none)
              cmd = sh_quote (sh) + ' ' + cmd;
          }
          catch (const invalid_path&)
          {
            // Not a path, leave it to the shell.
          }
          catch (const system_error& e)
          {
            fail << "unable to stat configure script: " << e;
          }

          if (!r.configure_args.empty ())
            cmd += ' ' + r.configure_args;

          run ("configure", cstrings {sh, "-c", cmd.c_str (), nullptr});
        }

        string cmd (r.make);

        if (!r.make_args.empty ())
          cmd += ' ' + r.make_args;

        run ("build", cstrings {sh, "-c", cmd.c_str (), nullptr});
      }

      // Install into the freshly created staging directory.
      //
      if (exists (c.stage))
        rm_r (c.stage);

      mk_p (c.stage);

      if (r.custom_install)
      {
        run ("install",
             cstrings {sh, "-c", icmd.c_str (), rf.c_str (), nullptr});
      }
      else
      {
        string cmd (r.make + " DESTDIR=" + sh_quote (c.stage.string ()));

        if (!r.install_args.empty ())
          cmd += ' ' + r.install_args;

        run ("install", cstrings {sh, "-c", cmd.c_str (), nullptr});
      }

      if (r.strip_binaries && !no_strip)
        strip_binaries (co, c.stage, log);

      {
        strings ps (staged_paths (c.stage));

        // The manifests and the archive listing are line-oriented.
        //
        for (const string& p: ps)
        {
          if (p.find ('\n') != string::npos)
          {
            error << "staged path '" << p << "' contains newline";
            throw failed (failure::deploy_failed);
          }
        }

        st.staged_manifest (r.name, ps);
      }

      // Record the package metadata. The post-removal hook is reset if the
      // recipe no longer specifies it.
      //
      auto record = [&st, &r] ()
      {
        st.set (r.name, "version", r.version);
        st.set (r.name, "category", r.category);
        st.set (r.name, "phase", r.phase);
        st.set (r.name,
                "post-remove-hook",
                r.post_remove_hook ? r.post_remove_hook->string () : "");
      };

      if (r.toolchain ())
      {
        // The staged tree is the result.
        //
        record ();
        st.mark_installed (r.name, r.artifact_id);

        log.step ("staged " + r.package_id ());
        log.close ();
        return;
      }

      path p (package (co, c, r, log));
      strings ms (deploy (co, c, p, log));

      record ();
      st.manifest (r.name, ms);
      st.mark_installed (r.name, r.artifact_id);

      log.step ("installed " + r.package_id ());
      log.close ();
    }
    catch (const failed&)
    {
      info << "see build log " << log.file ();
      throw;
    }

    if (!c.keep_build)
    {
      rm_r (work_directory (c, r));
      rm_r (c.stage);
    }
  }

  int
  pkg_build (const pkg_build_options& o, cli::scanner& args)
  {
    tracer trace ("pkg_build");

    if (!args.more ())
      fail << "recipe argument expected" <<
        info << "run 'lfspkg help build' for more information";

    // Load all the recipes before building any.
    //
    recipes rs;

    while (args.more ())
    {
      const char* a (args.next ());

      try
      {
        rs.push_back (load_recipe (path (a)));
      }
      catch (const invalid_path& e)
      {
        fail << "invalid recipe path '" << e.path << "'";
      }
    }

    configuration c (load_configuration (o));
    create_directories (c);

    state_store st (c.state);

    for (const recipe& r: rs)
    {
      pkg_build (o, c, st, r, o.no_strip ());

      if (verb)
        text << (r.toolchain () ? "staged " : "installed ") << r.name << ' '
             << r.version;
    }

    return 0;
  }
}
