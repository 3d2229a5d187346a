// file      : lfspkg/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/utility.hxx>

#include <libbutl/fdstream.hxx>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  const dir_path empty_dir_path;

  path&
  normalize (path& f, const char* what)
  {
    try
    {
      if (!f.complete ().normalized ())
        f.normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid " << what << " path " << e.path;
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e;
    }

    return f;
  }

  dir_path&
  normalize (dir_path& d, const char* what)
  {
    try
    {
      if (!d.complete ().normalized ())
        d.normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid " << what << " directory " << e.path;
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e;
    }

    return d;
  }

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  bool
  empty (const dir_path& d)
  {
    try
    {
      return dir_empty (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to scan directory " << d << ": " << e << endf;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  rm (const path& f, uint16_t v)
  {
    if (verb >= v)
      text << "rm " << f;

    try
    {
      if (try_rmfile (f) == rmfile_status::not_exist)
        fail << "unable to remove file " << f << ": file does not exist";
    }
    catch (const system_error& e)
    {
      fail << "unable to remove file " << f << ": " << e;
    }
  }

  void
  rm_r (const dir_path& d, bool dir, uint16_t v)
  {
    if (verb >= v)
      text << (dir ? "rmdir -r " : "rm -r ") << (dir ? d : d / dir_path ("*"));

    try
    {
      rmdir_r (d, dir);
    }
    catch (const system_error& e)
    {
      fail << "unable to remove " << (dir ? "" : "contents of ")
           << "directory " << d << ": " << e;
    }
  }

  bool
  mv (const path& from, const path& to, bool ie)
  {
    if (verb >= 3)
      text << "mv " << from << ' ' << to;

    try
    {
      mvfile (from, to,
              cpflags::overwrite_content | cpflags::overwrite_permissions);
    }
    catch (const system_error& e)
    {
      error << "unable to move file " << from << " to " << to << ": " << e;

      if (ie)
        return false;

      throw failed ();
    }

    return true;
  }

  paths
  dir_entries (const dir_path& d)
  {
    paths r;

    try
    {
      for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
      {
        const path& p (de.path ());

        if (p.string ().front () != '.')
          r.push_back (p);
      }
    }
    catch (const system_error& e)
    {
      fail << "unable to scan directory " << d << ": " << e;
    }

    sort (r.begin (), r.end ());
    return r;
  }

  auto_fd
  open_null ()
  {
    try
    {
      return fdopen_null ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open null device: " << e << endf;
    }
  }

  process_path
  try_search_program (const char* p)
  {
    return process::try_path_search (p, true /* init */);
  }

  process_path
  search_program (const char* p, const char* what)
  {
    process_path r (try_search_program (p));

    if (r.empty ())
    {
      error << "unable to find '" << p << "' required for " << what <<
        info << "make sure it is installed and is in PATH";

      throw failed (failure::tool_missing);
    }

    return r;
  }

  bool
  run_process (const process_path& pp,
               const cstrings& args,
               int out,
               const dir_path& cwd,
               const char* const* env)
  {
    try
    {
      if (verb >= 2)
        print_process (args);

      process pr (pp,
                  args.data (),
                  0 /* stdin */, out, out,
                  cwd.empty () ? nullptr : cwd.string ().c_str (),
                  env);

      return pr.wait ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  string
  sh_quote (const string& s)
  {
    string r ("'");

    for (char c: s)
    {
      if (c == '\'')
        r += "'\\''";
      else
        r += c;
    }

    r += '\'';
    return r;
  }
}
