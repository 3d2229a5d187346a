// file      : lfspkg/source.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/source.hxx>

#include <lfspkg/fetch.hxx>
#include <lfspkg/archive.hxx>
#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  optional<url>
  source_url (const string& s)
  {
    // Plain file names have no scheme and fail to parse as URLs.
    //
    if (s.find ("://") == string::npos)
      return nullopt;

    try
    {
      url u (s);

      for (const char* sc: {"http", "https", "ftp"})
      {
        if (icasecmp (u.scheme, sc) == 0)
          return u;
      }
    }
    catch (const invalid_argument&)
    {
      // Fall through.
    }

    return nullopt;
  }

  string
  file_checksum (const path& f)
  {
    try
    {
      ifdstream is (f, fdopen_mode::binary);
      sha256 cs (is);
      is.close ();
      return cs.string ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read from " << f << ": " << e << endf;
    }
  }

  path
  resolve_source (const common_options& co,
                  const configuration& c,
                  const recipe& r,
                  int log)
  {
    tracer trace ("resolve_source");

    const string& s (r.source);

    if (s.empty ())
    {
      error << "no source specified for " << r.name <<
        info << "recipe " << r.file;

      throw failed (failure::source_not_found);
    }

    path f;

    if (optional<url> u = source_url (s))
    {
      // Name the archive after the last URL path component.
      //
      path n;

      try
      {
        if (u->path && !u->path->empty () && u->path->back () != '/')
          n = path (*u->path).leaf ();
      }
      catch (const invalid_path&)
      {
        // Fall through.
      }

      if (n.empty ())
      {
        error << "unable to derive archive name from source url " << s <<
          info << "recipe " << r.file;

        throw failed (failure::source_not_found);
      }

      f = c.sources / n;

      if (!exists (f))
        fetch_file (co, s, f, log);
      else
        l4 ([&]{trace << "using cached " << f;});
    }
    else
    {
      try
      {
        f = c.sources / path (s);
      }
      catch (const invalid_path& e)
      {
        error << "invalid source '" << e.path << "'" <<
          info << "recipe " << r.file;

        throw failed (failure::source_not_found);
      }

      if (!exists (f))
      {
        error << "source archive " << f << " does not exist" <<
          info << "recipe " << r.file;

        throw failed (failure::source_not_found);
      }
    }

    if (r.sha256)
    {
      string cs (file_checksum (f));

      if (cs != *r.sha256)
      {
        error << "checksum mismatch for " << f <<
          info << "expected: " << *r.sha256 <<
          info << "actual:   " << cs;

        throw failed (failure::checksum_mismatch);
      }
    }

    return f;
  }

  dir_path
  unpack_source (const common_options& co,
                 const configuration& c,
                 const recipe& r,
                 const path& a,
                 int log)
  {
    tracer trace ("unpack_source");

    dir_path d (work_directory (c, r));

    if (exists (d))
      rm_r (d);

    mk_p (d);

    extract (co, a, d, log);

    if (r.subdir)
    {
      dir_path sd (d / *r.subdir);

      if (exists (sd))
        return sd;

      l4 ([&]{trace << "subdirectory " << *r.subdir << " not found in "
                    << d;});
    }

    paths es (dir_entries (d));

    if (es.empty ())
    {
      error << "archive " << a << " produced no entries";
      throw failed (failure::build_failed);
    }

    // If the first entry is not a directory, then the working directory
    // itself is the source root.
    //
    dir_path sd (d / path_cast<dir_path> (es.front ()));

    if (!exists (sd))
      return d;

    return sd;
  }
}
