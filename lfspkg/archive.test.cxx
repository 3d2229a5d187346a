// file      : lfspkg/archive.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/archive.hxx>

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/deploy.hxx> // target_path()
#include <lfspkg/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace lfspkg
{
  static bool
  type (const char* f, archive_format t)
  {
    optional<archive_format> r (archive_type (path (f)));
    return r && *r == t;
  }

  static int
  main (int, char*[])
  {
    verb = 0;

    // Format detection.
    //
    assert (type ("zlib-1.3.1.tar.gz",       archive_format::tar_gz));
    assert (type ("/src/zlib-1.3.1.tgz",     archive_format::tar_gz));
    assert (type ("bzip2-1.0.8.tar.bz2",     archive_format::tar_bz2));
    assert (type ("bzip2-1.0.8.tbz2",        archive_format::tar_bz2));
    assert (type ("xz-5.4.6.tar.xz",         archive_format::tar_xz));
    assert (type ("xz-5.4.6.txz",            archive_format::tar_xz));
    assert (type ("zstd-1.5.5.tar.zst",      archive_format::tar_zst));
    assert (type ("tzdata2024a.tar",         archive_format::tar));
    assert (type ("unzip60.zip",             archive_format::zip));

    assert (!archive_type (path ("README")));
    assert (!archive_type (path ("fix.patch")));
    assert (!archive_type (path ("data.gz")));
    assert (!archive_type (path ("data.unknownext")));

    assert (archive_program (archive_format::tar) == nullptr);
    assert (strcmp (archive_program (archive_format::tar_gz),  "gzip")  == 0);
    assert (strcmp (archive_program (archive_format::tar_bz2), "bzip2") == 0);
    assert (strcmp (archive_program (archive_format::tar_xz),  "xz")    == 0);
    assert (strcmp (archive_program (archive_format::tar_zst), "zstd")  == 0);
    assert (strcmp (archive_program (archive_format::zip),     "unzip") == 0);

    // Unsupported formats are rejected before running anything.
    //
    {
      common_options co;

      try
      {
        extract (co, path ("/nonexistent/data.unknownext"),
                 dir_path ("/nonexistent"));
        assert (false);
      }
      catch (const failed& e)
      {
        assert (e == failure::unsupported_format);
      }

      try
      {
        archive_contents (co, path ("/nonexistent/data.rar"));
        assert (false);
      }
      catch (const failed& e)
      {
        assert (e == failure::unsupported_format);
      }
    }

    // Missing tar is reported before anything is extracted or listed.
    //
    {
      strings args {"--tar", "/nonexistent/tar"};
      cli::vector_scanner s (args);

      common_options co;
      co.parse (s);

      try
      {
        extract (co, path ("/nonexistent/data.tar"), dir_path ("/nonexistent"));
        assert (false);
      }
      catch (const failed& e)
      {
        assert (e == failure::tool_missing);
      }

      try
      {
        archive_contents (co, path ("/nonexistent/data.tar"));
        assert (false);
      }
      catch (const failed& e)
      {
        assert (e == failure::tool_missing);
      }
    }

    // Archive listing entries to target paths.
    //
    assert (target_path ("./") == "");
    assert (target_path (".") == "");
    assert (target_path ("/") == "");
    assert (target_path ("./usr/") == "/usr");
    assert (target_path ("./usr/bin/bash") == "/usr/bin/bash");
    assert (target_path ("usr/lib/") == "/usr/lib");
    assert (target_path ("etc/.hidden") == "/etc/.hidden");

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return lfspkg::main (argc, argv);
}
