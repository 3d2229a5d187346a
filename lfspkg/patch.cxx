// file      : lfspkg/patch.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/patch.hxx>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  path
  find_patch (const configuration& c, const recipe& r, const string& n)
  {
    tracer trace ("find_patch");

    try
    {
      path p (n);

      if (p.empty ())
        return path ();

      if (p.relative ())
      {
        path f (c.sources / p);

        if (exists (f))
          return f;

        p = r.directory () / p;
      }

      p.normalize ();

      if (exists (p))
        return p;

      l4 ([&]{trace << "patch '" << n << "' not found in " << c.sources
                    << " nor as " << p;});
    }
    catch (const invalid_path& e)
    {
      l4 ([&]{trace << "invalid patch path '" << e.path << "'";});
    }

    return path ();
  }

  void
  apply_patches (const common_options& co,
                 const configuration& c,
                 const recipe& r,
                 const dir_path& src,
                 build_log& log)
  {
    const char* prog (co.patch_specified ()
                      ? co.patch ().string ().c_str ()
                      : "patch");

    process_path pp;

    for (const string& n: r.patches)
    {
      path p (find_patch (c, r, n));

      if (p.empty ())
      {
        error << "patch '" << n << "' not found" <<
          info << "searched in " << c.sources << " and " << r.directory () <<
          info << "recipe " << r.file;

        throw failed (failure::patch_not_found);
      }

      if (pp.empty ())
        pp = search_program (prog, "patch application");

      cstrings args {
        prog, "-p1", "--batch", "-i", p.string ().c_str (), nullptr};

      log.step ("patch", args);

      if (verb >= 2)
        text << "applying " << p.leaf ();

      if (!run_process (pp, args, log.fd (), src))
      {
        error << "unable to apply patch " << p << " to " << src;

        throw failed (failure::patch_rejected);
      }
    }
  }
}
