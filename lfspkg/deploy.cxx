// file      : lfspkg/deploy.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/deploy.hxx>

#include <lfspkg/archive.hxx>
#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  path
  package_archive (const configuration& c, const recipe& r)
  {
    return c.packages / path (r.package_id () + ".pkg.tar.gz");
  }

  const char*
  fakeroot_program (const common_options& co)
  {
    if (co.no_fakeroot ())
      return nullptr;

    return co.fakeroot_specified ()
      ? co.fakeroot ().string ().c_str ()
      : "fakeroot";
  }

  // Make sure the wrapper is available, so that we fail early with the
  // proper diagnostics.
  //
  static const char*
  wrapper (const common_options& co, const char* what)
  {
    const char* r (fakeroot_program (co));

    if (r != nullptr)
      search_program (r, what);

    return r;
  }

  path
  package (const common_options& co,
           const configuration& c,
           const recipe& r,
           build_log& log)
  {
    path a (package_archive (c, r));
    path t (a + ".tmp");

    if (!exists (c.packages))
      mk_p (c.packages);

    const char* w (wrapper (co, "package archive creation"));

    log.step ("package " + a.string ());

    if (verb >= 2)
      text << "packaging " << a.leaf ();

    auto_rmfile rm (t);

    try
    {
      create_archive (co, c.stage, t, log.fd (), w);
    }
    catch (const failed& e)
    {
      if (e == failure::tool_missing)
        throw;

      throw failed (failure::deploy_failed);
    }

    mv (t, a);
    rm.cancel ();

    return a;
  }

  string
  target_path (const string& e)
  {
    size_t b (0);
    size_t n (e.size ());

    // Strip the leading ./ (or .) and the trailing directory separators.
    //
    if (n != 0 && e[0] == '.' && (n == 1 || e[1] == '/'))
      ++b;

    while (b != n && e[b] == '/')
      ++b;

    while (n != b && e[n - 1] == '/')
      --n;

    return b == n ? string () : '/' + string (e, b, n - b);
  }

  strings
  deploy (const common_options& co,
          const configuration& c,
          const path& a,
          build_log& log)
  {
    const char* w (wrapper (co, "package deployment"));

    log.step ("deploy " + a.string () + " into " + c.root.string ());

    if (verb >= 2)
      text << "deploying " << a.leaf () << " into " << c.root;

    strings r;

    try
    {
      extract (co, a, c.root, log.fd (), w);

      for (const string& e: archive_contents (co, a))
      {
        string p (target_path (e));

        if (!p.empty ())
          r.push_back (move (p));
      }
    }
    catch (const failed& e)
    {
      if (e == failure::tool_missing)
        throw;

      error << "unable to deploy " << a << " into " << c.root;

      throw failed (failure::deploy_failed);
    }

    return r;
  }
}
