// file      : lfspkg/configuration.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/configuration.hxx>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  static dir_path
  root (bool specified,
        const dir_path& option,
        const char* var,
        const char* def,
        const char* what)
  {
    tracer trace ("root");

    dir_path r;

    if (specified)
      r = option;
    else
    {
      optional<string> v (getenv (var));

      try
      {
        r = dir_path (v && !v->empty () ? *v : string (def));
      }
      catch (const invalid_path& e)
      {
        fail << "invalid " << var << " environment variable value '"
             << e.path << "'";
      }
    }

    normalize (r, what);

    l4 ([&]{trace << what << ": " << r;});
    return r;
  }

  configuration
  load_configuration (const common_options& o)
  {
    configuration r;

#define ROOT(N, O, V, D, W) \
    r.N = root (o.O##_specified (), o.O (), V, D, W)

    ROOT (recipes,  recipes,  "LFSPKG_RECIPES",  "recipes",  "recipe repository");
    ROOT (sources,  sources,  "LFSPKG_SOURCES",  "sources",  "sources");
    ROOT (work,     work,     "LFSPKG_WORK",     "work",     "working");
    ROOT (stage,    stage,    "LFSPKG_STAGE",    "destdir",  "staging");
    ROOT (packages, packages, "LFSPKG_PACKAGES", "packages", "packages");
    ROOT (root,     root,     "LFSPKG_ROOT",     "/",        "target root");
    ROOT (state,    state,    "LFSPKG_STATE",    "state",    "state");
    ROOT (logs,     logs,     "LFSPKG_LOGS",     "logs",     "logs");

#undef ROOT

    if (o.keep_build ())
      r.keep_build = true;
    else
    {
      optional<string> v (getenv ("LFSPKG_KEEP_BUILD"));
      r.keep_build = v && (*v == "yes" || *v == "true" || *v == "1");
    }

    // The staging directory is wiped before every install step so it may
    // not be or contain any other directory.
    //
    if (r.stage.root ())
      fail << "staging directory cannot be the filesystem root";

    auto outside = [&r] (const dir_path& d, const char* what)
    {
      if (d.sub (r.stage))
        fail << what << ' ' << d << " is inside staging directory "
             << r.stage;
    };

    outside (r.root,     "target root");
    outside (r.recipes,  "recipe repository");
    outside (r.sources,  "sources directory");
    outside (r.work,     "working directory");
    outside (r.packages, "packages directory");
    outside (r.state,    "state directory");
    outside (r.logs,     "logs directory");

    return r;
  }

  void
  create_directories (const configuration& c)
  {
    for (const dir_path* d: {&c.sources,
                             &c.work,
                             &c.packages,
                             &c.state,
                             &c.logs})
      mk_p (*d);
  }
}
