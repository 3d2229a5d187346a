// file      : lfspkg/pkg-info.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-info.hxx>

#include <iostream> // cout

#include <lfspkg/recipe.hxx>
#include <lfspkg/diagnostics.hxx>
#include <lfspkg/configuration.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  void
  pkg_info (ostream& os, const state_store& st, const string& n)
  {
    if (!st.installed (n))
    {
      os << n << " is not installed" << endl;
      return;
    }

    auto value = [&st, &n] (const char* k)
    {
      optional<string> v (st.get (n, k));
      return v ? move (*v) : string ();
    };

    // Toolchain packages only have the staged manifest.
    //
    optional<strings> ms (st.manifest (n));
    if (!ms)
      ms = st.staged_manifest (n);

    optional<string> t (st.installed_time (n));

    os << "name: "      << n                   << '\n'
       << "artifact: "  << value ("artifact")  << '\n'
       << "version: "   << value ("version")   << '\n'
       << "category: "  << value ("category")  << '\n'
       << "phase: "     << value ("phase")     << '\n'
       << "installed: " << (t ? *t : string ()) << '\n'
       << "files: "     << (ms ? ms->size () : 0) << endl;
  }

  int
  pkg_info (const pkg_info_options& o, cli::scanner& args)
  {
    if (!args.more ())
      fail << "package name argument expected" <<
        info << "run 'lfspkg help info' for more information";

    string n (args.next ());
    validate_package_name (n);

    configuration c (load_configuration (o));
    pkg_info (cout, state_store (c.state), n);

    return 0;
  }
}
