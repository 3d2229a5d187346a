// file      : lfspkg/pkg-status.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-status.hxx>

#include <iostream> // cout

#include <lfspkg/state.hxx>
#include <lfspkg/recipe.hxx>
#include <lfspkg/diagnostics.hxx>
#include <lfspkg/configuration.hxx>

using namespace std;

namespace lfspkg
{
  int
  pkg_status (const pkg_status_options& o, cli::scanner& args)
  {
    if (!args.more ())
      fail << "package name argument expected" <<
        info << "run 'lfspkg help status' for more information";

    strings ns;
    while (args.more ())
    {
      string n (args.next ());
      validate_package_name (n);
      ns.push_back (move (n));
    }

    configuration c (load_configuration (o));
    state_store st (c.state);

    for (const string& n: ns)
      cout << n << (st.installed (n) ? " is installed" : " is not installed")
           << '\n';

    cout.flush ();
    return 0;
  }
}
