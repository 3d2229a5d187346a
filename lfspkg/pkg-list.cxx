// file      : lfspkg/pkg-list.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/pkg-list.hxx>

#include <iostream> // cout

#include <lfspkg/state.hxx>
#include <lfspkg/diagnostics.hxx>
#include <lfspkg/configuration.hxx>

using namespace std;

namespace lfspkg
{
  int
  pkg_list (const pkg_list_options& o, cli::scanner& args)
  {
    tracer trace ("pkg_list");

    if (args.more ())
      fail << "unexpected argument '" << args.next () << "'" <<
        info << "run 'lfspkg help list' for more information";

    configuration c (load_configuration (o));
    l4 ([&]{trace << "state: " << c.state;});

    for (const string& n: state_store (c.state).list_installed ())
      cout << n << '\n';

    cout.flush ();
    return 0;
  }
}
