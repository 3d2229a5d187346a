// file      : lfspkg/help.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/help.hxx>

#include <libbutl/pager.hxx>

#include <lfspkg/diagnostics.hxx>
#include <lfspkg/lfspkg-options.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  int
  help (const help_options& o, const string& t, usage_function* usage)
  {
    if (usage == nullptr) // Not a command.
    {
      if (t.empty ())             // General help.
        usage = &print_lfspkg_usage;
      //
      // Help topics.
      //
      else if (t == "common-options")
        usage = &print_lfspkg_common_options_long_usage;
      else
        fail << "unknown lfspkg command/help topic '" << t << "'" <<
          info << "run 'lfspkg help' for more information";
    }

    try
    {
      pager p ("lfspkg " + (t.empty () ? "help" : t),
               verb >= 2,
               o.pager_specified () ? &o.pager () : nullptr,
               &o.pager_option ());

      usage (p.stream (), cli::usage_para::none);

      // If the pager failed, assume it has issued some diagnostics.
      //
      return p.wait () ? 0 : 1;
    }
    // Catch io_error as std::system_error together with the pager-specific
    // exceptions.
    //
    catch (const system_error& e)
    {
      error << "pager failed: " << e;

      // Fall through.
    }

    throw failed ();
  }
}
