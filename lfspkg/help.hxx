// file      : lfspkg/help.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_HELP_HXX
#define LFSPKG_HELP_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/help-options.hxx>

namespace lfspkg
{
  using usage_function = cli::usage_para (ostream&, cli::usage_para);

  // If the usage function is NULL, then the topic is either empty (general
  // help) or is not a command.
  //
  int
  help (const help_options&, const string& topic, usage_function* usage);
}

#endif // LFSPKG_HELP_HXX
