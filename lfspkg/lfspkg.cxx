// file      : lfspkg/lfspkg.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef _WIN32
#  include <signal.h> // signal()
#endif

#include <cerrno>     // errno
#include <cstring>    // strcmp()
#include <iostream>

#include <libbutl/version.hxx> // LIBBUTL_VERSION_ID

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/diagnostics.hxx>
#include <lfspkg/lfspkg-options.hxx>

// Commands.
//
#include <lfspkg/help.hxx>

#include <lfspkg/pkg-build.hxx>
#include <lfspkg/pkg-info.hxx>
#include <lfspkg/pkg-list.hxx>
#include <lfspkg/pkg-rebuild.hxx>
#include <lfspkg/pkg-remove.hxx>
#include <lfspkg/pkg-status.hxx>

using namespace std;
using namespace butl;
using namespace lfspkg;

namespace lfspkg
{
  int
  main (int argc, char* argv[]);
}

// Initialize the command option class O with the common options and then
// parse the rest of the command line placing non-option arguments to args.
// Once this is done, use the "final" values of the common options to do
// global initializations (verbosity level, etc).
//
template <typename O>
static O
init (const common_options& co, cli::scanner& scan, strings& args)
{
  O o;
  static_cast<common_options&> (o) = co;

  // We want to be able to specify options and arguments in any order (it is
  // really handy to just add -v at the end of the command line).
  //
  for (bool opt (true); scan.more (); )
  {
    if (opt)
    {
      // Parse the next chunk of options until we reach an argument (or eos).
      //
      if (o.parse (scan) && !scan.more ())
        break;

      // If we see first "--", then we are done parsing options.
      //
      if (strcmp (scan.peek (), "--") == 0)
      {
        scan.next ();
        opt = false;
        continue;
      }

      // Fall through.
    }

    args.push_back (scan.next ());
  }

  // Global initializations.
  //

  // Diagnostics verbosity.
  //
  verb = o.verbose_specified ()
    ? o.verbose ()
    : o.V () ? 3 : o.v () ? 2 : o.quiet () ? 0 : 1;

  return o;
}

int lfspkg::
main (int argc, char* argv[])
try
{
  using namespace cli;

  // Ignore SIGPIPE which may otherwise terminate us while writing to a pipe
  // whose reading end (pager, tar) has gone.
  //
#ifndef _WIN32
  if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
    fail << "unable to ignore broken pipe (SIGPIPE) signal: "
         << system_error (errno, generic_category ()); // Sanitize.
#endif

  argv_file_scanner scan (argc, argv, "--options-file");

  // First parse common options and --version/--help.
  //
  options o;
  o.parse (scan, unknown_mode::stop);

  if (o.version ())
  {
    cout << "lfspkg " << LFSPKG_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "Copyright (c) " << LFSPKG_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  strings argsv; // To be filled by init() above.
  vector_scanner args (argsv);

  const common_options& co (o);

  if (o.help ())
    return help (init<help_options> (co, scan, argsv), "", nullptr);

  // The next argument should be a command.
  //
  if (!scan.more ())
    fail << "lfspkg command expected" <<
      info << "run 'lfspkg help' for more information";

  int cmd_argc (2);
  char* cmd_argv[] {argv[0], const_cast<char*> (scan.next ())};
  commands cmd;
  cmd.parse (cmd_argc, cmd_argv, true, unknown_mode::stop);

  if (cmd_argc != 1)
    fail << "unknown lfspkg command/option '" << cmd_argv[1] << "'" <<
      info << "run 'lfspkg help' for more information";

  // If the command is 'help', then what's coming next is another
  // command. Parse it into cmd so that we only need to check for
  // each command in one place.
  //
  bool h (cmd.help ());
  help_options ho;

  if (h)
  {
    ho = init<help_options> (co, scan, argsv);

    if (args.more ())
    {
      cmd_argc = 2;
      cmd_argv[1] = const_cast<char*> (args.next ());

      // First see if this is a command.
      //
      cmd = commands (); // Clear the help option.
      cmd.parse (cmd_argc, cmd_argv, true, unknown_mode::stop);

      // If not, then it got to be a help topic.
      //
      if (cmd_argc != 1)
        return help (ho, cmd_argv[1], nullptr);
    }
    else
      return help (ho, "", nullptr);
  }

  // Handle commands.
  //
  int r (1);
  for (;;) // Breakout loop.
  try
  {
    // help
    //
    if (cmd.help ())
    {
      assert (h);
      r = help (ho, "help", print_lfspkg_help_usage);
      break;
    }

    // Commands.
    //
    // if (cmd.build ())
    // {
    //   if (h)
    //     r = help (ho, "build", print_lfspkg_build_usage);
    //   else
    //     r = pkg_build (init<pkg_build_options> (co, scan, argsv), args);
    //
    //  break;
    // }
    //
#define COMMAND_IMPL(CMD, NAME, FUNC, OPTS, USAGE)                     \
    if (cmd.CMD ())                                                    \
    {                                                                  \
      if (h)                                                           \
        r = help (ho, NAME, print_lfspkg_##USAGE##_usage);             \
      else                                                             \
        r = FUNC (init<OPTS> (co, scan, argsv), args);                 \
                                                                       \
      break;                                                           \
    }

#define PKG_COMMAND(CMD, NAME, FUNC)                                   \
    COMMAND_IMPL(CMD, NAME, pkg_##FUNC, pkg_##FUNC##_options, CMD)

    PKG_COMMAND (build,  "build",  build);
    PKG_COMMAND (remove, "remove", remove);
    PKG_COMMAND (info,   "info",   info);
    PKG_COMMAND (list,   "list",   list);
    PKG_COMMAND (status, "status", status);

    COMMAND_IMPL (is_installed,
                  "is-installed",
                  pkg_status,
                  pkg_status_options,
                  status);

    COMMAND_IMPL (rebuild_all,
                  "rebuild-all",
                  pkg_rebuild,
                  pkg_rebuild_options,
                  rebuild_all);

    assert (false);
    fail << "unhandled command";
  }
  catch (const failed& e)
  {
    r = e.code;
    break;
  }

  if (r != 0)
    return r;

  // Warn if args contain some leftover junk. We already successfully
  // performed the command so failing would probably be misleading.
  //
  if (args.more ())
  {
    diag_record dr;
    dr << warn << "ignoring unexpected argument(s)";
    while (args.more ())
      dr << " '" << args.next () << "'";
  }

  return 0;
}
catch (const failed& e)
{
  return e.code; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return lfspkg::main (argc, argv);
}
