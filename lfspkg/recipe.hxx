// file      : lfspkg/recipe.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_RECIPE_HXX
#define LFSPKG_RECIPE_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

namespace lfspkg
{
  // The phase value that marks bootstrap builds. Such builds stop after the
  // staged installation and are never packaged or deployed.
  //
  extern const string toolchain_phase;

  // Names of the custom routines a recipe may define to override the
  // generic configure/make and install steps.
  //
  extern const string build_step_function;   // build_step
  extern const string install_step_function; // install_step

  // Package build recipe.
  //
  // A recipe descriptor is a shell-style file consisting of variable
  // assignments and, optionally, the build_step() and install_step()
  // routines, for example:
  //
  // NAME=zlib
  // VERSION=1.3.1
  // CATEGORY=base
  // SOURCE="https://zlib.net/zlib-$VERSION.tar.xz"
  // DEPENDS="glibc"
  // CONFIGURE_ARGS="--prefix=/usr"
  //
  // The descriptor is parsed, not executed. The routines are only detected
  // here and are later run by the shell with the descriptor sourced.
  //
  class recipe
  {
  public:
    path file; // Descriptor, absolute and normalized.

    string name;
    string version;
    string category;
    string phase;

    // Name of the staged output variant. Equals the name unless PKGNAME is
    // specified.
    //
    string artifact_id;

    string source; // Source archive file name or URL.
    strings patches;
    strings depends; // Unique, in the declaration order.

    // Source root relative to the working directory, if specified.
    //
    optional<dir_path> subdir;

    string configure;      // Empty if the configure step is skipped.
    string configure_args;
    string make;
    string make_args;
    string install_args;

    bool strip_binaries = false;

    optional<path> post_remove_hook; // Absolute.
    optional<string> sha256;         // Lower-case hex.

    bool custom_build = false;
    bool custom_install = false;

    bool
    toolchain () const {return phase == toolchain_phase;}

    // The <artifact>-<version> id used for the working directory, the build
    // log, and the package archive names.
    //
    string
    package_id () const {return artifact_id + '-' + version;}

    // The recipe directory (relative patch paths are resolved against it).
    //
    dir_path
    directory () const {return file.directory ();}
  };

  using recipes = vector<recipe>;

  // Parse the recipe from a stream. The name is used in diagnostics and to
  // complete the relative hook path. Issue diagnostics and throw
  // failed(failure::invalid_recipe) if the descriptor is malformed or the
  // name or version is missing.
  //
  recipe
  parse_recipe (istream&, const path& name);

  // Read and parse the recipe descriptor file.
  //
  recipe
  load_recipe (const path&);

  // Return the description of why the string cannot be used as a package
  // name or nullopt if it can. Package names are used as state store file
  // names.
  //
  optional<string>
  invalid_package_name (const string&);

  // Verify the package name specified on the command line.
  //
  void
  validate_package_name (const string&);
}

#endif // LFSPKG_RECIPE_HXX
