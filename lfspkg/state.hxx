// file      : lfspkg/state.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LFSPKG_STATE_HXX
#define LFSPKG_STATE_HXX

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

namespace lfspkg
{
  // Package state store.
  //
  // Keeps one record per package (logical) name in the state directory:
  //
  // <name>.meta         -- key/value metadata (manifest format)
  // <name>.installed    -- install marker containing the installation time
  // <name>.files        -- paths deployed into the target root
  // <name>.files.staged -- paths of the last staged installation
  //
  // Every file is written into a temporary file first and then moved over
  // the target so a partially written file is never visible.
  //
  // The manifest paths are absolute target paths, that is, relative to the
  // target root and with the leading directory separator, one per line.
  //
  // Note that mark_uninstalled() removes the install marker and the target
  // manifest but retains the metadata and the staged manifest so that the
  // last build can still be inspected.
  //
  class state_store
  {
  public:
    explicit
    state_store (dir_path);

    const dir_path&
    directory () const {return dir_;}

    optional<string>
    get (const string& name, const string& key) const;

    // Replace the value if the key is already present and append it
    // otherwise.
    //
    void
    set (const string& name, const string& key, const string& value);

    // Return all the key/value pairs in the order they were first set.
    //
    vector<pair<string, string>>
    metadata (const string& name) const;

    void
    mark_installed (const string& name, const string& artifact_id);

    void
    mark_uninstalled (const string& name);

    bool
    installed (const string& name) const;

    // Return the installation time as recorded or nullopt if the package is
    // not installed.
    //
    optional<string>
    installed_time (const string& name) const;

    // Sorted.
    //
    strings
    list_installed () const;

    // Target and staged manifests. Return nullopt if there is no manifest.
    //
    optional<strings>
    manifest (const string& name) const;

    void
    manifest (const string& name, const strings&);

    optional<strings>
    staged_manifest (const string& name) const;

    void
    staged_manifest (const string& name, const strings&);

  private:
    path
    file (const string& name, const char* ext) const;

    optional<vector<pair<string, string>>>
    read_metadata (const path&) const;

    optional<strings>
    read_lines (const path&) const;

  private:
    dir_path dir_;
  };
}

#endif // LFSPKG_STATE_HXX
