// file      : lfspkg/state.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/state.hxx>

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace lfspkg
{
  static int
  main (int, char*[])
  {
    verb = 0;

    dir_path d (dir_path::temp_directory () /
                dir_path ("lfspkg-state-" +
                          std::to_string (process::current_id ())));

    if (exists (d))
      rm_r (d);

    auto_rmdir rm (d);

    // The directory is created on the first write.
    //
    state_store st (d);

    assert (st.list_installed ().empty ());
    assert (!st.installed ("zlib"));
    assert (!st.installed_time ("zlib"));
    assert (!st.get ("zlib", "version"));
    assert (st.metadata ("zlib").empty ());
    assert (!st.manifest ("zlib"));
    assert (!st.staged_manifest ("zlib"));

    // Metadata keeps the insertion order and replaces the existing values.
    //
    st.set ("zlib", "version", "1.3");
    st.set ("zlib", "category", "libs");
    st.set ("zlib", "post-remove-hook", "");
    st.set ("zlib", "version", "1.3.1");

    assert (exists (d));
    assert (*st.get ("zlib", "version") == "1.3.1");
    assert (*st.get ("zlib", "category") == "libs");
    assert (*st.get ("zlib", "post-remove-hook") == "");
    assert (!st.get ("zlib", "phase"));

    {
      vector<pair<string, string>> m (st.metadata ("zlib"));

      assert (m.size () == 3);
      assert (m[0].first == "version"  && m[0].second == "1.3.1");
      assert (m[1].first == "category" && m[1].second == "libs");
      assert (m[2].first == "post-remove-hook" && m[2].second.empty ());
    }

    // Values with spaces and colons survive the round trip.
    //
    st.set ("zlib", "note", "built: with -O2");
    assert (*st.get ("zlib", "note") == "built: with -O2");

    // Metadata alone doesn't make the package installed.
    //
    assert (!st.installed ("zlib"));

    st.mark_installed ("zlib", "zlib");
    st.mark_installed ("bash", "bash");
    st.mark_installed ("acl", "acl-static");

    assert (st.installed ("zlib"));
    assert (*st.get ("acl", "artifact") == "acl-static");
    assert ((st.list_installed () == strings {"acl", "bash", "zlib"}));

    {
      optional<string> t (st.installed_time ("zlib"));

      // YYYY-MM-DDTHH:MM:SS
      //
      assert (t && t->size () == 19 && (*t)[10] == 'T');
    }

    // Manifests.
    //
    strings fs {"/usr", "/usr/lib", "/usr/lib/libz.so.1.3.1",
                "/usr/lib/libz.so"};

    strings ss {"/usr", "/usr/include", "/usr/include/zlib.h", "/usr/lib",
                "/usr/lib/libz.so", "/usr/lib/libz.so.1.3.1"};

    st.manifest ("zlib", fs);
    st.staged_manifest ("zlib", ss);

    assert (*st.manifest ("zlib") == fs);
    assert (*st.staged_manifest ("zlib") == ss);

    st.manifest ("zlib", strings ());
    assert (st.manifest ("zlib") && st.manifest ("zlib")->empty ());

    st.manifest ("zlib", fs);

    // Uninstalling clears the marker and the manifest but keeps the
    // metadata and the staged manifest.
    //
    st.mark_uninstalled ("zlib");

    assert (!st.installed ("zlib"));
    assert (!st.installed_time ("zlib"));
    assert (!st.manifest ("zlib"));
    assert (*st.staged_manifest ("zlib") == ss);
    assert (*st.get ("zlib", "version") == "1.3.1");
    assert ((st.list_installed () == strings {"acl", "bash"}));

    // Uninstalling twice is harmless.
    //
    st.mark_uninstalled ("zlib");
    assert (!st.installed ("zlib"));

    // The store can be reopened.
    //
    {
      state_store s (d);
      assert ((s.list_installed () == strings {"acl", "bash"}));
      assert (*s.get ("acl", "artifact") == "acl-static");
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return lfspkg::main (argc, argv);
}
