// file      : lfspkg/state.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/state.hxx>

#include <libbutl/manifest-parser.hxx>
#include <libbutl/manifest-serializer.hxx>

#include <lfspkg/recipe.hxx> // invalid_package_name()
#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  // Write the file into a temporary file beside it and then move it over
  // the target.
  //
  template <typename F>
  static void
  write_file (const path& f, const F& write)
  {
    dir_path d (f.directory ());
    if (!exists (d))
      mk_p (d);

    path t (f + ".tmp");
    auto_rmfile rm (t);

    try
    {
      ofdstream os (t);
      write (os);
      os.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << t << ": " << e;
    }

    mv (t, f);
    rm.cancel ();
  }

  state_store::
  state_store (dir_path d)
      : dir_ (move (d))
  {
  }

  path state_store::
  file (const string& n, const char* ext) const
  {
    assert (!invalid_package_name (n));
    return dir_ / path (n + ext);
  }

  optional<vector<pair<string, string>>> state_store::
  read_metadata (const path& f) const
  {
    if (!exists (f))
      return nullopt;

    vector<pair<string, string>> r;

    try
    {
      ifdstream is (f);
      manifest_parser p (is, f.string ());

      manifest_name_value nv (p.next ());

      if (!nv.name.empty () || nv.value != "1")
        throw manifest_parsing (p.name (), nv.value_line, nv.value_column,
                                "unsupported format version");

      for (nv = p.next (); !nv.empty (); nv = p.next ())
        r.emplace_back (move (nv.name), move (nv.value));

      is.close ();
    }
    catch (const manifest_parsing& e)
    {
      fail (location (path (e.name), e.line, e.column)) << e.description;
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }

    return r;
  }

  optional<strings> state_store::
  read_lines (const path& f) const
  {
    if (!exists (f))
      return nullopt;

    strings r;

    try
    {
      ifdstream is (f, fdopen_mode::in, ifdstream::badbit);

      for (string l; !eof (getline (is, l)); )
      {
        if (!l.empty ())
          r.push_back (move (l));
      }

      is.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }

    return r;
  }

  vector<pair<string, string>> state_store::
  metadata (const string& n) const
  {
    optional<vector<pair<string, string>>> r (
      read_metadata (file (n, ".meta")));

    return r ? move (*r) : vector<pair<string, string>> ();
  }

  optional<string> state_store::
  get (const string& n, const string& k) const
  {
    for (auto& kv: metadata (n))
    {
      if (kv.first == k)
        return move (kv.second);
    }

    return nullopt;
  }

  void state_store::
  set (const string& n, const string& k, const string& v)
  {
    tracer trace ("state_store::set");

    path f (file (n, ".meta"));
    vector<pair<string, string>> kvs (metadata (n));

    auto i (find_if (kvs.begin (), kvs.end (),
                     [&k] (const pair<string, string>& kv)
                     {
                       return kv.first == k;
                     }));

    if (i != kvs.end ())
      i->second = v;
    else
      kvs.emplace_back (k, v);

    l5 ([&]{trace << n << ": " << k << ": " << v;});

    write_file (f,
                [&f, &kvs] (ostream& os)
                {
                  try
                  {
                    manifest_serializer s (os, f.string ());

                    s.next ("", "1"); // Start of manifest.

                    for (const pair<string, string>& kv: kvs)
                      s.next (kv.first, kv.second);

                    s.next ("", ""); // End of manifest.
                  }
                  catch (const manifest_serialization& e)
                  {
                    fail << "unable to serialize " << f << ": "
                         << e.description;
                  }
                });
  }

  void state_store::
  mark_installed (const string& n, const string& a)
  {
    set (n, "artifact", a);

    write_file (file (n, ".installed"),
                [] (ostream& os)
                {
                  to_stream (os,
                             timestamp::clock::now (),
                             "%Y-%m-%dT%H:%M:%S",
                             false /* special */,
                             true  /* local */);
                  os << '\n';
                });
  }

  void state_store::
  mark_uninstalled (const string& n)
  {
    for (const char* e: {".installed", ".files"})
    {
      path f (file (n, e));

      if (exists (f))
        rm (f);
    }
  }

  bool state_store::
  installed (const string& n) const
  {
    return exists (file (n, ".installed"));
  }

  optional<string> state_store::
  installed_time (const string& n) const
  {
    optional<strings> ls (read_lines (file (n, ".installed")));

    if (!ls)
      return nullopt;

    return ls->empty () ? string () : move (ls->front ());
  }

  strings state_store::
  list_installed () const
  {
    strings r;

    if (!exists (dir_))
      return r;

    for (const path& p: dir_entries (dir_))
    {
      if (p.extension () == "installed")
        r.push_back (p.base ().string ());
    }

    sort (r.begin (), r.end ());
    return r;
  }

  optional<strings> state_store::
  manifest (const string& n) const
  {
    return read_lines (file (n, ".files"));
  }

  void state_store::
  manifest (const string& n, const strings& ps)
  {
    write_file (file (n, ".files"),
                [&ps] (ostream& os)
                {
                  for (const string& p: ps)
                    os << p << '\n';
                });
  }

  optional<strings> state_store::
  staged_manifest (const string& n) const
  {
    return read_lines (file (n, ".files.staged"));
  }

  void state_store::
  staged_manifest (const string& n, const strings& ps)
  {
    write_file (file (n, ".files.staged"),
                [&ps] (ostream& os)
                {
                  for (const string& p: ps)
                    os << p << '\n';
                });
  }
}
