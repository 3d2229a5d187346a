// file      : lfspkg/recipe.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/recipe.hxx>

#include <map>

#include <lfspkg/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace lfspkg
{
  const string toolchain_phase ("toolchain");

  const string build_step_function ("build_step");
  const string install_step_function ("install_step");

  optional<string>
  invalid_package_name (const string& n)
  {
    if (n.empty ())
      return string ("empty name");

    if (n.front () == '.')
      return string ("name starts with '.'");

    for (char c: n)
    {
      if (c == '/' || c == '\\' || c == ' ' || c == '\t' || c == '\n')
        return string ("name contains '") + c + "'";
    }

    return nullopt;
  }

  void
  validate_package_name (const string& n)
  {
    if (optional<string> e = invalid_package_name (n))
      fail << "invalid package name '" << n << "': " << *e;
  }

  namespace
  {
    struct variable
    {
      string value;
      location loc; // Empty for the default value.
    };

    using variables = std::map<string, variable>;

    // Descriptor parser.
    //
    // The accepted subset of the shell language is the variable assignment
    // (optionally exported) with unquoted, single-quoted, and double-quoted
    // value segments and the function definition, whose body is skipped.
    // References to the previously assigned variables are expanded; other
    // references, as well as the command substitutions within double
    // quotes, are preserved verbatim for the shell that runs the commands.
    //
    class parser
    {
    public:
      parser (const string& text, const path& name)
          : s_ (text), name_ (name) {}

      void
      parse (variables&, strings& functions);

      [[noreturn]] void
      bad (const location&, const string&) const;

      location
      loc () const {return location (name_, line_, column_);}

    private:
      bool
      eos () const {return i_ == s_.size ();}

      char
      peek () const {return i_ != s_.size () ? s_[i_] : '\0';}

      char
      get ()
      {
        char c (s_[i_++]);

        if (c == '\n')
        {
          ++line_;
          column_ = 1;
        }
        else
          ++column_;

        return c;
      }

      [[noreturn]] void
      bad (const string& d) const {bad (loc (), d);}

      // Skip spaces and tabs and, if requested, also newlines, statement
      // separators, and comments.
      //
      void
      skip_space (bool all);

      string
      identifier ();

      string
      value (const variables&);

      void
      expand (string&, const variables&);

      // Copy the balanced sequence starting with the opening character at
      // the current position.
      //
      void
      balanced (string&, char open, char close);

      void
      function_body ();

    private:
      const string& s_;
      const path& name_;

      size_t i_ = 0;
      uint64_t line_ = 1;
      uint64_t column_ = 1;
    };

    void parser::
    bad (const location& l, const string& d) const
    {
      error (l) << d;
      throw failed (failure::invalid_recipe);
    }

    static inline bool
    identifier_start (char c)
    {
      return alpha (c) || c == '_';
    }

    static inline bool
    identifier_char (char c)
    {
      return alnum (c) || c == '_';
    }

    void parser::
    skip_space (bool all)
    {
      for (char c; !eos (); )
      {
        c = peek ();

        if (c == ' ' || c == '\t' || c == '\r')
          get ();
        else if (all && (c == '\n' || c == ';'))
          get ();
        else if (all && c == '#')
        {
          while (!eos () && peek () != '\n')
            get ();
        }
        else if (c == '\\' && i_ + 1 != s_.size () && s_[i_ + 1] == '\n')
        {
          get ();
          get ();
        }
        else
          break;
      }
    }

    string parser::
    identifier ()
    {
      string r;
      while (!eos () && identifier_char (peek ()))
        r += get ();
      return r;
    }

    void parser::
    balanced (string& r, char open, char close)
    {
      location l (loc ());

      size_t depth (0);
      for (;;)
      {
        if (eos ())
          bad (l, string ("unterminated '") + open + "'");

        char c (get ());
        r += c;

        if (c == '\\' && !eos ())
          r += get ();
        else if (c == open)
          ++depth;
        else if (c == close && --depth == 0)
          break;
      }
    }

    void parser::
    expand (string& r, const variables& vars)
    {
      get (); // $

      char c (peek ());

      if (c == '{')
      {
        // ${NAME} is expanded, anything fancier (${NAME:-x}, etc) is kept.
        //
        size_t b (i_ + 1), e (b);
        while (e != s_.size () && identifier_char (s_[e]))
          ++e;

        if (e != b && e != s_.size () && s_[e] == '}')
        {
          string n (s_, b, e - b);
          auto i (vars.find (n));

          if (i != vars.end ())
          {
            while (i_ != e + 1)
              get ();

            r += i->second.value;
            return;
          }
        }

        r += '$';
        balanced (r, '{', '}');
      }
      else if (c == '(')
      {
        r += '$';
        balanced (r, '(', ')');
      }
      else if (identifier_start (c))
      {
        string n (identifier ());
        auto i (vars.find (n));

        if (i != vars.end ())
          r += i->second.value;
        else
        {
          r += '$';
          r += n;
        }
      }
      else
        r += '$';
    }

    string parser::
    value (const variables& vars)
    {
      string r;

      for (char c; !eos (); )
      {
        c = peek ();

        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';')
          break;

        switch (c)
        {
        case '\'':
          {
            location l (loc ());
            get ();

            for (;;)
            {
              if (eos ())
                bad (l, "unterminated single-quoted string");

              if ((c = get ()) == '\'')
                break;

              r += c;
            }

            break;
          }
        case '"':
          {
            location l (loc ());
            get ();

            for (;;)
            {
              if (eos ())
                bad (l, "unterminated double-quoted string");

              c = peek ();

              if (c == '"')
              {
                get ();
                break;
              }

              if (c == '$')
              {
                expand (r, vars);
                continue;
              }

              get ();

              if (c == '\\' && !eos ())
              {
                char n (get ());

                if (n == '\n')                       // Line continuation.
                  continue;

                if (n != '$' && n != '`' && n != '"' && n != '\\')
                  r += '\\';

                r += n;
              }
              else
                r += c;
            }

            break;
          }
        case '\\':
          {
            get ();

            if (eos ())
              bad ("unexpected end of file after '\\'");

            char n (get ());
            if (n != '\n')
              r += n;

            break;
          }
        case '$':
          {
            expand (r, vars);
            break;
          }
        case '`':
        case '(':
        case ')':
        case '|':
        case '&':
        case '<':
        case '>':
          {
            bad (string ("unexpected '") + c + "' in variable value" +
                 (c == '`' || c == '(' ? ", quote the value" : ""));
          }
        default:
          {
            r += get ();
            break;
          }
        }
      }

      return r;
    }

    void parser::
    function_body ()
    {
      skip_space (true);

      location l (loc ());

      if (peek () != '{')
        bad ("expected '{' to start function body");

      // Skip the body keeping track of the braces outside of the quoted
      // strings, expansions, comments, and here-documents.
      //
      size_t depth (0);
      bool word_start (true);

      // Pending here-document delimiters and whether leading tabs are
      // stripped (<<-). Their bodies start on the next line.
      //
      vector<pair<string, bool>> here_docs;

      for (;;)
      {
        if (eos ())
          bad (l, "unterminated function body");

        char c (get ());

        switch (c)
        {
        case '{': ++depth; break;
        case '}':
          {
            if (--depth == 0)
              return;

            break;
          }
        case '\\':
          {
            if (!eos ())
              get ();

            break;
          }
        case '\'':
          {
            while (!eos () && get () != '\'') ;
            break;
          }
        case '"':
          {
            for (char n; !eos () && (n = get ()) != '"'; )
            {
              if (n == '\\' && !eos ())
                get ();
            }

            break;
          }
        case '#':
          {
            if (word_start)
            {
              while (!eos () && peek () != '\n')
                get ();
            }

            break;
          }
        case '$':
          {
            // ${...}, $(...), and $((...)) may contain unbalanced braces
            // as well as '#' and '<<' that mean something else there.
            //
            string e;
            if (peek () == '{')
              balanced (e, '{', '}');
            else if (peek () == '(')
              balanced (e, '(', ')');

            break;
          }
        case '<':
          {
            if (peek () != '<')
              break;

            get ();

            if (peek () == '<') // Here-string.
            {
              get ();
              break;
            }

            bool strip (peek () == '-');
            if (strip)
              get ();

            while (peek () == ' ' || peek () == '\t')
              get ();

            location dl (loc ());

            // The delimiter word with quotes removed.
            //
            string d;
            for (char q ('\0'); !eos (); )
            {
              char n (peek ());

              if (q != '\0')
              {
                get ();

                if (n == q)
                  q = '\0';
                else
                  d += n;
              }
              else if (n == '\'' || n == '"')
                q = get ();
              else if (n == '\\')
              {
                get ();
                if (!eos ())
                  d += get ();
              }
              else if (n == ' '  || n == '\t' || n == '\n' || n == ';' ||
                       n == '&'  || n == '|'  || n == '<'  || n == '>' ||
                       n == ')')
                break;
              else
                d += get ();
            }

            if (d.empty ())
              bad (dl, "expected here-document delimiter after '<<'");

            here_docs.emplace_back (move (d), strip);
            break;
          }
        case '\n':
          {
            for (const pair<string, bool>& h: here_docs)
            {
              for (;;)
              {
                if (eos ())
                  bad (l, "unterminated here-document '" + h.first + "'");

                string s;
                while (!eos () && peek () != '\n')
                  s += get ();

                if (!eos ())
                  get ();

                if (h.second)
                  s.erase (0, s.find_first_not_of ('\t'));

                if (s == h.first)
                  break;
              }
            }

            here_docs.clear ();
            break;
          }
        }

        word_start = (c == ' ' || c == '\t' || c == '\n' || c == ';' ||
                      c == '{' || c == '}' || c == '(' || c == ')');
      }
    }

    void parser::
    parse (variables& vars, strings& fs)
    {
      for (;;)
      {
        skip_space (true);

        if (eos ())
          break;

        location l (loc ());

        if (!identifier_start (peek ()))
          bad ("expected variable assignment or function definition");

        string w (identifier ());

        // export NAME=value
        //
        if (w == "export" && (peek () == ' ' || peek () == '\t'))
        {
          skip_space (false);

          l = loc ();

          if (!identifier_start (peek ()))
            bad ("expected variable name after 'export'");

          w = identifier ();

          if (peek () != '=')
            bad ("expected '=' after variable name '" + w + "'");
        }

        // function NAME [()] { ... }
        //
        if (w == "function" && (peek () == ' ' || peek () == '\t'))
        {
          skip_space (false);

          l = loc ();
          w = identifier ();

          if (w.empty ())
            bad ("expected function name after 'function'");

          skip_space (false);

          if (peek () == '(')
          {
            get ();
            skip_space (false);

            if (peek () != ')')
              bad ("expected ')' after '('");

            get ();
          }

          function_body ();
          fs.push_back (move (w));
          continue;
        }

        if (peek () == '=')
        {
          get ();

          string v (value (vars));
          vars[w] = variable {move (v), move (l)};

          // Only whitespaces, comments, and statement separators may follow
          // the value. Otherwise, this is a command with the variable in its
          // environment which we don't support.
          //
          skip_space (false);

          char c (peek ());
          if (!eos () && c != '\n' && c != ';' && c != '#')
          {
            // Another assignment on the same line is fine.
            //
            size_t b (i_), e (b);
            while (e != s_.size () && identifier_char (s_[e]))
              ++e;

            if (e == b || e == s_.size () || s_[e] != '=' ||
                !identifier_start (s_[b]))
              bad ("unexpected command after assignment of '" + w + "'");
          }

          continue;
        }

        // NAME () { ... }
        //
        skip_space (false);

        if (peek () == '(')
        {
          get ();
          skip_space (false);

          if (peek () != ')')
            bad ("expected ')' after '('");

          get ();

          function_body ();
          fs.push_back (move (w));
          continue;
        }

        bad (l, "expected '=' or '()' after '" + w + "'");
      }
    }
  }

  recipe
  parse_recipe (istream& is, const path& name)
  {
    tracer trace ("parse_recipe");

    string text;
    try
    {
      text.assign (istreambuf_iterator<char> (is),
                   istreambuf_iterator<char> ());

      if (is.bad ())
        throw io_error ("read failure");
    }
    catch (const io_error& e)
    {
      error << "unable to read recipe " << name << ": " << e;
      throw failed (failure::invalid_recipe);
    }

    // Pre-seed the variables with the defaults so that they can be
    // referenced and overridden by the descriptor.
    //
    variables vars {
      {"NAME",             variable {"",            location ()}},
      {"VERSION",          variable {"",            location ()}},
      {"CATEGORY",         variable {"",            location ()}},
      {"PHASE",            variable {"",            location ()}},
      {"PKGNAME",          variable {"",            location ()}},
      {"SOURCE",           variable {"",            location ()}},
      {"PATCHES",          variable {"",            location ()}},
      {"DEPENDS",          variable {"",            location ()}},
      {"WORKDIR_SUBDIR",   variable {"",            location ()}},
      {"CONFIGURE",        variable {"./configure", location ()}},
      {"CONFIGURE_ARGS",   variable {"",            location ()}},
      {"MAKE",             variable {"make",        location ()}},
      {"MAKE_ARGS",        variable {"",            location ()}},
      {"INSTALL_ARGS",     variable {"install",     location ()}},
      {"STRIP_BINARIES",   variable {"no",          location ()}},
      {"POST_REMOVE_HOOK", variable {"",            location ()}},
      {"SHA256",           variable {"",            location ()}}};

    strings fs;

    parser p (text, name);
    p.parse (vars, fs);

    auto var = [&vars] (const char* n) -> const variable&
    {
      return vars.find (n)->second;
    };

    // Use the assignment location if present and the file otherwise.
    //
    auto bad = [&p, &name] (const variable& v, const string& d)
    {
      p.bad (v.loc.empty () ? location (name, 0, 0) : v.loc, d);
    };

    // Split the whitespace-separated list.
    //
    auto split = [] (string s)
    {
      replace (s.begin (), s.end (), '\n', ' ');

      strings r;
      for (size_t b (0), e (0); next_word (s, b, e, ' ', '\t') != 0; )
        r.push_back (string (s, b, e - b));
      return r;
    };

    recipe r;
    r.file = name;

    // Name and version.
    //
    {
      const variable& n (var ("NAME"));
      const variable& v (var ("VERSION"));

      if (n.value.empty ())
        bad (n, "package name (NAME) is not specified");

      if (v.value.empty ())
        bad (v, "package version (VERSION) is not specified");

      if (optional<string> e = invalid_package_name (n.value))
        bad (n, "invalid package name '" + n.value + "': " + *e);

      if (v.value.find_first_of (" \t\n/") != string::npos)
        bad (v, "invalid package version '" + v.value + "'");

      r.name = n.value;
      r.version = v.value;
    }

    r.category = var ("CATEGORY").value;
    r.phase = var ("PHASE").value;

    {
      const variable& a (var ("PKGNAME"));

      if (!a.value.empty ())
      {
        if (optional<string> e = invalid_package_name (a.value))
          bad (a, "invalid artifact name '" + a.value + "': " + *e);
      }

      r.artifact_id = a.value.empty () ? r.name : a.value;
    }

    r.source = var ("SOURCE").value;
    r.patches = split (var ("PATCHES").value);

    {
      const variable& d (var ("DEPENDS"));

      for (string& n: split (d.value))
      {
        if (optional<string> e = invalid_package_name (n))
          bad (d, "invalid dependency name '" + n + "': " + *e);

        if (find (r.depends.begin (), r.depends.end (), n) == r.depends.end ())
          r.depends.push_back (move (n));
      }
    }

    {
      const variable& d (var ("WORKDIR_SUBDIR"));

      if (!d.value.empty ())
      try
      {
        dir_path sd (d.value);

        if (sd.absolute () || !sd.normalized (false) ||
            *sd.begin () == "..")
          bad (d, "invalid source subdirectory '" + d.value + "'");

        r.subdir = move (sd);
      }
      catch (const invalid_path&)
      {
        bad (d, "invalid source subdirectory '" + d.value + "'");
      }
    }

    r.configure      = var ("CONFIGURE").value;
    r.configure_args = var ("CONFIGURE_ARGS").value;
    r.make           = var ("MAKE").value;
    r.make_args      = var ("MAKE_ARGS").value;
    r.install_args   = var ("INSTALL_ARGS").value;

    {
      const variable& s (var ("STRIP_BINARIES"));
      const string& v (s.value);

      if (v == "yes" || v == "true" || v == "1")
        r.strip_binaries = true;
      else if (v == "no" || v == "false" || v == "0" || v.empty ())
        r.strip_binaries = false;
      else
        bad (s, "invalid STRIP_BINARIES value '" + v + "': expected 'yes' "
             "or 'no'");
    }

    {
      const variable& h (var ("POST_REMOVE_HOOK"));

      if (!h.value.empty ())
      try
      {
        path f (h.value);

        if (f.relative ())
          f = r.directory () / f;

        f.normalize ();
        r.post_remove_hook = move (f);
      }
      catch (const invalid_path&)
      {
        bad (h, "invalid post-removal hook path '" + h.value + "'");
      }
    }

    {
      const variable& c (var ("SHA256"));

      if (!c.value.empty ())
      {
        string v (c.value);
        transform (v.begin (), v.end (), v.begin (),
                   [] (char x) {return lcase (x);});

        if (v.size () != 64 ||
            find_if (v.begin (), v.end (),
                     [] (char x) {return !xdigit (x);}) != v.end ())
          bad (c, "invalid SHA256 checksum '" + c.value + "'");

        r.sha256 = move (v);
      }
    }

    for (const string& f: fs)
    {
      if (f == build_step_function)
        r.custom_build = true;
      else if (f == install_step_function)
        r.custom_install = true;
      else
        l5 ([&]{trace << "helper function " << f << " in " << name;});
    }

    l4 ([&]{trace << r.name << ' ' << r.version << " ("
                  << r.package_id () << ") from " << name;});

    return r;
  }

  recipe
  load_recipe (const path& f)
  {
    path n (normalize (f, "recipe"));

    try
    {
      ifdstream is (n);
      recipe r (parse_recipe (is, n));
      is.close ();
      return r;
    }
    catch (const io_error& e)
    {
      error << "unable to read recipe " << n << ": " << e;
      throw failed (failure::invalid_recipe);
    }
  }
}
