// file      : lfspkg/recipe.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <lfspkg/recipe.hxx>

#include <sstream>

#include <lfspkg/types.hxx>
#include <lfspkg/utility.hxx>

#include <lfspkg/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace lfspkg
{
  static recipe
  parse (const string& s)
  {
    istringstream is (s);
    return parse_recipe (is, path ("/recipes/test.recipe"));
  }

  // Return the failure code or 0 if parsed successfully.
  //
  static int
  parse_error (const string& s)
  {
    try
    {
      parse (s);
      return 0;
    }
    catch (const failed& e)
    {
      return e.code;
    }
  }

  static const int invalid (static_cast<int> (failure::invalid_recipe));

  static int
  main (int, char*[])
  {
    verb = 0;

    // Defaults.
    //
    {
      recipe r (parse ("NAME=zlib\n"
                       "VERSION=1.3.1\n"));

      assert (r.name == "zlib" && r.version == "1.3.1");
      assert (r.artifact_id == "zlib");
      assert (r.package_id () == "zlib-1.3.1");
      assert (r.category.empty () && r.phase.empty () && !r.toolchain ());
      assert (r.source.empty ());
      assert (r.patches.empty () && r.depends.empty ());
      assert (!r.subdir);
      assert (r.configure == "./configure");
      assert (r.make == "make");
      assert (r.install_args == "install");
      assert (!r.strip_binaries);
      assert (!r.post_remove_hook && !r.sha256);
      assert (!r.custom_build && !r.custom_install);
      assert (r.directory () == dir_path ("/recipes"));
    }

    // Artifact id override.
    //
    {
      recipe r (parse ("NAME=gcc\n"
                       "VERSION=13.2.0\n"
                       "PKGNAME=gcc-pass1\n"
                       "PHASE=toolchain\n"));

      assert (r.name == "gcc");
      assert (r.artifact_id == "gcc-pass1");
      assert (r.package_id () == "gcc-pass1-13.2.0");
      assert (r.toolchain ());
    }

    // Missing name or version.
    //
    assert (parse_error ("VERSION=1.0\n") == invalid);
    assert (parse_error ("NAME=foo\n") == invalid);
    assert (parse_error ("NAME=\nVERSION=1.0\n") == invalid);
    assert (parse_error ("") == invalid);

    // Quoting, expansion, and continuation.
    //
    {
      recipe r (parse (
        "# Comment.\n"
        "export NAME=bash\n"
        "VERSION='5.2.21'\n"
        "SOURCE=\"https://ftp.gnu.org/gnu/$NAME/$NAME-${VERSION}.tar.gz\"\n"
        "PREFIX=/usr; CONFIGURE_ARGS=\"--prefix=$PREFIX \\\n"
        "  --without-bash-malloc\"\n"
        "MAKE_ARGS='-j$(nproc)'\n"
        "INSTALL_ARGS=\"install DESTDIR=\\$DESTDIR $UNKNOWN\"\n"
        "CATEGORY=base DEPENDS=\"ncurses readline ncurses\"\n"));

      assert (r.name == "bash" && r.version == "5.2.21");
      assert (r.source == "https://ftp.gnu.org/gnu/bash/bash-5.2.21.tar.gz");
      assert (r.configure_args == "--prefix=/usr   --without-bash-malloc");
      assert (r.make_args == "-j$(nproc)");
      assert (r.install_args == "install DESTDIR=$DESTDIR $UNKNOWN");
      assert (r.category == "base");
      assert ((r.depends == strings {"ncurses", "readline"}));
    }

    // Lists, flags, and paths.
    //
    {
      recipe r (parse (
        "NAME=coreutils\n"
        "VERSION=9.4\n"
        "PATCHES=\"coreutils-9.4-i18n.patch\n"
        "         /abs/fix.patch\"\n"
        "WORKDIR_SUBDIR=coreutils-9.4/src\n"
        "CONFIGURE=\n"
        "STRIP_BINARIES=yes\n"
        "POST_REMOVE_HOOK=hooks/ldconfig.sh\n"
        "SHA256=ABCDEF0123456789abcdef0123456789"
        "ABCDEF0123456789abcdef0123456789\n"));

      assert ((r.patches == strings {"coreutils-9.4-i18n.patch",
                                     "/abs/fix.patch"}));
      assert (r.subdir && *r.subdir == dir_path ("coreutils-9.4/src"));
      assert (r.configure.empty ());
      assert (r.strip_binaries);
      assert (r.post_remove_hook &&
              *r.post_remove_hook == path ("/recipes/hooks/ldconfig.sh"));
      assert (r.sha256 && *r.sha256 == "abcdef0123456789abcdef0123456789"
                                       "abcdef0123456789abcdef0123456789");
    }

    // Custom routines are detected but not executed.
    //
    {
      recipe r (parse (
        "NAME=glibc\n"
        "VERSION=2.39\n"
        "build_step () {\n"
        "  mkdir -v build && cd build\n"
        "  case $(uname -m) in\n"
        "    x86_64) echo '}' ;;\n"
        "  esac\n"
        "  ../configure --prefix=/usr # { unbalanced in a comment\n"
        "}\n"
        "function install_step {\n"
        "  make DESTDIR=\"$DESTDIR\" install \"}\"\n"
        "}\n"
        "helper() { :; }\n"));

      assert (r.custom_build && r.custom_install);
    }

    {
      recipe r (parse ("NAME=m4\n"
                       "VERSION=1.4.19\n"
                       "function build_step () { make; }\n"));

      assert (r.custom_build && !r.custom_install);
    }

    // Here-documents and parameter expansions in custom routines.
    //
    {
      recipe r (parse (
        "NAME=dbus\n"
        "VERSION=1.14.10\n"
        "build_step () {\n"
        "  cat > config.site <<EOF\n"
        "it's { not a brace # nor a comment\n"
        "EOF\n"
        "  cat <<-'END' >> config.site; echo ${#VERSION}\n"
        "\tdon't } stop\n"
        "\tEND\n"
        "  echo $((1 << 2)) ${VERSION#*.} <<< \"here\"\n"
        "}\n"
        "install_step () { make install; }\n"));

      assert (r.custom_build && r.custom_install);
    }

    assert (parse_error ("NAME=foo\nVERSION=1.0\n"
                         "build_step () {\n"
                         "  cat <<EOF\n"
                         "}\n") == invalid);

    assert (parse_error ("NAME=foo\nVERSION=1.0\n"
                         "build_step () { cat <<; }\n") == invalid);

    // Invalid descriptors.
    //
    assert (parse_error ("NAME=foo\nVERSION=1.0\nmake install\n") == invalid);
    assert (parse_error ("NAME=foo bar\nVERSION=1.0\n") == invalid);
    assert (parse_error ("NAME=foo\nVERSION=1.0\nX=$(ls) | cat\n") == invalid);
    assert (parse_error ("NAME=foo\nVERSION=1.0\nX='abc\n") == invalid);
    assert (parse_error ("NAME=foo\nVERSION=1.0\nbuild_step () {\n") ==
            invalid);
    assert (parse_error ("NAME=foo/bar\nVERSION=1.0\n") == invalid);
    assert (parse_error ("NAME=foo\nVERSION=1.0\nSTRIP_BINARIES=maybe\n") ==
            invalid);
    assert (parse_error ("NAME=foo\nVERSION=1.0\nWORKDIR_SUBDIR=../x\n") ==
            invalid);
    assert (parse_error ("NAME=foo\nVERSION=1.0\nSHA256=1234\n") == invalid);

    // A self-dependency is left for the scheduler to report.
    //
    {
      recipe r (parse ("NAME=foo\nVERSION=1.0\nDEPENDS=\"foo bar\"\n"));
      assert ((r.depends == strings {"foo", "bar"}));
    }

    // Package names.
    //
    assert (!invalid_package_name ("gcc"));
    assert (!invalid_package_name ("linux-headers"));
    assert (invalid_package_name (""));
    assert (invalid_package_name (".hidden"));
    assert (invalid_package_name ("a/b"));

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return lfspkg::main (argc, argv);
}
