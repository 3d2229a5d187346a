// file      : lfspkg/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef LFSPKG_TYPES_PARSERS_HXX
#define LFSPKG_TYPES_PARSERS_HXX

#include <lfspkg/types.hxx>

#include <lfspkg/common-options.hxx> // lfspkg::cli namespace

namespace lfspkg
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };
  }
}

#endif // LFSPKG_TYPES_PARSERS_HXX
