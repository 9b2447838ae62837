#ifndef MEMBERORDER_SOURCE_LOCATION_HPP
#define MEMBERORDER_SOURCE_LOCATION_HPP 1

#ifndef MEMBERORDER_CONFIG_H
  #include "config.h"
#endif

#ifndef MEMBERORDER_SOURCE_PROGRAMSOURCE_HPP
  #include "memberorder/source/programsource.hpp"
#endif

#include <cstdint>
#include <ostream>

namespace memberorder::source {
  /** Represents a location within a source file. Lines and columns are 1-based. */
  struct Location {
    ProgramSource* source;
    int32_t startLine;
    int16_t startCol;
    int32_t endLine;
    int16_t endCol;

    Location()
      : source(nullptr)
      , startLine(0)
      , startCol(0)
      , endLine(0)
      , endCol(0)
    {
    }

    Location(
      ProgramSource* src,
      int32_t startLn,
      int16_t startCl,
      int32_t endLn,
      int16_t endCl)
      : source(src)
      , startLine(startLn)
      , startCol(startCl)
      , endLine(endLn)
      , endCol(endCl)
    {
    }

    /** True if this location refers to an actual position in a file. */
    bool isValid() const {
      return source != nullptr && startLine > 0;
    }
  };

  class Locatable {
  public:
    virtual const Location& getLocation() const = 0;
  };
}

namespace llvm {
  // How to print a StringRef.
  inline ::std::ostream& operator<<(::std::ostream& os, const llvm::StringRef& str) {
    os.write(str.begin(), str.size());
    return os;
  }
}

#endif
