#ifndef MEMBERORDER_SOURCE_PROGRAMSOURCE_HPP
#define MEMBERORDER_SOURCE_PROGRAMSOURCE_HPP 1

#ifndef MEMBERORDER_CONFIG_H
  #include "config.h"
#endif

#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <llvm/ADT/StringRef.h>

namespace memberorder::source {
  using llvm::StringRef;

  /** Interface for reading the text of an analyzed source file. */
  class ProgramSource {
  public:
    virtual ~ProgramSource() {}

    /** The path of this file, used for error reporting. */
    virtual StringRef path() const = 0;

    /** Read a single line from the source (for error reporting). Index is 0-based. */
    virtual bool getLine(uint32_t index, std::string& result) = 0;
  };

  /** Implements shared logic for ProgramSource implementations. */
  class AbstractProgramSource : public ProgramSource {
  public:
    AbstractProgramSource(StringRef path) : _path(path.begin(), path.end()) {}

    StringRef path() const { return _path; }

    bool getLine(uint32_t index, std::string& result) {
      if (!_linesRead) {
        readLines(_lines);
        _linesRead = true;
      }
      if (index < _lines.size()) {
        result = _lines[index];
        return true;
      } else {
        result.clear();
        return false;
      }
    }

  protected:
    std::vector<std::string> _lines;
    std::string _path;
    bool _linesRead = false;

    virtual void readLines(std::vector<std::string>& lines) = 0;
  };

  /** Source text held in memory. */
  class StringSource : public AbstractProgramSource {
  public:
    StringSource(StringRef path, StringRef source)
      : AbstractProgramSource(path)
      , _source(source.begin(), source.end())
    {}

  private:
    void readLines(std::vector<std::string>& lines) {
      std::istringstream strm(_source);
      std::string line;
      while (std::getline(strm, line)) {
        lines.push_back(line);
      }
    }
    std::string _source;
  };

  /** Source text read lazily from disk. A missing file simply has no lines. */
  class FileSource : public AbstractProgramSource {
  public:
    FileSource(StringRef fullPath, StringRef path)
      : AbstractProgramSource(path)
      , _fullPath(fullPath.begin(), fullPath.end())
    {}

  private:
    void readLines(std::vector<std::string>& lines) {
      std::ifstream strm(_fullPath);
      std::string line;
      while (std::getline(strm, line)) {
        lines.push_back(line);
      }
    }
    std::string _fullPath;
  };
}

#endif
