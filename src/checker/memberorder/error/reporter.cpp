#include "memberorder/error/reporter.hpp"
#include <iostream>

#if MEMBERORDER_HAVE_UNISTD_H
  #include <unistd.h>
#endif

namespace memberorder::error {
  using memberorder::source::Location;

  #define RED         ";31"
  #define YELLOW      ";33"
  #define CYAN        ";36"

  #define UNCHANGED   ""

  ConsoleReporter ConsoleReporter::INSTANCE;

  static const char * severityNames[SEVERITY_LEVELS] = {
    "debug",
    "status",
    "info",
    "warning",
    "error",
    "fatal",
    "off",
  };

  bool parseSeverity(StringRef name, Severity& result) {
    for (int i = 0; i < SEVERITY_LEVELS; ++i) {
      if (name == severityNames[i]) {
        result = Severity(i);
        return true;
      }
    }
    return false;
  }

  StringRef severityName(Severity sev) {
    assert(sev >= DEBUG && sev < SEVERITY_LEVELS);
    return severityNames[(int)sev];
  }

  MessageStream::~MessageStream() {
    flush();
    _reporter->report(_severity, _location, str());
  }

  void ConsoleReporter::writeSpaces(unsigned numSpaces) {
    static const char spaces[] = "                                                                ";
    while (numSpaces > sizeof(spaces) - 1) {
      std::cerr.write(spaces, sizeof(spaces) - 1);
      numSpaces -= sizeof(spaces) - 1;
    }

    std::cerr.write(spaces, numSpaces);
  }

  void ConsoleReporter::changeColor(StringRef color, bool bold) {
    std::cerr << "\033[" << (bold ? "1" : "0") << color << "m";
  }

  void ConsoleReporter::resetColor() {
    std::cerr << "\033[0m";
  }

  void ConsoleReporter::report(Severity sev, Location loc, StringRef msg) {
    assert(msg.size() > 0 && "Zero-length diagnostic message");
    if (sev == OFF) {
      return;
    }

    _messageCountArray[(int)sev] += 1;

    bool colorChanged = false;
    #if MEMBERORDER_HAVE_UNISTD_H
      if (::isatty(STDERR_FILENO)) {
        if (sev >= ERROR) {
          changeColor(RED, true);
          colorChanged = true;
        } else if (sev == WARNING) {
          changeColor(YELLOW, true);
          colorChanged = true;
        } else if (sev == INFO) {
          changeColor(CYAN, true);
          colorChanged = true;
        } else if (sev == STATUS) {
          changeColor(CYAN, false);
          colorChanged = true;
        }
      }
    #endif

    bool showErrorLine = false;
    if (loc.source != nullptr && !loc.source->path().empty()) {
      std::cerr << loc.source->path();
      if (loc.startLine > 0) {
        std::cerr << ":" << loc.startLine << ":" << loc.startCol;
        showErrorLine = true;
      }
      std::cerr << ": ";
    }

    if (sev != STATUS) {
      std::cerr << severityNames[(int)sev] << ": ";
    }
    writeSpaces(_indentLevel * 2);
    std::cerr << msg << "\n";

    if (colorChanged) {
      resetColor();
    }

    if (showErrorLine) {
      std::string line;
      if (loc.source->getLine(loc.startLine - 1, line)) {
        uint32_t beginCol = loc.startCol > 0 ? loc.startCol - 1 : 0;
        uint32_t endCol = loc.endCol > 0 ? loc.endCol - 1 : beginCol + 1;
        if (loc.endLine > loc.startLine || endCol > line.size()) {
          endCol = line.size();
        }
        #if MEMBERORDER_HAVE_UNISTD_H
          if (colorChanged) {
            changeColor(UNCHANGED, true);
          }
        #endif
        std::cerr << line << "\n";
        #if MEMBERORDER_HAVE_UNISTD_H
          if (colorChanged) {
            resetColor();
          }
        #endif
        writeSpaces(beginCol);
        while (beginCol < endCol) {
          std::cerr << "^";
          ++beginCol;
        }
        std::cerr << "\n";
      }
    }

    std::cerr.flush();
  }
}
