#ifndef MEMBERORDER_ERROR_DIAGNOSTICS_HPP
#define MEMBERORDER_ERROR_DIAGNOSTICS_HPP 1

#ifndef MEMBERORDER_ERROR_REPORTER_HPP
  #include "memberorder/error/reporter.hpp"
#endif

namespace memberorder::error {
  struct Diagnostics {
    Reporter* reporter = &ConsoleReporter::INSTANCE;

    /** Error. */
    inline MessageStream error(Location loc = Location()) {
      return MessageStream(reporter, ERROR, loc);
    }

    /** Status message. */
    inline MessageStream status(Location loc = Location()) {
      return MessageStream(reporter, STATUS, loc);
    }

    /** Message with variable severity. */
    inline MessageStream operator()(Severity sev, Location loc = Location()) {
      return MessageStream(reporter, sev, loc);
    }

    /** Number of errors encountered so far. */
    int errorCount() const { return reporter->errorCount(); }

    /** Reset the message counts of the current reporter. */
    void reset() { reporter->reset(); }

    /** Increase the indentation level. */
    void indent() {
      reporter->indent();
    }

    /** Decrease the indentation level. */
    void unindent() {
      reporter->unindent();
    }
  };

  // Static diagnostics instance.
  extern Diagnostics diag;

  /** Convenience class that increases indentation level within a scope. */
  class AutoIndent {
  public:
    AutoIndent(Diagnostics& diag, bool enabled = true)
      : _diag(diag)
      , _enabled(enabled)
    {
      if (_enabled) _diag.indent();
    }

    ~AutoIndent() {
      if (_enabled) _diag.unindent();
    }

  private:
    Diagnostics& _diag;
    bool _enabled;
  };
}

#endif
