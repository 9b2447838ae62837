#include "memberorder/checker/checker.hpp"
#include "memberorder/error/diagnostics.hpp"
#include "memberorder/import/manifest.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>

using namespace llvm;
using namespace llvm::sys;

static cl::list<std::string> InputFilenames(
    cl::Positional, cl::desc("<member manifests>"), cl::OneOrMore);
static cl::opt<std::string> ConfigFile(
    "config", cl::desc("JSON configuration file"), cl::value_desc("file"));
static cl::list<std::string> Order(
    "order", cl::desc("Member groups, in the order they should appear"),
    cl::value_desc("group,..."), cl::CommaSeparated);
static cl::opt<bool> Alphabetize(
    "alphabetize", cl::desc("Require members of the same group to be sorted by name"));
static cl::opt<std::string> SeverityName(
    "severity", cl::desc("Severity of reported issues (info, warning, error, ...)"),
    cl::value_desc("level"));
static cl::opt<bool> Verbose("verbose", cl::desc("Show files as they are checked"));

namespace memberorder::checker {
  using memberorder::config::RuleConfig;
  using memberorder::error::AutoIndent;
  using memberorder::error::diag;

  void reportIssue(const Issue& issue) {
    diag(issue.severity, issue.location) << issue.message << " [" << issue.ruleId << "]";
  }

  int Checker::run() {
    if (!configure()) {
      return 1;
    }
    loadManifests();

    size_t issueCount = 0;
    if (_rule->severity() != error::OFF) {
      for (auto& file : _files) {
        issueCount += checkFile(*file);
      }
    }

    if (Verbose) {
      diag.status() << issueCount << " issue(s) found in " << _files.size() << " file(s).";
    }
    return diag.errorCount() == 0 ? 0 : 1;
  }

  bool Checker::configure() {
    RuleConfig config;
    if (!ConfigFile.empty() && !config::loadRuleConfig(ConfigFile, config)) {
      return false;
    }

    // Command-line settings take precedence over the configuration file.
    if (!Order.empty()) {
      config.order.assign(Order.begin(), Order.end());
    }
    if (Alphabetize.getNumOccurrences() > 0) {
      config.alphabetize = Alphabetize;
    }
    if (!SeverityName.empty() && !error::parseSeverity(SeverityName, config.severity)) {
      diag.error() << "Unknown severity: '" << SeverityName << "'.";
      return false;
    }

    _rule = config::createRule(config);
    return _rule != nullptr;
  }

  void Checker::loadManifests() {
    for (auto& input : InputFilenames) {
      if (!fs::exists(input)) {
        diag.error() << "Input file not found: " << input;
        continue;
      }
      // Unreadable manifests have already been reported; check the rest.
      if (auto file = import::loadManifest(input)) {
        _files.push_back(std::move(file));
      }
    }
  }

  size_t Checker::checkFile(const SourceFile& file) {
    if (Verbose) {
      diag.status() << "Checking " << file.path();
    }
    AutoIndent indent(diag, Verbose);
    auto issues = _rule->check(file);
    for (auto& issue : issues) {
      reportIssue(issue);
    }
    return issues.size();
  }
}
