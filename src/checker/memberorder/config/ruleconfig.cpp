#include "memberorder/config/ruleconfig.hpp"
#include "memberorder/error/diagnostics.hpp"
#include <llvm/Support/JSON.h>
#include <llvm/Support/MemoryBuffer.h>

namespace memberorder::config {
  using namespace llvm;
  using memberorder::error::diag;
  using memberorder::rules::GroupsOrder;

  namespace {
    struct RuleEntry {
      Optional<std::vector<std::string>> order;
      Optional<bool> alphabetize;
      Optional<std::string> severity;
    };

    bool fromJSON(const json::Value& value, RuleEntry& entry, json::Path path) {
      json::ObjectMapper mapper(value, path);
      return mapper
          && mapper.map("order", entry.order)
          && mapper.map("alphabetize", entry.alphabetize)
          && mapper.map("severity", entry.severity);
    }
  }

  bool parseRuleConfig(StringRef text, StringRef path, RuleConfig& config) {
    auto document = json::parse(text);
    if (!document) {
      diag.error() << path << ": " << toString(document.takeError());
      return false;
    }

    json::Path::Root root(path);
    auto rules = document->getAsObject();
    if (!rules) {
      diag.error() << path << ": expected a JSON object.";
      return false;
    }
    auto ruleSet = rules->get("rules");
    if (!ruleSet) {
      return true;
    }
    auto ruleSetObject = ruleSet->getAsObject();
    if (!ruleSetObject) {
      diag.error() << path << ": 'rules' should be an object.";
      return false;
    }
    auto ruleValue = ruleSetObject->get(MemberOrderingRule::RULE_ID);
    if (!ruleValue) {
      return true;
    }

    RuleEntry entry;
    json::Path rootPath(root);
    json::Path rulesPath = rootPath.field("rules");
    if (!fromJSON(*ruleValue, entry, rulesPath.field(MemberOrderingRule::RULE_ID))) {
      diag.error() << path << ": " << toString(root.getError());
      return false;
    }

    if (entry.order) {
      config.order = std::move(*entry.order);
    }
    if (entry.alphabetize) {
      config.alphabetize = *entry.alphabetize;
    }
    if (entry.severity && !memberorder::error::parseSeverity(*entry.severity, config.severity)) {
      diag.error() << path << ": unknown severity '" << *entry.severity << "'.";
      return false;
    }
    return true;
  }

  bool loadRuleConfig(StringRef path, RuleConfig& config) {
    auto buffer = MemoryBuffer::getFile(path);
    if (!buffer) {
      diag.error() << "Cannot read configuration file '" << path << "': "
          << buffer.getError().message();
      return false;
    }
    return parseRuleConfig((*buffer)->getBuffer(), path, config);
  }

  std::unique_ptr<MemberOrderingRule> createRule(const RuleConfig& config) {
    GroupsOrder order;
    if (!GroupsOrder::parse(config.order, order)) {
      return nullptr;
    }
    return std::make_unique<MemberOrderingRule>(order, config.alphabetize, config.severity);
  }
}
