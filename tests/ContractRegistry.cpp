#include "ContractRegistry.h"

namespace seedling::tests
{

ContractRegistry& ContractRegistry::Instance()
{
  static ContractRegistry registry;
  return registry;
}

void ContractRegistry::RegisterSuite(const std::string& domain,
                                     const std::string& suite_name,
                                     const std::vector<std::string>& rule_ids)
{
  std::lock_guard<std::mutex> lock(mutex_);
  DomainCoverage& coverage = domains_[domain];
  coverage.rules.insert(rule_ids.begin(), rule_ids.end());
  coverage.suites.insert(suite_name);
}

std::vector<std::string> ContractRegistry::MissingRules(
    const std::string& domain,
    const std::vector<std::string>& expected) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = domains_.find(domain);
  std::vector<std::string> missing;
  for (const auto& rule : expected)
  {
    if (it == domains_.end() || it->second.rules.count(rule) == 0)
    {
      missing.push_back(rule);
    }
  }
  return missing;
}

std::map<std::string, DomainCoverage> ContractRegistry::Snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return domains_;
}

} // namespace seedling::tests
