#ifndef SEEDLING_TESTS_CONTRACT_REGISTRY_H_
#define SEEDLING_TESTS_CONTRACT_REGISTRY_H_

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace seedling::tests
{

// Rules and suites recorded for one contract domain.
struct DomainCoverage
{
  std::set<std::string> rules;
  std::set<std::string> suites;
};

// Process-wide record of which contract rules the suites in this binary
// exercised. Fixtures register from SetUp, so a filtered run only records
// the suites it actually ran.
class ContractRegistry
{
public:
  static ContractRegistry& Instance();

  void RegisterSuite(const std::string& domain,
                     const std::string& suite_name,
                     const std::vector<std::string>& rule_ids);

  // Expected rules with no registered suite, in the order given.
  std::vector<std::string> MissingRules(const std::string& domain,
                                        const std::vector<std::string>& expected) const;

  std::map<std::string, DomainCoverage> Snapshot() const;

private:
  ContractRegistry() = default;
  ContractRegistry(const ContractRegistry&) = delete;
  ContractRegistry& operator=(const ContractRegistry&) = delete;

  mutable std::mutex mutex_;
  std::map<std::string, DomainCoverage> domains_;
};

} // namespace seedling::tests

#endif // SEEDLING_TESTS_CONTRACT_REGISTRY_H_
