// Repository: Loopcast
// Component: Contract Registry Environment
// Purpose: Verifies at the end of the run that every expected rule was
//          covered by a suite.
// Copyright (c) 2026 Loopcast Authors

#include "ContractRegistryEnvironment.h"

#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <set>

#include "../ContractRegistry.h"

namespace loopcast::tests
{
namespace
{

std::mutex& ExpectedMutex()
{
  static std::mutex mutex;
  return mutex;
}

std::map<std::string, std::set<std::string>>& Expected()
{
  static std::map<std::string, std::set<std::string>> expected;
  return expected;
}

class ContractRegistryEnvironment : public ::testing::Environment
{
public:
  void TearDown() override
  {
    std::map<std::string, std::set<std::string>> expected;
    {
      std::lock_guard<std::mutex> lock(ExpectedMutex());
      expected = Expected();
    }
    auto& registry = ContractRegistry::Instance();
    for (const auto& [domain, rules] : expected)
    {
      // Domains filtered out of this run are not judged.
      if (registry.CoveredRules(domain).empty())
      {
        continue;
      }
      const auto missing = registry.MissingRules(
          domain, std::vector<std::string>(rules.begin(), rules.end()));
      for (const auto& rule : missing)
      {
        ADD_FAILURE() << "Domain " << domain << " has no suite covering rule " << rule;
      }
    }
  }
};

const bool kEnvironmentInstalled = []()
{
  ::testing::AddGlobalTestEnvironment(new ContractRegistryEnvironment());
  return true;
}();

} // namespace

void RegisterExpectedDomainCoverage(std::string domain,
                                    std::vector<std::string> rule_ids)
{
  std::lock_guard<std::mutex> lock(ExpectedMutex());
  auto& rules = Expected()[std::move(domain)];
  rules.insert(rule_ids.begin(), rule_ids.end());
}

} // namespace loopcast::tests
