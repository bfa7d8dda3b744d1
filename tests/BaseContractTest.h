// Repository: Loopcast
// Component: Base Contract Test
// Purpose: gtest fixture base that records rule coverage per suite.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_TESTS_BASE_CONTRACT_TEST_H_
#define LOOPCAST_TESTS_BASE_CONTRACT_TEST_H_

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ContractRegistry.h"

namespace loopcast::tests
{

// Derived fixtures name their domain and the rule ids their tests cover.
// Coverage is recorded when the first test of the suite sets up.
class BaseContractTest : public ::testing::Test
{
protected:
  [[nodiscard]] virtual std::string DomainName() const = 0;
  [[nodiscard]] virtual std::vector<std::string> CoveredRuleIds() const = 0;

  void SetUp() override
  {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const std::string suite = info != nullptr ? info->test_suite_name() : "unknown";
    ContractRegistry::Instance().RegisterSuite(DomainName(), suite, CoveredRuleIds());
  }

  void TearDown() override {}
};

} // namespace loopcast::tests

#endif // LOOPCAST_TESTS_BASE_CONTRACT_TEST_H_
