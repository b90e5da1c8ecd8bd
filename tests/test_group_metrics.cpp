/**
 * @file test_group_metrics.cpp
 * @brief Tests for backend-group (NEG) aggregation.
 */

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "fixtures.hpp"
#include "tally/metrics/aggregator.hpp"
#include "tally/metrics/state_registry.hpp"

using tally::features::NegFeature;
using tally::metrics::Aggregator;
using tally::metrics::GroupMetrics;
using tally::metrics::StateRegistry;
using tally::model::BackendGroupState;

namespace {

BackendGroupState group(std::uint64_t standalone, std::uint64_t ingress, std::uint64_t asm_neg) {
  return BackendGroupState{.standalone_neg = standalone, .ingress_neg = ingress, .asm_neg = asm_neg};
}

GroupMetrics expected(std::uint64_t standalone, std::uint64_t ingress, std::uint64_t asm_neg, std::uint64_t total) {
  return GroupMetrics{
    {NegFeature::StandaloneNeg, standalone},
    {NegFeature::IngressNeg, ingress},
    {NegFeature::AsmNeg, asm_neg},
    {NegFeature::Neg, total},
  };
}

GroupMetrics compute_for(const std::vector<BackendGroupState>& groups) {
  StateRegistry reg;
  for (std::size_t i = 0; i < groups.size(); ++i) reg.setBackendGroup("svc-" + std::to_string(i), groups[i]);
  return Aggregator(reg).computeGroupMetrics();
}

} // namespace

/**
 * @test GroupMetrics_Empty
 * @brief All four tags present and zero for an empty store.
 */
TEST(GroupMetrics, GroupMetrics_Empty) {
  EXPECT_EQ(compute_for({}), expected(0, 0, 0, 0));
}

TEST(GroupMetrics, GroupMetrics_OneGroup) {
  EXPECT_EQ(compute_for({group(0, 0, 1)}), expected(0, 0, 1, 1));
}

/**
 * @test GroupMetrics_ThreeGroups
 * @brief (0,0,1) + (0,1,0) + (5,3,2) = {5, 4, 3, total 12}.
 */
TEST(GroupMetrics, GroupMetrics_ThreeGroups) {
  EXPECT_EQ(compute_for({group(0, 0, 1), group(0, 1, 0), group(5, 3, 2)}), expected(5, 4, 3, 12));
}

TEST(GroupMetrics, GroupMetrics_ManyGroups) {
  EXPECT_EQ(compute_for({group(0, 0, 1), group(0, 1, 0), group(5, 0, 0), group(5, 3, 2)}),
            expected(10, 4, 3, 17));
}

/**
 * @test GroupMetrics_IdenticalValuesNotDeduplicated
 * @brief Groups are tallies: equal values under different keys all add up.
 */
TEST(GroupMetrics, GroupMetrics_IdenticalValuesNotDeduplicated) {
  EXPECT_EQ(compute_for({group(1, 1, 1), group(1, 1, 1), group(1, 1, 1)}), expected(3, 3, 3, 9));
}

/**
 * @test GroupMetrics_SetReplaces_DeleteRemoves
 */
TEST(GroupMetrics, GroupMetrics_SetReplaces_DeleteRemoves) {
  StateRegistry reg;
  Aggregator agg(reg);

  reg.setBackendGroup("default/svc-a", group(5, 3, 2));
  reg.setBackendGroup("default/svc-b", group(1, 0, 0));
  reg.setBackendGroup("default/svc-a", group(0, 1, 0));  // replaces, not adds
  EXPECT_EQ(agg.computeGroupMetrics(), expected(1, 1, 0, 2));

  reg.deleteBackendGroup("default/svc-b");
  EXPECT_EQ(agg.computeGroupMetrics(), expected(0, 1, 0, 1));

  reg.deleteBackendGroup("default/svc-b");  // already gone
  reg.deleteBackendGroup("default/svc-a");
  EXPECT_EQ(agg.computeGroupMetrics(), expected(0, 0, 0, 0));
}

/**
 * @test GroupMetrics_Concurrency_WritersOnDistinctKeys
 * @brief Totals equal the field-wise sum of everything written concurrently.
 */
TEST(GroupMetrics, GroupMetrics_Concurrency_WritersOnDistinctKeys) {
  constexpr int Writers = 4;
  constexpr int KeysPerWriter = 50;

  StateRegistry reg;
  std::vector<std::thread> threads;
  for (int w = 0; w < Writers; ++w) {
    threads.emplace_back([&, w] {
      for (int k = 0; k < KeysPerWriter; ++k) {
        reg.setBackendGroup("w" + std::to_string(w) + "/svc" + std::to_string(k), group(1, 2, 3));
      }
    });
  }
  for (auto& t : threads) t.join();

  constexpr std::uint64_t n = Writers * KeysPerWriter;
  EXPECT_EQ(Aggregator(reg).computeGroupMetrics(), expected(n, 2 * n, 3 * n, 6 * n));
}
