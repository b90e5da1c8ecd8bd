/**
 * @file backend_group.hpp
 * @brief Per-service tally of network endpoint group usage.
 */
#pragma once

#include <cstdint>

namespace tally::model {

/**
 * @brief NEG counts for one service, split by who created them.
 *
 * A pure tally: groups are summed field-wise during aggregation, never
 * deduplicated.
 */
struct BackendGroupState final {
  std::uint64_t standalone_neg{0};  ///< NEGs created by standalone annotation
  std::uint64_t ingress_neg{0};     ///< NEGs created for routing objects
  std::uint64_t asm_neg{0};         ///< NEGs created for the service mesh

  bool operator==(const BackendGroupState&) const = default;
};

} // namespace tally::model
