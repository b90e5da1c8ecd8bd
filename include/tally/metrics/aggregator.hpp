#pragma once
/**
 * @file aggregator.hpp
 * @brief Folds registry snapshots into per-feature usage counts.
 */

#include <cstdint>
#include <map>

#include "tally/features/feature.hpp"
#include "tally/metrics/state_registry.hpp"

namespace tally::metrics {

/// Feature → count. Always holds every tag of the vocabulary (zeros included).
template <class Feature>
using FeatureCounts = std::map<Feature, std::uint64_t>;

/** @struct ObjectMetrics
 *  @brief Result of one routing-object aggregation pass.
 */
struct ObjectMetrics {
    FeatureCounts<features::FrontendFeature> objects;         ///< Routing objects per frontend feature
    FeatureCounts<features::BackendFeature>  backends;        ///< Distinct backends per backend feature
    FeatureCounts<features::BackendFeature>  object_backends; ///< Routing objects with at least one backend
                                                              ///< using the feature (OBJECT_BACKEND_FEATURES)

    bool operator==(const ObjectMetrics&) const = default;
};

using GroupMetrics = FeatureCounts<features::NegFeature>;

/** @class Aggregator
 *  @brief Trusted reader of a StateRegistry.
 *
 * Each compute call takes one snapshot and works on it alone: writes that
 * complete before the call are reflected, later ones are not. The registry
 * must outlive the aggregator.
 */
class Aggregator {
public:
    explicit Aggregator(const StateRegistry& registry) noexcept : registry_(registry) {}

    /**
     * @brief Count routing objects per frontend feature and distinct backends
     *        per backend feature.
     *
     * Backends are deduplicated by (namespace, service, port) across the whole
     * pass: a backend referenced by N routing objects counts once. When two
     * values share an identity, the first one seen is classified, walking
     * routing objects in key order and backends in list order.
     *
     * object_backends is computed from each routing object's own backend
     * values, without identity dedup.
     */
    [[nodiscard]] ObjectMetrics computeObjectMetrics() const;

    /**
     * @brief Sum backend-group tallies field-wise.
     *
     * NegFeature::Neg is the sum of the three per-origin totals.
     */
    [[nodiscard]] GroupMetrics computeGroupMetrics() const;

private:
    const StateRegistry& registry_;
};

} // namespace tally::metrics
