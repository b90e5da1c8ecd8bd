/**
 * @file aggregator.cpp
 * @brief Object/backend and backend-group aggregation passes.
 */
#include "tally/metrics/aggregator.hpp"
#include "tally/features/classifier.hpp"
#include "tally/util/logger.hpp"

#include <algorithm>
#include <bitset>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::metrics {
using namespace tally::features;
using tally::util::Logger;

namespace {

// Wide enough for every vocabulary.
constexpr std::size_t MaxTags = 32;

template <class Feature, std::size_t N>
FeatureCounts<Feature> zeroed(const std::array<Feature, N>& vocabulary) {
    FeatureCounts<Feature> counts;
    for (const auto f : vocabulary) counts.emplace(f, 0);
    return counts;
}

// Adds one per distinct tag in `tags`, however often a tag repeats. Tags
// outside the map's vocabulary are ignored.
template <class Feature>
void count_once(FeatureCounts<Feature>& counts, const std::vector<Feature>& tags) {
    std::bitset<MaxTags> seen;
    for (const auto f : tags) {
        const auto idx = static_cast<std::size_t>(f);
        if (seen.test(idx)) continue;
        seen.set(idx);
        if (auto it = counts.find(f); it != counts.end()) ++it->second;
    }
}

} // namespace

ObjectMetrics Aggregator::computeObjectMetrics() const {
    const auto snap = registry_.routingSnapshot();

    ObjectMetrics out;
    out.objects         = zeroed(ALL_FRONTEND_FEATURES);
    out.backends        = zeroed(ALL_BACKEND_FEATURES);
    out.object_backends = zeroed(OBJECT_BACKEND_FEATURES);

    // Fixed walk order so "first seen" is reproducible.
    std::vector<std::pair<std::string_view, const model::RoutingObjectState*>> entries;
    entries.reserve(snap.size());
    snap.for_each([&](std::string_view key, const model::RoutingObjectState& state) {
        entries.emplace_back(key, &state);
    });
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    // Distinct backends by identity; emplace keeps the first value seen.
    std::map<model::BackendId, const model::Backend*> distinct;

    for (const auto& [key, entry] : entries) {
        const auto& state = *entry;
        count_once(out.objects, classifyFrontend(state.object));

        BackendFeatures used;
        for (const auto& backend : state.backends) {
            distinct.emplace(backend.id, &backend);
            const auto tags = classifyBackend(backend);
            used.insert(used.end(), tags.begin(), tags.end());
        }
        count_once(out.object_backends, used);
    }

    for (const auto& [id, backend] : distinct) {
        count_once(out.backends, classifyBackend(*backend));
    }

    SPDLOG_LOGGER_DEBUG(Logger::instance(), "aggregated {} routing objects, {} distinct backends",
                        entries.size(), distinct.size());
    return out;
}

GroupMetrics Aggregator::computeGroupMetrics() const {
    const auto snap = registry_.groupSnapshot();

    GroupMetrics out = zeroed(ALL_NEG_FEATURES);
    snap.for_each([&](std::string_view, const model::BackendGroupState& group) {
        out[NegFeature::StandaloneNeg] += group.standalone_neg;
        out[NegFeature::IngressNeg]    += group.ingress_neg;
        out[NegFeature::AsmNeg]        += group.asm_neg;
    });
    out[NegFeature::Neg] = out[NegFeature::StandaloneNeg] + out[NegFeature::IngressNeg] + out[NegFeature::AsmNeg];

    SPDLOG_LOGGER_DEBUG(Logger::instance(), "aggregated {} backend groups, {} NEGs total",
                        snap.size(), out[NegFeature::Neg]);
    return out;
}

} // namespace tally::metrics
