#pragma once
/**
 * @file classifier.hpp
 * @brief Feature classification of routing objects and backends.
 * @details Pure functions: no state, no I/O beyond debug logging, safe to
 *          call concurrently. Results are deduplicated and ordered by first
 *          appearance, which is fixed for a given input.
 */

#include <vector>

#include "tally/features/feature.hpp"
#include "tally/model/backend.hpp"
#include "tally/model/routing_object.hpp"

namespace tally::features {

using FrontendFeatures = std::vector<FrontendFeature>;
using BackendFeatures  = std::vector<BackendFeature>;

/**
 * @brief Frontend features used by a routing object.
 *
 * Order: Ingress, External/InternalIngress, HttpEnabled, HostBasedRouting,
 * PathBasedRouting, PreShared/Managed/SecretBasedCertsForTls,
 * TlsTermination, StaticGlobalIp.
 */
[[nodiscard]] FrontendFeatures classifyFrontend(const model::RoutingObject& obj);

/**
 * @brief Backend features used by one backend.
 *
 * Order: ServicePort, External/InternalServicePort, Neg, CloudCdn, CloudIap,
 * Cookie/ClientIpAffinity, CloudArmor, BackendConnectionDraining,
 * BackendTimeout, CustomRequestHeaders.
 */
[[nodiscard]] BackendFeatures classifyBackend(const model::Backend& backend);

} // namespace tally::features
