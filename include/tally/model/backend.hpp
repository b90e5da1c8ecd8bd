/**
 * @file backend.hpp
 * @brief Backend (service port) model and its optional advanced configuration.
 *
 * A backend is identified by the (namespace, service, port) triple. Two
 * `Backend` values with equal `BackendId` are the same backend for metrics
 * purposes, whatever their other fields hold.
 */
#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tally::model {

/**
 * @brief Service port reference: numeric port or named port.
 */
using PortRef = std::variant<std::int32_t, std::string>;

/**
 * @brief Identity of a backend; the dedup key during aggregation.
 *
 * Ordering is defaulted so the type can key ordered containers.
 */
struct BackendId final {
  std::string   ns;       ///< Namespace of the referenced service.
  std::string   service;  ///< Service name.
  PortRef       port{0};  ///< Service port (number or name).

  auto operator<=>(const BackendId&) const = default;
  bool operator==(const BackendId&) const = default;
};

struct CdnConfig final {
  bool enabled{false};
  bool operator==(const CdnConfig&) const = default;
};

struct IapConfig final {
  bool enabled{false};
  bool operator==(const IapConfig&) const = default;
};

struct SessionAffinityConfig final {
  std::string affinity_type;                   ///< e.g. GENERATED_COOKIE, CLIENT_IP, NONE
  std::optional<std::int64_t> cookie_ttl_sec;  ///< Only meaningful for cookie affinity
  bool operator==(const SessionAffinityConfig&) const = default;
};

struct SecurityPolicyConfig final {
  std::string name;
  bool operator==(const SecurityPolicyConfig&) const = default;
};

struct ConnectionDrainingConfig final {
  std::int64_t draining_timeout_sec{0};
  bool operator==(const ConnectionDrainingConfig&) const = default;
};

struct CustomRequestHeadersConfig final {
  std::vector<std::string> headers;  ///< May be empty; presence is what counts.
  bool operator==(const CustomRequestHeadersConfig&) const = default;
};

/**
 * @brief Advanced per-backend settings (the BackendConfig resource).
 *
 * Every section is optional; an absent section means the setting is not in use.
 */
struct BackendConfig final {
  std::optional<CdnConfig>                  cdn;
  std::optional<IapConfig>                  iap;
  std::optional<SessionAffinityConfig>      session_affinity;
  std::optional<SecurityPolicyConfig>       security_policy;
  std::optional<ConnectionDrainingConfig>   connection_draining;
  std::optional<std::int64_t>               timeout_sec;
  std::optional<CustomRequestHeadersConfig> custom_request_headers;

  bool operator==(const BackendConfig&) const = default;
};

/**
 * @brief A resolved backend as referenced by a routing object.
 */
struct Backend final {
  BackendId id;                                ///< Dedup identity.
  bool neg_enabled{false};                     ///< Served through network endpoint groups.
  bool ilb_enabled{false};                     ///< Internal load balancer backend.
  std::optional<BackendConfig> backend_config; ///< Attached BackendConfig, if any.

  bool operator==(const Backend&) const = default;
};

using BackendList = std::vector<Backend>;

} // namespace tally::model
