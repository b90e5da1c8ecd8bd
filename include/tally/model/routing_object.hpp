/**
 * @file routing_object.hpp
 * @brief Routing object (Ingress) model as seen by the metrics core.
 *
 * Values arrive fully populated from the reconciler. Nothing here is
 * validated; an empty field simply fails to trigger its feature.
 */
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tally/model/backend.hpp"

namespace tally::model {

/// Reference from a rule (or the default backend slot) to a service port.
struct BackendRef final {
  std::string service_name;
  PortRef     port{0};
  bool operator==(const BackendRef&) const = default;
};

/// One path entry of an HTTP rule.
struct PathRule final {
  std::string path;
  BackendRef  backend;
  bool operator==(const PathRule&) const = default;
};

/// Host rule; `host` may be empty (matches every host).
struct Rule final {
  std::string           host;
  std::vector<PathRule> paths;
  bool operator==(const Rule&) const = default;
};

/// TLS section entry.
struct TlsEntry final {
  std::vector<std::string> hosts;
  std::string              secret_name;
  bool operator==(const TlsEntry&) const = default;
};

/// Annotation map with heterogeneous (string_view) lookup.
using Annotations = std::map<std::string, std::string, std::less<>>;

struct RoutingObject final {
  std::string               ns;
  std::string               name;
  Annotations               annotations;
  std::optional<BackendRef> default_backend;
  std::vector<Rule>         rules;
  std::vector<TlsEntry>     tls;

  bool operator==(const RoutingObject&) const = default;
};

/**
 * @brief Value stored per routing-object key: the object plus the resolved
 *        backends it references (default backend and rule backends).
 */
struct RoutingObjectState final {
  RoutingObject object;
  BackendList   backends;

  bool operator==(const RoutingObjectState&) const = default;
};

} // namespace tally::model
