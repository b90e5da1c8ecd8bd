#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named values shared by the classifier, exporter and loader.
 * @details Annotation keys and affinity type strings are part of the resource
 *          contract with the reconciler and are not configurable. Exporter and
 *          logging defaults can be overridden through the Config Loader.
 */

#include <cstdint>
#include <string_view>

namespace tally::config::constants {

// =====================
// Routing-object annotations read by the frontend classifier
// =====================
/// Ingress class selector; compared against INGRESS_CLASS_INTERNAL.
inline constexpr std::string_view ANNOTATION_INGRESS_CLASS   = "kubernetes.io/ingress.class";
/// Boolean; "false"-like values disable the plain HTTP frontend.
inline constexpr std::string_view ANNOTATION_ALLOW_HTTP      = "kubernetes.io/ingress.allow-http";
/// Comma separated list of pre-provisioned certificate names.
inline constexpr std::string_view ANNOTATION_PRE_SHARED_CERT = "ingress.gcp.kubernetes.io/pre-shared-cert";
/// Comma separated list of managed certificate resources.
inline constexpr std::string_view ANNOTATION_MANAGED_CERTS   = "networking.gke.io/managed-certificates";
/// Name of a reserved global static address.
inline constexpr std::string_view ANNOTATION_STATIC_IP       = "kubernetes.io/ingress.global-static-ip-name";

/// Class value marking a routing object as internal-load-balancer only.
inline constexpr std::string_view INGRESS_CLASS_INTERNAL = "gce-internal";

// =====================
// BackendConfig session affinity types
// =====================
inline constexpr std::string_view AFFINITY_GENERATED_COOKIE = "GENERATED_COOKIE";
inline constexpr std::string_view AFFINITY_CLIENT_IP        = "CLIENT_IP";

// =====================
// Exporter defaults
// =====================
inline constexpr uint32_t EXPORT_INTERVAL_MS_DEFAULT = 10 * 60 * 1000; ///< 10 min between exports
inline constexpr bool     EXPORT_ENABLED_DEFAULT     = true;

// =====================
// Logging defaults
// =====================
inline constexpr std::string_view LOG_LEVEL_DEFAULT = "info";
inline constexpr std::string_view LOGGER_NAME       = "tally";

} // namespace tally::config::constants
