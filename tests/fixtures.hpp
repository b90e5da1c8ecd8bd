/**
 * @file fixtures.hpp
 * @brief Shared routing objects and backends for classifier/aggregator tests.
 *
 * Four backends and twelve routing objects covering every frontend and
 * backend feature. Backend 0 and backend 2 share the identity
 * default/dummy-service:80 but differ in content.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "tally/features/feature.hpp"
#include "tally/model/backend.hpp"
#include "tally/model/routing_object.hpp"

namespace tally::features {
// gtest printers so failures show labels instead of raw bytes.
inline void PrintTo(FrontendFeature f, std::ostream* os) { *os << label(f); }
inline void PrintTo(BackendFeature f, std::ostream* os)  { *os << label(f); }
inline void PrintTo(NegFeature f, std::ostream* os)      { *os << label(f); }
} // namespace tally::features

namespace tally::testing {

using features::BackendFeature;
using features::FrontendFeature;

inline constexpr const char* DEFAULT_NS = "default";
inline constexpr std::int64_t TEST_TTL = 10;

inline model::BackendId backend_id(const std::string& service, std::int32_t port) {
  return model::BackendId{.ns = DEFAULT_NS, .service = service, .port = port};
}

inline std::vector<model::Backend> test_backends() {
  return {
    // 0: external, CDN + cookie affinity + security policy + draining
    model::Backend{
      .id = backend_id("dummy-service", 80),
      .backend_config = model::BackendConfig{
        .cdn = model::CdnConfig{.enabled = true},
        .session_affinity = model::SessionAffinityConfig{.affinity_type = "GENERATED_COOKIE", .cookie_ttl_sec = TEST_TTL},
        .security_policy = model::SecurityPolicyConfig{.name = "security-policy-1"},
        .connection_draining = model::ConnectionDrainingConfig{.draining_timeout_sec = TEST_TTL},
      },
    },
    // 1: external NEG, IAP + client IP affinity + timeout + empty custom headers
    model::Backend{
      .id = backend_id("foo-service", 80),
      .neg_enabled = true,
      .backend_config = model::BackendConfig{
        .iap = model::IapConfig{.enabled = true},
        .session_affinity = model::SessionAffinityConfig{.affinity_type = "CLIENT_IP", .cookie_ttl_sec = TEST_TTL},
        .timeout_sec = TEST_TTL,
        .custom_request_headers = model::CustomRequestHeadersConfig{.headers = {}},
      },
    },
    // 2: internal NEG default backend, no BackendConfig
    model::Backend{
      .id = backend_id("dummy-service", 80),
      .neg_enabled = true,
      .ilb_enabled = true,
    },
    // 3: internal NEG, IAP + cookie affinity + draining
    model::Backend{
      .id = backend_id("bar-service", 5000),
      .neg_enabled = true,
      .ilb_enabled = true,
      .backend_config = model::BackendConfig{
        .iap = model::IapConfig{.enabled = true},
        .session_affinity = model::SessionAffinityConfig{.affinity_type = "GENERATED_COOKIE", .cookie_ttl_sec = TEST_TTL},
        .connection_draining = model::ConnectionDrainingConfig{.draining_timeout_sec = TEST_TTL},
      },
    },
  };
}

/// One routing object with its backends and the expected classification.
struct RoutingCase {
  std::string desc;
  model::RoutingObjectState state;
  std::vector<FrontendFeature> frontend;
  std::vector<BackendFeature> backend;  ///< Union over the case's backends, first-appearance order
};

inline model::RoutingObject object(const std::string& name) {
  model::RoutingObject o;
  o.ns = DEFAULT_NS;
  o.name = name;
  return o;
}

inline model::Rule host_path_rule(const std::string& host, const std::string& path,
                                  const std::string& service, std::int32_t port) {
  return model::Rule{
    .host = host,
    .paths = {model::PathRule{.path = path, .backend = model::BackendRef{.service_name = service, .port = port}}},
  };
}

inline std::vector<RoutingCase> routing_cases() {
  using F = FrontendFeature;
  using B = BackendFeature;
  const auto sp = test_backends();
  const model::BackendRef dummy{.service_name = "dummy-service", .port = 80};

  const std::vector<B> sp0_features{B::ServicePort, B::ExternalServicePort, B::CloudCdn,
                                    B::CookieAffinity, B::CloudArmor, B::BackendConnectionDraining};
  const std::vector<B> sp1_features{B::ServicePort, B::ExternalServicePort, B::Neg, B::CloudIap,
                                    B::ClientIpAffinity, B::BackendTimeout, B::CustomRequestHeaders};

  std::vector<RoutingCase> cases;

  {  // 0
    cases.push_back({"no rules or annotations", {object("ingress0"), {}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled}, {}});
  }
  {  // 1
    auto o = object("ingress1");
    o.annotations["kubernetes.io/ingress.allow-http"] = "false";
    cases.push_back({"http disabled", {o, {}}, {F::Ingress, F::ExternalIngress}, {}});
  }
  {  // 2
    auto o = object("ingress2");
    o.default_backend = dummy;
    cases.push_back({"default backend", {o, {sp[0]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled}, sp0_features});
  }
  {  // 3
    auto o = object("ingress3");
    o.rules.push_back(model::Rule{.host = "foo.bar"});
    cases.push_back({"host rule only", {o, {}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::HostBasedRouting}, {}});
  }
  {  // 4
    auto o = object("ingress4");
    o.rules.push_back(host_path_rule("foo.bar", "/foo", "foo-service", 80));
    cases.push_back({"both host and path rules", {o, {sp[1]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::HostBasedRouting, F::PathBasedRouting},
                     sp1_features});
  }
  {  // 5
    auto o = object("ingress5");
    o.default_backend = dummy;
    o.rules.push_back(host_path_rule("foo.bar", "/foo", "foo-service", 80));
    cases.push_back({"default backend and host rule", {o, {sp[0], sp[1]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::HostBasedRouting, F::PathBasedRouting},
                     {B::ServicePort, B::ExternalServicePort, B::CloudCdn, B::CookieAffinity, B::CloudArmor,
                      B::BackendConnectionDraining, B::Neg, B::CloudIap, B::ClientIpAffinity, B::BackendTimeout,
                      B::CustomRequestHeaders}});
  }
  {  // 6
    auto o = object("ingress6");
    o.annotations["ingress.gcp.kubernetes.io/pre-shared-cert"] = "pre-shared-cert1,pre-shared-cert2";
    o.default_backend = dummy;
    cases.push_back({"tls termination with pre-shared certs", {o, {sp[0]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::PreSharedCertsForTls, F::TlsTermination},
                     sp0_features});
  }
  {  // 7
    auto o = object("ingress7");
    o.annotations["networking.gke.io/managed-certificates"] = "managed-cert1,managed-cert2";
    o.default_backend = dummy;
    cases.push_back({"tls termination with managed certs", {o, {sp[0]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::ManagedCertsForTls, F::TlsTermination},
                     sp0_features});
  }
  {  // 8
    auto o = object("ingress8");
    o.annotations["ingress.gcp.kubernetes.io/pre-shared-cert"] = "pre-shared-cert1,pre-shared-cert2";
    o.annotations["networking.gke.io/managed-certificates"] = "managed-cert1,managed-cert2";
    o.default_backend = dummy;
    cases.push_back({"tls termination with pre-shared and managed certs", {o, {sp[0]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::PreSharedCertsForTls,
                      F::ManagedCertsForTls, F::TlsTermination},
                     sp0_features});
  }
  {  // 9
    auto o = object("ingress9");
    o.annotations["ingress.gcp.kubernetes.io/pre-shared-cert"] = "pre-shared-cert1,pre-shared-cert2";
    o.rules.push_back(host_path_rule("foo.bar", "/foo", "foo-service", 80));
    o.tls.push_back(model::TlsEntry{.hosts = {"foo.bar"}, .secret_name = "secret-1"});
    cases.push_back({"tls termination with pre-shared and secret based certs", {o, {sp[1]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::HostBasedRouting, F::PathBasedRouting,
                      F::PreSharedCertsForTls, F::SecretBasedCertsForTls, F::TlsTermination},
                     sp1_features});
  }
  {  // 10
    auto o = object("ingress10");
    o.annotations["ingress.gcp.kubernetes.io/pre-shared-cert"] = "pre-shared-cert1,pre-shared-cert2";
    o.annotations["kubernetes.io/ingress.global-static-ip-name"] = "10.0.1.2";
    o.default_backend = dummy;
    cases.push_back({"global static ip", {o, {sp[0]}},
                     {F::Ingress, F::ExternalIngress, F::HttpEnabled, F::PreSharedCertsForTls,
                      F::TlsTermination, F::StaticGlobalIp},
                     sp0_features});
  }
  {  // 11
    auto o = object("ingress11");
    o.annotations["kubernetes.io/ingress.class"] = "gce-internal";
    o.default_backend = dummy;
    o.rules.push_back(host_path_rule("bar", "/bar", "bar-service", 5000));
    cases.push_back({"default backend, host rule for internal load-balancer", {o, {sp[2], sp[3]}},
                     {F::Ingress, F::InternalIngress, F::HttpEnabled, F::HostBasedRouting, F::PathBasedRouting},
                     {B::ServicePort, B::InternalServicePort, B::Neg, B::CloudIap, B::CookieAffinity,
                      B::BackendConnectionDraining}});
  }
  return cases;
}

/// Registry key used by the reconciler: "<namespace>/<name>".
inline std::string key_of(const model::RoutingObjectState& s) {
  return s.object.ns + "/" + s.object.name;
}

} // namespace tally::testing
