/**
 * @file classifier.cpp
 * @brief Frontend/backend feature rules.
 */
#include "tally/features/classifier.hpp"
#include "tally/config/constants.hpp"
#include "tally/util/logger.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

namespace tally::features {
using namespace tally::config::constants;
using tally::util::Logger;

namespace {

template <class F>
void append_unique(std::vector<F>& out, F f) {
    if (std::find(out.begin(), out.end(), f) == out.end()) out.push_back(f);
}

const std::string* find_annotation(const model::Annotations& a, std::string_view key) {
    auto it = a.find(key);
    return it == a.end() ? nullptr : &it->second;
}

// Accepts the same spellings as Go's strconv.ParseBool.
std::optional<bool> parse_bool(std::string_view v) noexcept {
    if (v == "1" || v == "t" || v == "T" || v == "true" || v == "TRUE" || v == "True")     return true;
    if (v == "0" || v == "f" || v == "F" || v == "false" || v == "FALSE" || v == "False")  return false;
    return std::nullopt;
}

bool http_enabled(const model::RoutingObject& obj) {
    const auto* v = find_annotation(obj.annotations, ANNOTATION_ALLOW_HTTP);
    if (!v) return true;
    const auto parsed = parse_bool(*v);
    if (!parsed) {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "{}/{}: unparseable {}='{}', treating HTTP as enabled",
                            obj.ns, obj.name, ANNOTATION_ALLOW_HTTP, *v);
        return true;
    }
    return *parsed;
}

} // namespace

FrontendFeatures classifyFrontend(const model::RoutingObject& obj) {
    FrontendFeatures out;
    out.reserve(ALL_FRONTEND_FEATURES.size());

    append_unique(out, FrontendFeature::Ingress);

    const auto* cls = find_annotation(obj.annotations, ANNOTATION_INGRESS_CLASS);
    if (cls && *cls == INGRESS_CLASS_INTERNAL) append_unique(out, FrontendFeature::InternalIngress);
    else                                       append_unique(out, FrontendFeature::ExternalIngress);

    if (http_enabled(obj)) append_unique(out, FrontendFeature::HttpEnabled);

    for (const auto& rule : obj.rules) {
        if (!rule.host.empty())  append_unique(out, FrontendFeature::HostBasedRouting);
    }
    for (const auto& rule : obj.rules) {
        if (!rule.paths.empty()) append_unique(out, FrontendFeature::PathBasedRouting);
    }

    // TLS: each certificate source is its own feature; termination is counted once.
    bool tls = false;
    if (find_annotation(obj.annotations, ANNOTATION_PRE_SHARED_CERT)) {
        append_unique(out, FrontendFeature::PreSharedCertsForTls);
        tls = true;
    }
    if (find_annotation(obj.annotations, ANNOTATION_MANAGED_CERTS)) {
        append_unique(out, FrontendFeature::ManagedCertsForTls);
        tls = true;
    }
    const bool has_secret = std::any_of(obj.tls.begin(), obj.tls.end(),
                                        [](const model::TlsEntry& t) { return !t.secret_name.empty(); });
    if (has_secret) {
        append_unique(out, FrontendFeature::SecretBasedCertsForTls);
        tls = true;
    }
    if (tls) append_unique(out, FrontendFeature::TlsTermination);

    if (find_annotation(obj.annotations, ANNOTATION_STATIC_IP)) append_unique(out, FrontendFeature::StaticGlobalIp);

    return out;
}

BackendFeatures classifyBackend(const model::Backend& backend) {
    BackendFeatures out;
    out.reserve(ALL_BACKEND_FEATURES.size());

    append_unique(out, BackendFeature::ServicePort);
    append_unique(out, backend.ilb_enabled ? BackendFeature::InternalServicePort
                                           : BackendFeature::ExternalServicePort);
    if (backend.neg_enabled) append_unique(out, BackendFeature::Neg);

    if (!backend.backend_config) return out;
    const auto& bc = *backend.backend_config;

    if (bc.cdn && bc.cdn->enabled) append_unique(out, BackendFeature::CloudCdn);
    if (bc.iap && bc.iap->enabled) append_unique(out, BackendFeature::CloudIap);
    if (bc.session_affinity) {
        const auto& type = bc.session_affinity->affinity_type;
        if (type == AFFINITY_GENERATED_COOKIE)  append_unique(out, BackendFeature::CookieAffinity);
        else if (type == AFFINITY_CLIENT_IP)    append_unique(out, BackendFeature::ClientIpAffinity);
    }
    if (bc.security_policy && !bc.security_policy->name.empty()) append_unique(out, BackendFeature::CloudArmor);
    if (bc.connection_draining)    append_unique(out, BackendFeature::BackendConnectionDraining);
    if (bc.timeout_sec)            append_unique(out, BackendFeature::BackendTimeout);
    if (bc.custom_request_headers) append_unique(out, BackendFeature::CustomRequestHeaders);

    return out;
}

} // namespace tally::features
