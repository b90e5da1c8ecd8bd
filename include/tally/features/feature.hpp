#pragma once
/**
 * @file feature.hpp
 * @brief Closed feature vocabularies used for adoption counting.
 * @details Each tag maps to a stable export label (see label()). The
 *          ALL_* arrays enumerate a vocabulary in declaration order and are
 *          used to zero-initialize count maps.
 */

#include <array>
#include <cstdint>
#include <string_view>

namespace tally::features {

/**
 * @enum FrontendFeature
 * @brief Capabilities of a routing object.
 */
enum class FrontendFeature : uint8_t {
    Ingress,                ///< Every routing object
    ExternalIngress,        ///< External load balancer class
    InternalIngress,        ///< Internal load balancer class
    HttpEnabled,            ///< Plain HTTP frontend not disabled
    HostBasedRouting,       ///< At least one rule with a host
    PathBasedRouting,       ///< At least one rule with a path entry
    TlsTermination,         ///< Any certificate source configured
    SecretBasedCertsForTls, ///< TLS section names a secret
    PreSharedCertsForTls,   ///< Pre-shared certificate annotation
    ManagedCertsForTls,     ///< Managed certificate annotation
    StaticGlobalIp          ///< Reserved static address annotation
};

/**
 * @enum BackendFeature
 * @brief Capabilities of a distinct backend (service port).
 */
enum class BackendFeature : uint8_t {
    ServicePort,
    ExternalServicePort,
    InternalServicePort,
    Neg,
    CloudCdn,
    CloudIap,
    CookieAffinity,
    ClientIpAffinity,
    CloudArmor,
    BackendConnectionDraining,
    BackendTimeout,
    CustomRequestHeaders
};

/**
 * @enum NegFeature
 * @brief Network endpoint group origins; `Neg` is the combined total.
 */
enum class NegFeature : uint8_t {
    StandaloneNeg,
    IngressNeg,
    AsmNeg,
    Neg
};

inline constexpr std::array<FrontendFeature, 11> ALL_FRONTEND_FEATURES{
    FrontendFeature::Ingress,
    FrontendFeature::ExternalIngress,
    FrontendFeature::InternalIngress,
    FrontendFeature::HttpEnabled,
    FrontendFeature::HostBasedRouting,
    FrontendFeature::PathBasedRouting,
    FrontendFeature::TlsTermination,
    FrontendFeature::SecretBasedCertsForTls,
    FrontendFeature::PreSharedCertsForTls,
    FrontendFeature::ManagedCertsForTls,
    FrontendFeature::StaticGlobalIp,
};

inline constexpr std::array<BackendFeature, 12> ALL_BACKEND_FEATURES{
    BackendFeature::ServicePort,
    BackendFeature::ExternalServicePort,
    BackendFeature::InternalServicePort,
    BackendFeature::Neg,
    BackendFeature::CloudCdn,
    BackendFeature::CloudIap,
    BackendFeature::CookieAffinity,
    BackendFeature::ClientIpAffinity,
    BackendFeature::CloudArmor,
    BackendFeature::BackendConnectionDraining,
    BackendFeature::BackendTimeout,
    BackendFeature::CustomRequestHeaders,
};

/// Backend features also counted per routing object (every backend feature
/// except the service port kind tags).
inline constexpr std::array<BackendFeature, 9> OBJECT_BACKEND_FEATURES{
    BackendFeature::Neg,
    BackendFeature::CloudCdn,
    BackendFeature::CloudIap,
    BackendFeature::CookieAffinity,
    BackendFeature::ClientIpAffinity,
    BackendFeature::CloudArmor,
    BackendFeature::BackendConnectionDraining,
    BackendFeature::BackendTimeout,
    BackendFeature::CustomRequestHeaders,
};

inline constexpr std::array<NegFeature, 4> ALL_NEG_FEATURES{
    NegFeature::StandaloneNeg,
    NegFeature::IngressNeg,
    NegFeature::AsmNeg,
    NegFeature::Neg,
};

/// Export label of a tag (e.g. "HostBasedRouting", "L7ILBServicePort").
std::string_view label(FrontendFeature f) noexcept;
std::string_view label(BackendFeature f) noexcept;
std::string_view label(NegFeature f) noexcept;

} // namespace tally::features
