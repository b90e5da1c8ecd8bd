/**
 * @file feature.cpp
 * @brief Export labels for the feature vocabularies.
 */
#include "tally/features/feature.hpp"

namespace tally::features {

std::string_view label(FrontendFeature f) noexcept {
    switch (f) {
        case FrontendFeature::Ingress:                return "Ingress";
        case FrontendFeature::ExternalIngress:        return "ExternalIngress";
        case FrontendFeature::InternalIngress:        return "InternalIngress";
        case FrontendFeature::HttpEnabled:            return "HTTPEnabled";
        case FrontendFeature::HostBasedRouting:       return "HostBasedRouting";
        case FrontendFeature::PathBasedRouting:       return "PathBasedRouting";
        case FrontendFeature::TlsTermination:         return "TLSTermination";
        case FrontendFeature::SecretBasedCertsForTls: return "SecretBasedCertsForTLS";
        case FrontendFeature::PreSharedCertsForTls:   return "PreSharedCertsForTLS";
        case FrontendFeature::ManagedCertsForTls:     return "ManagedCertsForTLS";
        case FrontendFeature::StaticGlobalIp:         return "StaticGlobalIP";
    }
    return "Unknown";
}

std::string_view label(BackendFeature f) noexcept {
    switch (f) {
        case BackendFeature::ServicePort:               return "L7LBServicePort";
        case BackendFeature::ExternalServicePort:       return "L7XLBServicePort";
        case BackendFeature::InternalServicePort:       return "L7ILBServicePort";
        case BackendFeature::Neg:                       return "NEG";
        case BackendFeature::CloudCdn:                  return "CloudCDN";
        case BackendFeature::CloudIap:                  return "CloudIAP";
        case BackendFeature::CookieAffinity:            return "CookieAffinity";
        case BackendFeature::ClientIpAffinity:          return "ClientIPAffinity";
        case BackendFeature::CloudArmor:                return "CloudArmor";
        case BackendFeature::BackendConnectionDraining: return "BackendConnectionDraining";
        case BackendFeature::BackendTimeout:            return "BackendTimeout";
        case BackendFeature::CustomRequestHeaders:      return "CustomRequestHeaders";
    }
    return "Unknown";
}

std::string_view label(NegFeature f) noexcept {
    switch (f) {
        case NegFeature::StandaloneNeg: return "StandaloneNEG";
        case NegFeature::IngressNeg:    return "IngressNEG";
        case NegFeature::AsmNeg:        return "AsmNEG";
        case NegFeature::Neg:           return "NEG";
    }
    return "Unknown";
}

} // namespace tally::features
