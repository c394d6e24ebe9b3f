#include "attribution/attribution_config.hpp"
#include "common/errors.hpp"

namespace eap {

const char* toString(AttributionMethod method) {
    switch (method) {
        case AttributionMethod::Eap:            return "EAP";
        case AttributionMethod::EapIgInputs:    return "EAP-IG-inputs";
        case AttributionMethod::CleanCorrupted: return "clean-corrupted";
    }
    return "unknown";
}

AttributionMethod parseAttributionMethod(const std::string& name) {
    if (name == "EAP") return AttributionMethod::Eap;
    if (name == "EAP-IG" || name == "EAP-IG-inputs") return AttributionMethod::EapIgInputs;
    if (name == "clean-corrupted") return AttributionMethod::CleanCorrupted;
    throw ConfigurationError("Unknown attribution method: " + name);
}

void validateConfig(const AttributionConfig& config) {
    if (config.method == AttributionMethod::EapIgInputs && config.ig_steps < 1) {
        throw ConfigurationError("ig_steps must be at least 1 for " +
                                 std::string(toString(config.method)) + ", got " +
                                 std::to_string(config.ig_steps));
    }
}

} // namespace eap
