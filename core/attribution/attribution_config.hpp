#pragma once

#include <string>

namespace eap {

enum class AttributionMethod {
    Eap,              // gradient at the clean point
    EapIgInputs,      // gradients integrated along interpolated inputs
    CleanCorrupted    // mean of clean-point and corrupted-point gradients
};

const char* toString(AttributionMethod method);

/// Accepts "EAP", "EAP-IG", "EAP-IG-inputs", "clean-corrupted".
AttributionMethod parseAttributionMethod(const std::string& name);

/// Attribution run configuration.
struct AttributionConfig {
    AttributionMethod method = AttributionMethod::Eap;
    int ig_steps = 5;   // interpolation points, EapIgInputs only
};

/// Throws ConfigurationError for an unusable configuration.
void validateConfig(const AttributionConfig& config);

} // namespace eap
