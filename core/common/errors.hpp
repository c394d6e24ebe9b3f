#pragma once

#include <stdexcept>
#include <string>

namespace eap {

// ─── Error Taxonomy ───────────────────────────────────────────
// Every failure surfaced by the core derives from EapError.
// Nothing is retried.

class EapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid configuration detected before any model execution:
/// bad ig_steps, mismatched batch shapes, out-of-bounds layer/head.
class ConfigurationError : public EapError {
public:
    using EapError::EapError;
};

/// The model collaborator did not record an activation or gradient
/// that attribution or evaluation depends on.
class CaptureError : public EapError {
public:
    using EapError::EapError;
};

} // namespace eap
