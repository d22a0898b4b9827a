// ECSIG - Signature Error Codes
// Copyright (c) 2024 ECSIG Developers
// MIT License

#ifndef ECSIG_CRYPTO_SIGERROR_H
#define ECSIG_CRYPTO_SIGERROR_H

#include <string>

namespace ecsig {

// ============================================================================
// Signature Error Codes
// ============================================================================

/// Error codes reported by the signature codecs.
/// Every failure reflects malformed caller data; none is fatal.
enum class SignatureError {
    OK = 0,
    
    /// Fixed-size input is not exactly 2 * element size bytes
    LENGTH_MISMATCH,
    
    /// Wrong tag, bad length, truncation, trailing bytes,
    /// non-minimal or negative INTEGER
    MALFORMED_DER,
    
    /// Integer does not fit the curve's element size, or the bytes
    /// are not a valid scalar for the curve
    VALUE_OUT_OF_RANGE,
};

/// Convert error to string
std::string SignatureErrorString(SignatureError err);

/// Store an error into an optional out-parameter
inline void SetSignatureError(SignatureError* out, SignatureError err) {
    if (out) *out = err;
}

} // namespace ecsig

#endif // ECSIG_CRYPTO_SIGERROR_H
