// ECSIG - Signature Error Codes
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include "ecsig/crypto/sigerror.h"

namespace ecsig {

std::string SignatureErrorString(SignatureError err) {
    switch (err) {
        case SignatureError::OK: return "No error";
        case SignatureError::LENGTH_MISMATCH: return "Signature length does not match curve";
        case SignatureError::MALFORMED_DER: return "Malformed DER signature";
        case SignatureError::VALUE_OUT_OF_RANGE: return "Scalar value out of range for curve";
        default: return "Unknown error";
    }
}

} // namespace ecsig
