// ECSIG - Curve Parameters
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Compile-time descriptions of the curves whose signatures ECSIG handles.
// A curve traits type provides:
//   NAME          printable name
//   ELEMENT_SIZE  byte length of one scalar / field element
//   ORDER         scalar field order n, big-endian, ELEMENT_SIZE bytes
//
// Any type with these members can parameterize Signature<> and
// DerSignature<>, including curves declared outside this library.

#ifndef ECSIG_CRYPTO_CURVE_H
#define ECSIG_CRYPTO_CURVE_H

#include "ecsig/core/types.h"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace ecsig {

// ============================================================================
// Built-in Curves
// ============================================================================

/// secp256k1 (SEC 2)
struct Secp256k1 {
    static constexpr const char* NAME = "secp256k1";
    static constexpr size_t ELEMENT_SIZE = 32;
    static constexpr std::array<Byte, ELEMENT_SIZE> ORDER = {{
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
        0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
        0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
    }};
};

/// NIST P-256 (secp256r1)
struct NistP256 {
    static constexpr const char* NAME = "P-256";
    static constexpr size_t ELEMENT_SIZE = 32;
    static constexpr std::array<Byte, ELEMENT_SIZE> ORDER = {{
        0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xBC, 0xE6, 0xFA, 0xAD, 0xA7, 0x17, 0x9E, 0x84,
        0xF3, 0xB9, 0xCA, 0xC2, 0xFC, 0x63, 0x25, 0x51
    }};
};

/// NIST P-384 (secp384r1)
struct NistP384 {
    static constexpr const char* NAME = "P-384";
    static constexpr size_t ELEMENT_SIZE = 48;
    static constexpr std::array<Byte, ELEMENT_SIZE> ORDER = {{
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xC7, 0x63, 0x4D, 0x81, 0xF4, 0x37, 0x2D, 0xDF,
        0x58, 0x1A, 0x0D, 0xB2, 0x48, 0xB0, 0xA7, 0x7A,
        0xEC, 0xEC, 0x19, 0x6A, 0xCC, 0xC5, 0x29, 0x73
    }};
};

/// NIST P-521 (secp521r1). The 521-bit order occupies 66 bytes.
struct NistP521 {
    static constexpr const char* NAME = "P-521";
    static constexpr size_t ELEMENT_SIZE = 66;
    static constexpr std::array<Byte, ELEMENT_SIZE> ORDER = {{
        0x01, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0xFF, 0xFA, 0x51, 0x86, 0x87, 0x83, 0xBF, 0x2F,
        0x96, 0x6B, 0x7F, 0xCC, 0x01, 0x48, 0xF7, 0x09,
        0xA5, 0xD0, 0x3B, 0xB5, 0xC9, 0xB8, 0x89, 0x9C,
        0x47, 0xAE, 0xBB, 0x6F, 0xB7, 0x1E, 0x91, 0x38,
        0x64, 0x09
    }};
};

// ============================================================================
// Derived Types
// ============================================================================

/// One serialized scalar for the given curve
template<typename Curve>
using ElementBytes = std::array<Byte, Curve::ELEMENT_SIZE>;

/// Size of a fixed-size signature for the given curve
template<typename Curve>
constexpr size_t SignatureSize() {
    return 2 * Curve::ELEMENT_SIZE;
}

// ============================================================================
// Runtime Curve Selection
// ============================================================================

/// Resolve a user-supplied curve name or alias ("p256", "prime256v1",
/// "secp256r1", ...) to the NAME of a built-in curve.
/// Returns an empty string for unknown curves.
std::string CanonicalCurveName(const std::string& name);

/// Names of all built-in curves
std::vector<std::string> SupportedCurveNames();

/// Invoke fn with a value of the built-in curve type named by `name`.
/// Returns false if the name is unknown.
template<typename Fn>
bool WithCurveByName(const std::string& name, Fn&& fn) {
    std::string canonical = CanonicalCurveName(name);
    if (canonical == Secp256k1::NAME) {
        fn(Secp256k1{});
    } else if (canonical == NistP256::NAME) {
        fn(NistP256{});
    } else if (canonical == NistP384::NAME) {
        fn(NistP384{});
    } else if (canonical == NistP521::NAME) {
        fn(NistP521{});
    } else {
        return false;
    }
    return true;
}

} // namespace ecsig

#endif // ECSIG_CRYPTO_CURVE_H
