// ECSIG - Curve Parameters
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include "ecsig/crypto/curve.h"

#include <algorithm>
#include <cctype>

namespace ecsig {

namespace {

struct CurveAlias {
    const char* alias;
    const char* name;
};

// Lowercase aliases, punctuation removed
const CurveAlias CURVE_ALIASES[] = {
    {"secp256k1", Secp256k1::NAME},
    {"k256", Secp256k1::NAME},
    {"p256", NistP256::NAME},
    {"secp256r1", NistP256::NAME},
    {"prime256v1", NistP256::NAME},
    {"p384", NistP384::NAME},
    {"secp384r1", NistP384::NAME},
    {"p521", NistP521::NAME},
    {"secp521r1", NistP521::NAME},
};

std::string NormalizeCurveKey(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

} // anonymous namespace

std::string CanonicalCurveName(const std::string& name) {
    std::string key = NormalizeCurveKey(name);
    for (const auto& entry : CURVE_ALIASES) {
        if (key == entry.alias) {
            return entry.name;
        }
    }
    return "";
}

std::vector<std::string> SupportedCurveNames() {
    return {Secp256k1::NAME, NistP256::NAME, NistP384::NAME, NistP521::NAME};
}

} // namespace ecsig
