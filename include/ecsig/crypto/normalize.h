// ECSIG - Low-S Normalization
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// ECDSA signatures (r, s) and (r, n - s) verify against the same message
// and key. Normalizing s into the lower half of the scalar field picks one
// of the two deterministically (BIP 62 "low S").
//
// All values handled here are public signature components, so the
// comparisons run in variable time.

#ifndef ECSIG_CRYPTO_NORMALIZE_H
#define ECSIG_CRYPTO_NORMALIZE_H

#include "ecsig/core/types.h"

#include <cstddef>
#include <optional>
#include <vector>

struct bignum_st;

namespace ecsig {

// ============================================================================
// Scalar Normalizer Interface
// ============================================================================

/**
 * Scalar-field capability consumed by Signature::NormalizeS().
 *
 * Implementations own the curve order; the codecs never do arithmetic
 * themselves.
 */
class ScalarNormalizer {
public:
    virtual ~ScalarNormalizer() = default;
    
    /// Byte width of a serialized scalar
    virtual size_t ElementSize() const = 0;
    
    /**
     * Normalize a big-endian scalar to the lower half of the field.
     *
     * If s > n / 2 the bytes are rewritten in place to n - s.
     *
     * @param scalar ElementSize() bytes, big-endian
     * @return true if the scalar was high and has been rewritten,
     *         false if it was already low (bytes untouched),
     *         nullopt if the bytes are not a valid scalar (s >= n or
     *         wrong width)
     */
    virtual std::optional<bool> NormalizeLow(Span<Byte> scalar) const = 0;
    
    /// Check whether a scalar is already in the lower half.
    /// Returns nullopt for invalid scalars.
    std::optional<bool> IsLow(Span<const Byte> scalar) const;
};

// ============================================================================
// BIGNUM-backed Normalizer
// ============================================================================

/**
 * ScalarNormalizer over OpenSSL BIGNUM arithmetic.
 *
 * Works for any order, including orders whose byte width is not a
 * multiple of the limb size (P-521) and toy orders used in tests.
 */
class BignumNormalizer : public ScalarNormalizer {
public:
    /// Construct from a big-endian, non-zero group order.
    /// Throws std::invalid_argument for an empty or zero order.
    explicit BignumNormalizer(Span<const Byte> order);
    ~BignumNormalizer() override;
    
    // Non-copyable
    BignumNormalizer(const BignumNormalizer&) = delete;
    BignumNormalizer& operator=(const BignumNormalizer&) = delete;
    
    size_t ElementSize() const override { return elementSize_; }
    std::optional<bool> NormalizeLow(Span<Byte> scalar) const override;
    
    /// Group order n, ElementSize() bytes
    std::vector<Byte> Order() const;
    
    /// floor(n / 2), ElementSize() bytes
    std::vector<Byte> HalfOrder() const;

private:
    size_t elementSize_;
    bignum_st* order_{nullptr};
    bignum_st* halfOrder_{nullptr};
};

/// Shared normalizer for a curve traits type
template<typename Curve>
const BignumNormalizer& CurveNormalizer() {
    static const BignumNormalizer normalizer{Span<const Byte>(Curve::ORDER)};
    return normalizer;
}

} // namespace ecsig

#endif // ECSIG_CRYPTO_NORMALIZE_H
