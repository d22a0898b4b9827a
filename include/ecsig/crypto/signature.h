// ECSIG - Fixed-Size ECDSA Signatures
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Fixed-size signatures are the two scalars serialized big-endian with no
// framing:
//
//   r: ELEMENT_SIZE bytes, big-endian
//   s: ELEMENT_SIZE bytes, big-endian
//
// For a curve with a 256-bit order (secp256k1, P-256) a signature is
// therefore 64 bytes. See der.h for the ASN.1 DER form.

#ifndef ECSIG_CRYPTO_SIGNATURE_H
#define ECSIG_CRYPTO_SIGNATURE_H

#include "ecsig/core/hex.h"
#include "ecsig/core/types.h"
#include "ecsig/crypto/curve.h"
#include "ecsig/crypto/der.h"
#include "ecsig/crypto/normalize.h"
#include "ecsig/crypto/sigerror.h"

#include <array>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace ecsig {

/**
 * A fixed-size ECDSA signature for the given curve.
 *
 * Always holds exactly 2 * ELEMENT_SIZE bytes. The scalars are not range
 * checked against the group order; an out-of-range value is representable
 * here and rejected by whoever verifies the signature.
 */
template<typename Curve>
class Signature {
public:
    /// Total size in bytes
    static constexpr size_t SIZE = SignatureSize<Curve>();

    /// Scalar size in bytes
    static constexpr size_t ELEMENT_SIZE = Curve::ELEMENT_SIZE;

    using Bytes = std::array<Byte, SIZE>;

    /// Construct directly from the r || s bytes
    explicit Signature(const Bytes& bytes) : bytes_(bytes) {}

    /// Convert from DER form
    explicit Signature(const DerSignature<Curve>& der) : bytes_(der.ToFixedBytes()) {}

    /// Create from the serialized r and s components
    static Signature FromScalars(const ElementBytes<Curve>& r, const ElementBytes<Curve>& s) {
        Bytes bytes;
        std::memcpy(bytes.data(), r.data(), ELEMENT_SIZE);
        std::memcpy(bytes.data() + ELEMENT_SIZE, s.data(), ELEMENT_SIZE);
        return Signature(bytes);
    }

    /**
     * Parse a fixed-size signature.
     *
     * @param data Signature bytes
     * @param len Must be exactly SIZE
     * @param error If non-null, receives LENGTH_MISMATCH on failure
     */
    static std::optional<Signature> FromBytes(const Byte* data, size_t len,
                                              SignatureError* error = nullptr) {
        if (len != SIZE) {
            SetSignatureError(error, SignatureError::LENGTH_MISMATCH);
            return std::nullopt;
        }
        Bytes bytes;
        std::memcpy(bytes.data(), data, SIZE);
        SetSignatureError(error, SignatureError::OK);
        return Signature(bytes);
    }

    static std::optional<Signature> FromBytes(const std::vector<Byte>& data,
                                              SignatureError* error = nullptr) {
        return FromBytes(data.data(), data.size(), error);
    }

    /**
     * Parse from hex.
     *
     * @throws std::invalid_argument if the text is not hex; a decoded
     *         length other than 2 * ELEMENT_SIZE is LENGTH_MISMATCH
     */
    static std::optional<Signature> FromHex(const std::string& hex,
                                            SignatureError* error = nullptr) {
        return FromBytes(HexToBytes(hex), error);
    }

    /// Parse an ASN.1 DER signature
    static std::optional<Signature> FromDer(const Byte* data, size_t len,
                                            SignatureError* error = nullptr) {
        auto der = DerSignature<Curve>::Parse(data, len, error);
        if (!der) {
            return std::nullopt;
        }
        return Signature(*der);
    }

    static std::optional<Signature> FromDer(const std::vector<Byte>& data,
                                            SignatureError* error = nullptr) {
        return FromDer(data.data(), data.size(), error);
    }

    /// Serialize as ASN.1 DER
    DerSignature<Curve> ToDer() const {
        return DerSignature<Curve>::FromScalars(R(), S());
    }

    /// The r component
    Span<const Byte> R() const { return Span<const Byte>(bytes_.data(), ELEMENT_SIZE); }

    /// The s component
    Span<const Byte> S() const { return Span<const Byte>(bytes_.data() + ELEMENT_SIZE, ELEMENT_SIZE); }

    /// Raw r || s bytes
    Span<const Byte> AsBytes() const { return Span<const Byte>(bytes_); }
    const Byte* data() const { return bytes_.data(); }
    static constexpr size_t size() { return SIZE; }
    const Bytes& GetBytes() const { return bytes_; }
    std::vector<Byte> ToVector() const { return std::vector<Byte>(bytes_.begin(), bytes_.end()); }

    std::string ToHex() const { return BytesToHex(bytes_); }

    /// Debug representation, e.g. "Signature<secp256k1>(0123...)"
    std::string ToString() const {
        return std::string("Signature<") + Curve::NAME + ">(" + ToHex() + ")";
    }

    /**
     * Normalize into "low S" form as described in BIP 62.
     *
     * Only the s half is ever rewritten.
     *
     * @param normalizer Scalar-field capability for this curve
     * @param error If non-null, receives VALUE_OUT_OF_RANGE when s is not
     *              a valid scalar
     * @return true if s was high and has been replaced by n - s, false if
     *         it was already low, nullopt if s is not a valid scalar
     */
    std::optional<bool> NormalizeS(const ScalarNormalizer& normalizer,
                                   SignatureError* error = nullptr) {
        auto wasHigh = normalizer.NormalizeLow(Span<Byte>(bytes_.data() + ELEMENT_SIZE, ELEMENT_SIZE));
        if (!wasHigh) {
            SetSignatureError(error, SignatureError::VALUE_OUT_OF_RANGE);
            return std::nullopt;
        }
        SetSignatureError(error, SignatureError::OK);
        return wasHigh;
    }

    /// Normalize using the curve's own order
    std::optional<bool> NormalizeS(SignatureError* error = nullptr) {
        return NormalizeS(CurveNormalizer<Curve>(), error);
    }

    /// Check for low S without modifying the signature
    std::optional<bool> IsLowS(const ScalarNormalizer& normalizer) const {
        return normalizer.IsLow(S());
    }

    std::optional<bool> IsLowS() const {
        return IsLowS(CurveNormalizer<Curve>());
    }

    /// Comparison is byte-wise over the full r || s buffer
    bool operator==(const Signature& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Signature& other) const { return !(*this == other); }
    bool operator<(const Signature& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace ecsig

#endif // ECSIG_CRYPTO_SIGNATURE_H
