// ECSIG - ASN.1 DER Signature Encoding
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Encodes and decodes ECDSA signatures as
//
//   30 <len> 02 <rlen> <r> 02 <slen> <s>
//
// Each INTEGER uses the minimal two's-complement encoding: leading zero
// bytes are stripped, and a single 0x00 byte is prepended when the first
// remaining byte has its high bit set. Lengths use the DER short form
// below 128 and the long form (0x80 | n, n big-endian bytes) above.
//
// Decoding is strict DER. BER leniencies (indefinite lengths, padded
// lengths, redundant leading zeros) are rejected.

#ifndef ECSIG_CRYPTO_DER_H
#define ECSIG_CRYPTO_DER_H

#include "ecsig/core/hex.h"
#include "ecsig/core/types.h"
#include "ecsig/crypto/curve.h"
#include "ecsig/crypto/sigerror.h"

#include <array>
#include <cstddef>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ecsig {

// ============================================================================
// Constants and Size Bounds
// ============================================================================

namespace der {

/// ASN.1 universal tags used by ECDSA signatures
constexpr Byte TAG_INTEGER = 0x02;
constexpr Byte TAG_SEQUENCE = 0x30;

/// Bit marking a long-form length byte
constexpr Byte LONG_FORM = 0x80;

/// Largest number of length octets accepted by the decoder
constexpr size_t MAX_LENGTH_OCTETS = sizeof(size_t);

/// Number of bytes needed to encode a DER length field
constexpr size_t LengthSize(size_t length) {
    if (length < 0x80) {
        return 1;
    }
    size_t octets = 0;
    while (length != 0) {
        ++octets;
        length >>= 8;
    }
    return 1 + octets;
}

} // namespace der

/// Worst-case size of one INTEGER TLV holding an elementSize-byte scalar
/// (tag, length, one sign-padding byte, value)
constexpr size_t MaxDerIntegerSize(size_t elementSize) {
    return 1 + der::LengthSize(elementSize + 1) + elementSize + 1;
}

/// Worst-case size of a DER signature for the given element size.
/// 72 bytes for 256-bit curves, 141 bytes for P-521.
constexpr size_t MaxDerSize(size_t elementSize) {
    return 1 + der::LengthSize(2 * MaxDerIntegerSize(elementSize)) +
           2 * MaxDerIntegerSize(elementSize);
}

/// Worst-case number of bytes DER framing adds to the two raw scalars
constexpr size_t MaxDerOverhead(size_t elementSize) {
    return MaxDerSize(elementSize) - 2 * elementSize;
}

// ============================================================================
// Encoding Primitives
// ============================================================================

/// Position of the r and s values inside an encoded signature.
/// Offsets point past any sign-padding byte.
struct DerSignatureLayout {
    size_t rOffset{0};
    size_t rLength{0};
    size_t sOffset{0};
    size_t sLength{0};
};

/**
 * Encode a DER length field.
 *
 * @param length Length to encode
 * @param out Output buffer with room for der::LengthSize(length) bytes
 * @return Number of bytes written
 */
size_t EncodeDerLength(size_t length, Byte* out);

/**
 * Decode a strict DER length field.
 *
 * Rejects the indefinite form (0x80), long forms with leading zero
 * octets, long forms encoding a value below 128, and fields running past
 * the end of the buffer.
 *
 * @return (length, bytes consumed), or nullopt if malformed
 */
std::optional<std::pair<size_t, size_t>> DecodeDerLength(const Byte* data, size_t len);

/// Strip leading zero bytes from a big-endian unsigned integer, keeping
/// at least one byte
Span<const Byte> StripLeadingZeros(Span<const Byte> value);

/**
 * Encode an unsigned big-endian integer as a minimal DER INTEGER TLV.
 *
 * @param value Big-endian magnitude, any number of leading zeros
 * @param out Output buffer with room for the encoded TLV
 * @return Number of bytes written
 */
size_t EncodeDerInteger(Span<const Byte> value, Byte* out);

/**
 * Encode SEQUENCE { INTEGER r, INTEGER s }.
 *
 * @param r Big-endian r
 * @param s Big-endian s
 * @param out Output buffer with room for MaxDerSize(max(r.size(), s.size()))
 * @param layout If non-null, receives the value positions
 * @return Number of bytes written
 */
size_t EncodeDerSignature(Span<const Byte> r, Span<const Byte> s,
                          Byte* out, DerSignatureLayout* layout = nullptr);

/**
 * Parse and validate a DER signature.
 *
 * @param data Encoded signature
 * @param len Length of data
 * @param elementSize Maximum scalar width in bytes
 * @param error If non-null, receives the failure reason
 * @return Value positions, or nullopt if the encoding is rejected
 */
std::optional<DerSignatureLayout> ParseDerSignature(const Byte* data, size_t len,
                                                    size_t elementSize,
                                                    SignatureError* error = nullptr);

// ============================================================================
// DerSignature
// ============================================================================

/**
 * An ECDSA signature in ASN.1 DER form for a given curve.
 *
 * Storage is an inline buffer of MaxDerSize() bytes; only the first
 * size() bytes are meaningful. Instances are always well formed: they
 * come either from FromScalars() or from a successful Parse().
 */
template<typename Curve>
class DerSignature {
public:
    /// Worst-case encoded size for this curve
    static constexpr size_t MAX_SIZE = MaxDerSize(Curve::ELEMENT_SIZE);

    /// Fixed-size representation this converts to
    using FixedBytes = std::array<Byte, SignatureSize<Curve>()>;

    /// Encode from the fixed-size scalar halves
    static DerSignature FromScalars(const ElementBytes<Curve>& r,
                                    const ElementBytes<Curve>& s) {
        return FromScalars(Span<const Byte>(r), Span<const Byte>(s));
    }

    /// Encode from scalar views of at most ELEMENT_SIZE bytes each.
    /// Throws std::invalid_argument for wider inputs.
    static DerSignature FromScalars(Span<const Byte> r, Span<const Byte> s) {
        if (r.size() > Curve::ELEMENT_SIZE || s.size() > Curve::ELEMENT_SIZE) {
            throw std::invalid_argument("Scalar wider than curve element size");
        }
        DerSignature sig;
        sig.size_ = EncodeDerSignature(r, s, sig.bytes_.data(), &sig.layout_);
        return sig;
    }

    /// Parse a DER-encoded signature
    static std::optional<DerSignature> Parse(const Byte* data, size_t len,
                                             SignatureError* error = nullptr) {
        auto layout = ParseDerSignature(data, len, Curve::ELEMENT_SIZE, error);
        if (!layout) {
            return std::nullopt;
        }
        DerSignature sig;
        std::memcpy(sig.bytes_.data(), data, len);
        sig.size_ = len;
        sig.layout_ = *layout;
        return sig;
    }

    static std::optional<DerSignature> Parse(const std::vector<Byte>& data,
                                             SignatureError* error = nullptr) {
        return Parse(data.data(), data.size(), error);
    }

    /// Parse from a hex string; invalid hex is reported as MALFORMED_DER
    static std::optional<DerSignature> FromHex(const std::string& hex,
                                               SignatureError* error = nullptr) {
        if (!IsValidHex(hex)) {
            SetSignatureError(error, SignatureError::MALFORMED_DER);
            return std::nullopt;
        }
        return Parse(HexToBytes(hex), error);
    }

    /// Encoded bytes
    Span<const Byte> AsBytes() const { return Span<const Byte>(bytes_.data(), size_); }
    const Byte* data() const { return bytes_.data(); }
    size_t size() const { return size_; }
    std::vector<Byte> ToVector() const { return AsBytes().ToVector(); }
    std::string ToHex() const { return BytesToHex(bytes_.data(), size_); }

    /// r value without sign padding (1 to ELEMENT_SIZE bytes)
    Span<const Byte> R() const {
        return Span<const Byte>(bytes_.data() + layout_.rOffset, layout_.rLength);
    }

    /// s value without sign padding (1 to ELEMENT_SIZE bytes)
    Span<const Byte> S() const {
        return Span<const Byte>(bytes_.data() + layout_.sOffset, layout_.sLength);
    }

    /// Right-align r and s into the fixed-size r || s layout
    FixedBytes ToFixedBytes() const {
        FixedBytes fixed{};
        const size_t n = Curve::ELEMENT_SIZE;
        std::memcpy(fixed.data() + (n - layout_.rLength), R().data(), layout_.rLength);
        std::memcpy(fixed.data() + n + (n - layout_.sLength), S().data(), layout_.sLength);
        return fixed;
    }

    bool operator==(const DerSignature& other) const {
        return size_ == other.size_ &&
               std::memcmp(bytes_.data(), other.bytes_.data(), size_) == 0;
    }
    bool operator!=(const DerSignature& other) const { return !(*this == other); }

private:
    DerSignature() = default;

    std::array<Byte, MAX_SIZE> bytes_{};
    size_t size_{0};
    DerSignatureLayout layout_;
};

} // namespace ecsig

#endif // ECSIG_CRYPTO_DER_H
