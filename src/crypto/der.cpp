// ECSIG - ASN.1 DER Signature Encoding Implementation
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include "ecsig/crypto/der.h"
#include "ecsig/util/logging.h"

#include <cstring>

namespace ecsig {

namespace {

/// Log the reason for a rejected encoding and report it
std::nullopt_t Reject(SignatureError* error, SignatureError code, const char* reason) {
    LOG_DEBUG(util::LogCategory::DER) << "Rejecting DER signature: " << reason;
    SetSignatureError(error, code);
    return std::nullopt;
}

/// A decoded INTEGER value with sign padding removed
struct IntegerValue {
    size_t offset;      // position of the first value byte
    size_t length;      // number of value bytes
    size_t next;        // position just past the TLV
};

/**
 * Parse one INTEGER TLV starting at `pos`, bounded by `end`.
 * On failure returns nullopt and sets `error`.
 */
std::optional<IntegerValue> ParseInteger(const Byte* data, size_t pos, size_t end,
                                         size_t elementSize, SignatureError* error) {
    if (pos >= end) {
        return Reject(error, SignatureError::MALFORMED_DER, "missing INTEGER");
    }
    if (data[pos] != der::TAG_INTEGER) {
        return Reject(error, SignatureError::MALFORMED_DER, "expected INTEGER tag");
    }
    ++pos;

    auto length = DecodeDerLength(data + pos, end - pos);
    if (!length) {
        return Reject(error, SignatureError::MALFORMED_DER, "bad INTEGER length");
    }
    pos += length->second;
    size_t valueLen = length->first;

    if (valueLen == 0) {
        return Reject(error, SignatureError::MALFORMED_DER, "empty INTEGER");
    }
    if (valueLen > end - pos) {
        return Reject(error, SignatureError::MALFORMED_DER, "INTEGER runs past end");
    }

    const Byte* value = data + pos;

    // Negative numbers are not valid scalars
    if (value[0] & 0x80) {
        return Reject(error, SignatureError::MALFORMED_DER, "negative INTEGER");
    }

    // A leading zero is only allowed when it is the sign padding for a
    // following byte with the high bit set
    IntegerValue result{pos, valueLen, pos + valueLen};
    if (valueLen > 1 && value[0] == 0x00) {
        if (!(value[1] & 0x80)) {
            return Reject(error, SignatureError::MALFORMED_DER, "non-minimal INTEGER");
        }
        ++result.offset;
        --result.length;
    }

    if (result.length > elementSize) {
        return Reject(error, SignatureError::VALUE_OUT_OF_RANGE,
                      "INTEGER wider than curve element");
    }

    return result;
}

/// An encoded INTEGER TLV and where its value starts
struct EncodedInteger {
    size_t size;          // bytes written
    size_t valueOffset;   // offset of the value past any sign padding
    size_t valueLength;
};

/// Content length of the INTEGER encoding of `value`, sign padding included
size_t IntegerContentSize(Span<const Byte> value) {
    Span<const Byte> minimal = StripLeadingZeros(value);
    if (minimal.empty()) {
        return 1;
    }
    return minimal.size() + ((minimal[0] & 0x80) ? 1 : 0);
}

/// Full TLV size of the INTEGER encoding of `value`
size_t IntegerTlvSize(Span<const Byte> value) {
    size_t contentLen = IntegerContentSize(value);
    return 1 + der::LengthSize(contentLen) + contentLen;
}

EncodedInteger EncodeInteger(Span<const Byte> value, Byte* out) {
    Span<const Byte> minimal = StripLeadingZeros(value);

    // Empty input encodes the value zero
    if (minimal.empty()) {
        out[0] = der::TAG_INTEGER;
        out[1] = 0x01;
        out[2] = 0x00;
        return {3, 2, 1};
    }

    bool needsPad = (minimal[0] & 0x80) != 0;
    size_t contentLen = minimal.size() + (needsPad ? 1 : 0);

    size_t pos = 0;
    out[pos++] = der::TAG_INTEGER;
    pos += EncodeDerLength(contentLen, out + pos);
    if (needsPad) {
        out[pos++] = 0x00;
    }
    size_t valueOffset = pos;
    std::memcpy(out + pos, minimal.data(), minimal.size());
    pos += minimal.size();
    return {pos, valueOffset, minimal.size()};
}

} // anonymous namespace

// ============================================================================
// Length Fields
// ============================================================================

size_t EncodeDerLength(size_t length, Byte* out) {
    if (length < 0x80) {
        out[0] = static_cast<Byte>(length);
        return 1;
    }

    size_t octets = der::LengthSize(length) - 1;
    out[0] = static_cast<Byte>(der::LONG_FORM | octets);
    for (size_t i = 0; i < octets; ++i) {
        out[octets - i] = static_cast<Byte>(length & 0xFF);
        length >>= 8;
    }
    return 1 + octets;
}

std::optional<std::pair<size_t, size_t>> DecodeDerLength(const Byte* data, size_t len) {
    if (len < 1) {
        return std::nullopt;
    }

    Byte first = data[0];
    if (first < der::LONG_FORM) {
        return std::make_pair(static_cast<size_t>(first), static_cast<size_t>(1));
    }

    // 0x80 alone is the BER indefinite form
    size_t octets = first & 0x7F;
    if (octets == 0 || octets > der::MAX_LENGTH_OCTETS) {
        return std::nullopt;
    }
    if (len < 1 + octets) {
        return std::nullopt;
    }
    // Minimal encoding: no leading zero octets
    if (data[1] == 0x00) {
        return std::nullopt;
    }

    size_t length = 0;
    for (size_t i = 0; i < octets; ++i) {
        length = (length << 8) | data[1 + i];
    }

    // Minimal encoding: short form must be used below 128
    if (length < 0x80) {
        return std::nullopt;
    }

    return std::make_pair(length, 1 + octets);
}

// ============================================================================
// Integers
// ============================================================================

Span<const Byte> StripLeadingZeros(Span<const Byte> value) {
    size_t skip = 0;
    while (skip + 1 < value.size() && value[skip] == 0x00) {
        ++skip;
    }
    return value.subspan(skip, value.size() - skip);
}

size_t EncodeDerInteger(Span<const Byte> value, Byte* out) {
    return EncodeInteger(value, out).size;
}

// ============================================================================
// Signatures
// ============================================================================

size_t EncodeDerSignature(Span<const Byte> r, Span<const Byte> s,
                          Byte* out, DerSignatureLayout* layout) {
    // The sequence header size depends on the combined integer length
    size_t contentLen = IntegerTlvSize(r) + IntegerTlvSize(s);

    size_t pos = 0;
    out[pos++] = der::TAG_SEQUENCE;
    pos += EncodeDerLength(contentLen, out + pos);

    EncodedInteger rInt = EncodeInteger(r, out + pos);
    EncodedInteger sInt = EncodeInteger(s, out + pos + rInt.size);

    if (layout) {
        layout->rOffset = pos + rInt.valueOffset;
        layout->rLength = rInt.valueLength;
        layout->sOffset = pos + rInt.size + sInt.valueOffset;
        layout->sLength = sInt.valueLength;
    }

    return pos + contentLen;
}

std::optional<DerSignatureLayout> ParseDerSignature(const Byte* data, size_t len,
                                                    size_t elementSize,
                                                    SignatureError* error) {
    if (len == 0) {
        return Reject(error, SignatureError::MALFORMED_DER, "empty input");
    }
    if (data[0] != der::TAG_SEQUENCE) {
        return Reject(error, SignatureError::MALFORMED_DER, "expected SEQUENCE tag");
    }

    auto seqLength = DecodeDerLength(data + 1, len - 1);
    if (!seqLength) {
        return Reject(error, SignatureError::MALFORMED_DER, "bad SEQUENCE length");
    }

    size_t pos = 1 + seqLength->second;
    if (seqLength->first > len - pos) {
        return Reject(error, SignatureError::MALFORMED_DER, "truncated SEQUENCE");
    }
    if (seqLength->first < len - pos) {
        return Reject(error, SignatureError::MALFORMED_DER, "trailing bytes after SEQUENCE");
    }
    size_t end = len;

    auto r = ParseInteger(data, pos, end, elementSize, error);
    if (!r) {
        return std::nullopt;
    }
    auto s = ParseInteger(data, r->next, end, elementSize, error);
    if (!s) {
        return std::nullopt;
    }
    if (s->next != end) {
        return Reject(error, SignatureError::MALFORMED_DER, "trailing bytes inside SEQUENCE");
    }

    DerSignatureLayout layout;
    layout.rOffset = r->offset;
    layout.rLength = r->length;
    layout.sOffset = s->offset;
    layout.sLength = s->length;

    SetSignatureError(error, SignatureError::OK);
    return layout;
}

} // namespace ecsig
