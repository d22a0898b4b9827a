// ECSIG - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ECSIG Developers
// MIT License

#ifndef ECSIG_CORE_HEX_H
#define ECSIG_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace ecsig {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes.
/// Surrounding whitespace and an optional "0x" prefix are ignored.
/// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if HexToBytes() would accept the string and yield at least one byte
bool IsValidHex(const std::string& str);

} // namespace ecsig

#endif // ECSIG_CORE_HEX_H
