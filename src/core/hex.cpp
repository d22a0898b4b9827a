// ECSIG - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include "ecsig/core/hex.h"

namespace ecsig {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
    
    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
    
    std::string StripHexInput(const std::string& str) {
        const char* whitespace = " \t\r\n";
        size_t start = str.find_first_not_of(whitespace);
        if (start == std::string::npos) {
            return "";
        }
        size_t end = str.find_last_not_of(whitespace);
        std::string result = str.substr(start, end - start + 1);
        if (result.size() >= 2 && result[0] == '0' &&
            (result[1] == 'x' || result[1] == 'X')) {
            result.erase(0, 2);
        }
        return result;
    }
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    
    return result;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& input) {
    std::string hex = StripHexInput(input);
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }
    
    std::vector<HexByte> result;
    result.reserve(hex.length() / 2);
    
    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);
        
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        
        result.push_back(static_cast<HexByte>((high << 4) | low));
    }
    
    return result;
}

bool IsValidHex(const std::string& input) {
    std::string hex = StripHexInput(input);
    if (hex.empty() || hex.length() % 2 != 0) {
        return false;
    }
    
    for (char c : hex) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }
    
    return true;
}

} // namespace ecsig
