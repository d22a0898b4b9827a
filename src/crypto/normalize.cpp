// ECSIG - Low-S Normalization Implementation
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include "ecsig/crypto/normalize.h"
#include "ecsig/core/hex.h"
#include "ecsig/util/logging.h"

#include <openssl/bn.h>

#include <memory>
#include <new>
#include <stdexcept>

namespace ecsig {

namespace {

struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

BignumPtr BignumFromBytes(const Byte* data, size_t len) {
    BignumPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

std::vector<Byte> BignumToBytes(const BIGNUM* bn, size_t width) {
    std::vector<Byte> out(width);
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(width)) < 0) {
        throw std::runtime_error("BIGNUM does not fit in output width");
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// ScalarNormalizer
// ============================================================================

std::optional<bool> ScalarNormalizer::IsLow(Span<const Byte> scalar) const {
    std::vector<Byte> copy = scalar.ToVector();
    auto wasHigh = NormalizeLow(Span<Byte>(copy));
    if (!wasHigh) {
        return std::nullopt;
    }
    return !*wasHigh;
}

// ============================================================================
// BignumNormalizer
// ============================================================================

BignumNormalizer::BignumNormalizer(Span<const Byte> order)
    : elementSize_(order.size()) {
    if (order.empty()) {
        throw std::invalid_argument("Curve order must not be empty");
    }
    
    BignumPtr n = BignumFromBytes(order.data(), order.size());
    if (BN_is_zero(n.get())) {
        throw std::invalid_argument("Curve order must not be zero");
    }
    
    BignumPtr half(BN_new());
    if (!half || BN_rshift1(half.get(), n.get()) != 1) {
        throw std::runtime_error("Failed to compute half order");
    }
    
    order_ = n.release();
    halfOrder_ = half.release();
}

BignumNormalizer::~BignumNormalizer() {
    BN_free(halfOrder_);
    BN_free(order_);
}

std::optional<bool> BignumNormalizer::NormalizeLow(Span<Byte> scalar) const {
    if (scalar.size() != elementSize_) {
        LOG_DEBUG(util::LogCategory::NORMALIZE)
            << "Scalar width " << scalar.size() << " does not match " << elementSize_;
        return std::nullopt;
    }
    
    BignumPtr s = BignumFromBytes(scalar.data(), scalar.size());
    
    if (BN_cmp(s.get(), order_) >= 0) {
        LOG_DEBUG(util::LogCategory::NORMALIZE)
            << "Scalar is not below the group order: " << BytesToHex(scalar.data(), scalar.size());
        return std::nullopt;
    }
    
    // Not constant time; s is public
    if (BN_cmp(s.get(), halfOrder_) <= 0) {
        return false;
    }
    
    if (BN_sub(s.get(), order_, s.get()) != 1) {
        throw std::runtime_error("BN_sub failed");
    }
    if (BN_bn2binpad(s.get(), scalar.data(), static_cast<int>(scalar.size())) < 0) {
        throw std::runtime_error("Normalized scalar does not fit");
    }
    
    LOG_TRACE(util::LogCategory::NORMALIZE) << "Replaced high S with n - s";
    return true;
}

std::vector<Byte> BignumNormalizer::Order() const {
    return BignumToBytes(order_, elementSize_);
}

std::vector<Byte> BignumNormalizer::HalfOrder() const {
    return BignumToBytes(halfOrder_, elementSize_);
}

} // namespace ecsig
