// ECSIG - OpenSSL Interoperability Tests
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Cross-checks the codecs against OpenSSL's own ECDSA_SIG encoder, its
// curve tables and real signatures produced by its EVP interface.

#include <gtest/gtest.h>

#include <ecsig/core/hex.h>
#include <ecsig/crypto/der.h>
#include <ecsig/crypto/signature.h>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace ecsig {
namespace {

struct EcdsaSigDeleter {
    void operator()(ECDSA_SIG* sig) const { ECDSA_SIG_free(sig); }
};
struct EcGroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

/// DER encoding of (r, s) produced by OpenSSL
std::vector<Byte> OpenSslEncode(Span<const Byte> r, Span<const Byte> s) {
    EcdsaSigPtr sig(ECDSA_SIG_new());
    BIGNUM* rBn = BN_bin2bn(r.data(), static_cast<int>(r.size()), nullptr);
    BIGNUM* sBn = BN_bin2bn(s.data(), static_cast<int>(s.size()), nullptr);
    if (!sig || !rBn || !sBn || ECDSA_SIG_set0(sig.get(), rBn, sBn) != 1) {
        BN_free(rBn);
        BN_free(sBn);
        ADD_FAILURE() << "ECDSA_SIG construction failed";
        return {};
    }

    int len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (len <= 0) {
        ADD_FAILURE() << "i2d_ECDSA_SIG failed";
        return {};
    }
    std::vector<Byte> out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_ECDSA_SIG(sig.get(), &p);
    return out;
}

/// Scalars decoded by OpenSSL, left-padded to width
bool OpenSslDecode(const std::vector<Byte>& der, size_t width,
                   std::vector<Byte>& r, std::vector<Byte>& s) {
    const unsigned char* p = der.data();
    EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
    if (!sig) {
        return false;
    }
    const BIGNUM* rBn = nullptr;
    const BIGNUM* sBn = nullptr;
    ECDSA_SIG_get0(sig.get(), &rBn, &sBn);

    r.assign(width, 0);
    s.assign(width, 0);
    return BN_bn2binpad(rBn, r.data(), static_cast<int>(width)) >= 0 &&
           BN_bn2binpad(sBn, s.data(), static_cast<int>(width)) >= 0;
}

template<typename Curve>
ElementBytes<Curve> RandomScalar(std::mt19937& rng) {
    std::uniform_int_distribution<int> byte(0, 255);
    ElementBytes<Curve> out;
    for (auto& b : out) {
        b = static_cast<Byte>(byte(rng));
    }
    // Exercise short encodings and sign padding as well as full width
    int shape = byte(rng) % 4;
    if (shape == 0) {
        std::fill(out.begin(), out.begin() + (byte(rng) % Curve::ELEMENT_SIZE), 0);
    } else if (shape == 1) {
        out[0] |= 0x80;
    }
    return out;
}

template<typename Curve>
void CheckOrder(int nid) {
    EcGroupPtr group(EC_GROUP_new_by_curve_name(nid));
    ASSERT_TRUE(group) << Curve::NAME;

    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    ASSERT_NE(order, nullptr);

    std::vector<Byte> expected(Curve::ELEMENT_SIZE);
    ASSERT_GE(BN_bn2binpad(order, expected.data(), static_cast<int>(expected.size())), 0);
    EXPECT_EQ(BytesToHex(expected), BytesToHex(Curve::ORDER)) << Curve::NAME;
}

// ============================================================================
// Curve Constant Tests
// ============================================================================

TEST(OpenSslInteropTest, CurveOrdersMatch) {
    CheckOrder<Secp256k1>(NID_secp256k1);
    CheckOrder<NistP256>(NID_X9_62_prime256v1);
    CheckOrder<NistP384>(NID_secp384r1);
    CheckOrder<NistP521>(NID_secp521r1);
}

// ============================================================================
// DER Codec Tests
// ============================================================================

template<typename Curve>
void CheckEncodingAgreement(uint32_t seed) {
    std::mt19937 rng(seed);
    for (int i = 0; i < 100; ++i) {
        auto r = RandomScalar<Curve>(rng);
        auto s = RandomScalar<Curve>(rng);

        auto ours = DerSignature<Curve>::FromScalars(r, s);
        auto theirs = OpenSslEncode(Span<const Byte>(r), Span<const Byte>(s));
        ASSERT_EQ(ours.ToHex(), BytesToHex(theirs)) << Curve::NAME;

        std::vector<Byte> rBack;
        std::vector<Byte> sBack;
        ASSERT_TRUE(OpenSslDecode(ours.ToVector(), Curve::ELEMENT_SIZE, rBack, sBack));
        EXPECT_EQ(rBack, Span<const Byte>(r).ToVector());
        EXPECT_EQ(sBack, Span<const Byte>(s).ToVector());

        auto parsed = Signature<Curve>::FromDer(theirs);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, Signature<Curve>::FromScalars(r, s));
    }
}

TEST(OpenSslInteropTest, EncodingMatchesSecp256k1) {
    CheckEncodingAgreement<Secp256k1>(1);
}

TEST(OpenSslInteropTest, EncodingMatchesP384) {
    CheckEncodingAgreement<NistP384>(2);
}

TEST(OpenSslInteropTest, EncodingMatchesP521) {
    CheckEncodingAgreement<NistP521>(3);
}

TEST(OpenSslInteropTest, ZeroMatches) {
    ElementBytes<Secp256k1> zero{};
    auto ours = DerSignature<Secp256k1>::FromScalars(zero, zero);
    EXPECT_EQ(ours.ToVector(), OpenSslEncode(Span<const Byte>(zero), Span<const Byte>(zero)));
}

// ============================================================================
// Real Signature Tests
// ============================================================================

/// Generate a key on the curve and sign a message, returning DER bytes
std::vector<Byte> SignWithOpenSsl(int nid, const std::string& message, EvpPkeyPtr& key) {
    EvpPkeyCtxPtr keyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    EVP_PKEY* rawKey = nullptr;
    if (!keyCtx || EVP_PKEY_keygen_init(keyCtx.get()) != 1 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(keyCtx.get(), nid) != 1 ||
        EVP_PKEY_keygen(keyCtx.get(), &rawKey) != 1) {
        ADD_FAILURE() << "Key generation failed";
        return {};
    }
    key.reset(rawKey);

    EvpMdCtxPtr mdCtx(EVP_MD_CTX_new());
    size_t sigLen = 0;
    const auto* msg = reinterpret_cast<const unsigned char*>(message.data());
    if (!mdCtx || EVP_DigestSignInit(mdCtx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1 ||
        EVP_DigestSign(mdCtx.get(), nullptr, &sigLen, msg, message.size()) != 1) {
        ADD_FAILURE() << "Signing setup failed";
        return {};
    }

    std::vector<Byte> sig(sigLen);
    if (EVP_DigestSign(mdCtx.get(), sig.data(), &sigLen, msg, message.size()) != 1) {
        ADD_FAILURE() << "Signing failed";
        return {};
    }
    sig.resize(sigLen);
    return sig;
}

bool VerifyWithOpenSsl(EVP_PKEY* key, const std::string& message, const std::vector<Byte>& der) {
    EvpMdCtxPtr mdCtx(EVP_MD_CTX_new());
    if (!mdCtx || EVP_DigestVerifyInit(mdCtx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        return false;
    }
    return EVP_DigestVerify(mdCtx.get(), der.data(), der.size(),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size()) == 1;
}

template<typename Curve>
void CheckRealSignatures(int nid) {
    for (int i = 0; i < 8; ++i) {
        std::string message = std::string("ecsig interop ") + Curve::NAME + " #" + std::to_string(i);

        EvpPkeyPtr key;
        auto der = SignWithOpenSsl(nid, message, key);
        ASSERT_FALSE(der.empty());

        SignatureError err = SignatureError::MALFORMED_DER;
        auto sig = Signature<Curve>::FromDer(der, &err);
        ASSERT_TRUE(sig.has_value()) << BytesToHex(der);
        EXPECT_EQ(err, SignatureError::OK);
        EXPECT_LE(der.size(), DerSignature<Curve>::MAX_SIZE);
        EXPECT_EQ(sig->ToDer().ToVector(), der);

        // Both (r, s) and (r, n - s) verify; normalization keeps it valid
        auto normalized = *sig;
        auto changed = normalized.NormalizeS();
        ASSERT_TRUE(changed.has_value());
        EXPECT_EQ(normalized.IsLowS(), std::optional<bool>(true));
        EXPECT_TRUE(VerifyWithOpenSsl(key.get(), message, normalized.ToDer().ToVector()));

        if (*changed) {
            EXPECT_NE(normalized, *sig);
            EXPECT_TRUE(SpanEqual(normalized.R(), sig->R()));
        }
    }
}

TEST(OpenSslInteropTest, RealSignaturesSecp256k1) {
    CheckRealSignatures<Secp256k1>(NID_secp256k1);
}

TEST(OpenSslInteropTest, RealSignaturesP256) {
    CheckRealSignatures<NistP256>(NID_X9_62_prime256v1);
}

TEST(OpenSslInteropTest, RealSignaturesP521) {
    CheckRealSignatures<NistP521>(NID_secp521r1);
}

} // namespace
} // namespace ecsig
