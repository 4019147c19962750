// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "ecc.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>
#include <openssl/sha.h>

namespace settle::ecc
{
    namespace
    {
        struct BNDeleter { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
        struct BNCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
        struct KeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
        struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
        struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

        using BigNum = std::unique_ptr<BIGNUM, BNDeleter>;
        using BigNumCtx = std::unique_ptr<BN_CTX, BNCtxDeleter>;
        using Key = std::unique_ptr<EC_KEY, KeyDeleter>;
        using Point = std::unique_ptr<EC_POINT, PointDeleter>;
        using Sig = std::unique_ptr<ECDSA_SIG, SigDeleter>;

        const char* kCurveOrder = "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141";

        BigNum GetOrder()
        {
            BIGNUM* n = nullptr;
            if (!BN_hex2bn(&n, kCurveOrder))
            {
                throw CryptoException("BN_hex2bn failed");
            }
            return BigNum(n);
        }

        Key NewKey()
        {
            Key key(EC_KEY_new_by_curve_name(NID_secp256k1));
            if (!key)
            {
                throw CryptoException("EC_KEY_new_by_curve_name failed");
            }
            EC_KEY_set_conv_form(key.get(), POINT_CONVERSION_COMPRESSED);
            return key;
        }

        Key KeyFromSecret(const ByteBuffer& secret)
        {
            if (secret.size() != kSecretSize)
            {
                throw CryptoException("secret must be 32 bytes");
            }

            Key key = NewKey();
            const EC_GROUP* group = EC_KEY_get0_group(key.get());

            BigNum priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
            BigNumCtx ctx(BN_CTX_new());
            Point pub(EC_POINT_new(group));
            if (!priv || !ctx || !pub)
            {
                throw CryptoException("out of memory");
            }
            if (EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, ctx.get()) != 1
                || EC_KEY_set_private_key(key.get(), priv.get()) != 1
                || EC_KEY_set_public_key(key.get(), pub.get()) != 1)
            {
                throw CryptoException("invalid secp256k1 secret");
            }
            return key;
        }

        Key KeyFromPublic(const ByteBuffer& pubKey)
        {
            if (pubKey.size() != kCompressedPubKeySize || (pubKey[0] != 0x02 && pubKey[0] != 0x03))
            {
                return Key();
            }
            Key key = NewKey();
            EC_KEY* raw = key.get();
            const unsigned char* p = pubKey.data();
            if (!o2i_ECPublicKey(&raw, &p, static_cast<long>(pubKey.size())))
            {
                return Key();
            }
            return key;
        }

        bool IsLowS(const ECDSA_SIG* sig)
        {
            const BIGNUM* r = nullptr;
            const BIGNUM* s = nullptr;
            ECDSA_SIG_get0(sig, &r, &s);
            if (!s)
            {
                return false;
            }
            BigNum n = GetOrder();
            BigNum half(BN_new());
            if (!half || BN_rshift1(half.get(), n.get()) != 1)
            {
                throw CryptoException("BN_rshift1 failed");
            }
            return BN_cmp(s, half.get()) <= 0;
        }

        // s and n - s are both valid, the lower one is canonical
        void NormalizeS(Sig& sig)
        {
            if (IsLowS(sig.get()))
            {
                return;
            }
            const BIGNUM* r = nullptr;
            const BIGNUM* s = nullptr;
            ECDSA_SIG_get0(sig.get(), &r, &s);

            BigNum n = GetOrder();
            BigNum lowS(BN_new());
            BigNum rCopy(BN_dup(r));
            if (!lowS || !rCopy || BN_sub(lowS.get(), n.get(), s) != 1)
            {
                throw CryptoException("BN_sub failed");
            }

            Sig normalized(ECDSA_SIG_new());
            if (!normalized || ECDSA_SIG_set0(normalized.get(), rCopy.get(), lowS.get()) != 1)
            {
                throw CryptoException("ECDSA_SIG_set0 failed");
            }
            // owned by the signature now
            rCopy.release();
            lowS.release();
            sig = std::move(normalized);
        }
    }

    Hash Sha256(const void* data, size_t size)
    {
        Hash h;
        SHA256(static_cast<const unsigned char*>(data), size, h.data());
        return h;
    }

    Hash Sha256(const ByteBuffer& data)
    {
        return Sha256(data.data(), data.size());
    }

    Hash DoubleSha256(const ByteBuffer& data)
    {
        Hash first = Sha256(data);
        return Sha256(first.data(), first.size());
    }

    Hash HmacSha256(const ByteBuffer& key, const ByteBuffer& data)
    {
        Hash h;
        unsigned int size = 0;
        if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(), data.size(), h.data(), &size) || size != h.size())
        {
            throw CryptoException("HMAC-SHA256 failed");
        }
        return h;
    }

    bool MakeSecret(const Hash& value, ByteBuffer& secret)
    {
        BigNum v(BN_bin2bn(value.data(), static_cast<int>(value.size()), nullptr));
        BigNum n = GetOrder();
        BigNum r(BN_new());
        BigNumCtx ctx(BN_CTX_new());
        if (!v || !r || !ctx || BN_nnmod(r.get(), v.get(), n.get(), ctx.get()) != 1)
        {
            throw CryptoException("BN_nnmod failed");
        }
        if (BN_is_zero(r.get()))
        {
            return false;
        }

        secret.assign(kSecretSize, 0);
        if (BN_bn2binpad(r.get(), secret.data(), static_cast<int>(secret.size())) != static_cast<int>(kSecretSize))
        {
            throw CryptoException("BN_bn2binpad failed");
        }
        return true;
    }

    ByteBuffer GetPublicKey(const ByteBuffer& secret)
    {
        Key key = KeyFromSecret(secret);

        ByteBuffer pubKey(kCompressedPubKeySize);
        unsigned char* p = pubKey.data();
        if (i2o_ECPublicKey(key.get(), nullptr) != static_cast<int>(kCompressedPubKeySize)
            || i2o_ECPublicKey(key.get(), &p) != static_cast<int>(kCompressedPubKeySize))
        {
            throw CryptoException("i2o_ECPublicKey failed");
        }
        return pubKey;
    }

    bool IsValidPublicKey(const ByteBuffer& pubKey)
    {
        return KeyFromPublic(pubKey) != nullptr;
    }

    ByteBuffer Sign(const Hash& digest, const ByteBuffer& secret)
    {
        Key key = KeyFromSecret(secret);
        Sig sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), key.get()));
        if (!sig)
        {
            throw CryptoException("ECDSA_do_sign failed");
        }
        NormalizeS(sig);

        int size = i2d_ECDSA_SIG(sig.get(), nullptr);
        if (size <= 0)
        {
            throw CryptoException("i2d_ECDSA_SIG failed");
        }
        ByteBuffer der(static_cast<size_t>(size));
        unsigned char* p = der.data();
        if (i2d_ECDSA_SIG(sig.get(), &p) != size)
        {
            throw CryptoException("i2d_ECDSA_SIG failed");
        }
        return der;
    }

    bool Verify(const Hash& digest, const ByteBuffer& pubKey, const ByteBuffer& signature)
    {
        Key key = KeyFromPublic(pubKey);
        if (!key || signature.empty())
        {
            return false;
        }

        const unsigned char* p = signature.data();
        Sig sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(signature.size())));
        if (!sig || p != signature.data() + signature.size() || !IsLowS(sig.get()))
        {
            return false;
        }
        return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), key.get()) == 1;
    }
}
