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

#pragma once

#include "utility/common.h"
#include <stdexcept>

namespace settle::ecc
{
    using Hash = std::array<uint8_t, 32>;

    static const size_t kCompressedPubKeySize = 33;
    static const size_t kSecretSize = 32;

    class CryptoException : public std::runtime_error
    {
    public:
        explicit CryptoException(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    Hash Sha256(const void* data, size_t size);
    Hash Sha256(const ByteBuffer& data);
    // sha256(sha256(data))
    Hash DoubleSha256(const ByteBuffer& data);
    Hash HmacSha256(const ByteBuffer& key, const ByteBuffer& data);

    // reduces a 32-byte value into [1, n-1] of secp256k1, returns false if the result is zero
    bool MakeSecret(const Hash& value, ByteBuffer& secret);

    // compressed public key of a secp256k1 secret, throws CryptoException
    ByteBuffer GetPublicKey(const ByteBuffer& secret);

    // 33 bytes, 0x02/0x03 prefix, valid curve point
    bool IsValidPublicKey(const ByteBuffer& pubKey);

    // DER encoded ECDSA signature with low S, throws CryptoException
    ByteBuffer Sign(const Hash& digest, const ByteBuffer& secret);

    // rejects malformed keys and signatures as well as high S values
    bool Verify(const Hash& digest, const ByteBuffer& pubKey, const ByteBuffer& signature);
}
