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

#include "local_key_service.h"
#include "core/ecc.h"
#include "utility/helpers.h"

namespace settle::trade
{
    namespace
    {
        const size_t kAddressHashSize = 20;
        const char* kAddressPrefix = "sx1";
    }

    LocalKeyService::LocalKeyService(const ByteBuffer& seed)
        : m_Seed(seed)
    {
        if (m_Seed.empty())
        {
            throw KeyServiceException("empty wallet seed");
        }
    }

    LocalKeyService::~LocalKeyService()
    {
        SecureErase(m_Seed.data(), m_Seed.size());
    }

    std::string LocalKeyService::MakeAddress(const PubKey& pubKey)
    {
        ecc::Hash hash = ecc::Sha256(pubKey);
        return kAddressPrefix + to_hex(hash.data(), kAddressHashSize);
    }

    KeyPair LocalKeyService::DeriveKeyPair(const TradeID& tradeID, AddressPurpose purpose) const
    {
        KeyPair keyPair;
        for (uint32_t counter = 0; ; ++counter)
        {
            Serializer s;
            s & tradeID & purpose & counter;

            ByteBuffer data;
            s.swap_buf(data);

            ecc::Hash value = ecc::HmacSha256(m_Seed, data);
            bool ok = ecc::MakeSecret(value, keyPair.m_Secret);
            SecureErase(value.data(), value.size());
            if (ok)
            {
                break;
            }
        }

        try
        {
            keyPair.m_PubKey = ecc::GetPublicKey(keyPair.m_Secret);
        }
        catch (const ecc::CryptoException& ex)
        {
            throw KeyServiceException(std::string("key derivation failed: ") + ex.what());
        }
        return keyPair;
    }

    AddressEntry LocalKeyService::GetOrCreateAddressEntry(const TradeID& tradeID, AddressPurpose purpose)
    {
        std::unique_lock<std::mutex> lock(m_Mutex);

        auto key = std::make_pair(tradeID, purpose);
        auto it = m_Entries.find(key);
        if (it != m_Entries.end())
        {
            return it->second;
        }

        KeyPair keyPair = DeriveKeyPair(tradeID, purpose);

        AddressEntry entry;
        entry.m_TradeID = tradeID;
        entry.m_Purpose = purpose;
        entry.m_PubKey = keyPair.m_PubKey;
        entry.m_Address = MakeAddress(keyPair.m_PubKey);

        LOG_DEBUG() << tradeID << " new " << purpose << " address " << entry.m_Address;
        m_Entries.emplace(key, entry);
        return entry;
    }

    KeyPair LocalKeyService::GetMultiSigKeyPair(const TradeID& tradeID, const PubKey& ownPublicKey)
    {
        KeyPair keyPair;
        {
            std::unique_lock<std::mutex> lock(m_Mutex);
            keyPair = DeriveKeyPair(tradeID, AddressPurpose::MultiSig);
        }

        if (keyPair.m_PubKey != ownPublicKey)
        {
            throw KeyServiceException("key " + to_hex(ownPublicKey) + " does not belong to trade " + tradeID);
        }
        return keyPair;
    }
}
