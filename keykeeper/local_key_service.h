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

#include "trade/core/services.h"
#include <mutex>

namespace settle::trade
{
    //
    // Deterministic key service on top of one wallet seed.
    // Keys are secp256k1, derived as HMAC-SHA256(seed, tradeID | purpose | counter)
    //
    class LocalKeyService : public IKeyService
    {
    public:
        using Ptr = std::shared_ptr<LocalKeyService>;

        explicit LocalKeyService(const ByteBuffer& seed);
        ~LocalKeyService() override;

        AddressEntry GetOrCreateAddressEntry(const TradeID& tradeID, AddressPurpose purpose) override;
        KeyPair GetMultiSigKeyPair(const TradeID& tradeID, const PubKey& ownPublicKey) override;

        // "sx1" + hex of the first 20 bytes of sha256(pubKey)
        static std::string MakeAddress(const PubKey& pubKey);

    private:
        KeyPair DeriveKeyPair(const TradeID& tradeID, AddressPurpose purpose) const;

    private:
        mutable std::mutex m_Mutex;
        ByteBuffer m_Seed;
        std::map<std::pair<TradeID, AddressPurpose>, AddressEntry> m_Entries;
    };
}
