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

#include "messages.h"
#include <functional>
#include <map>

namespace settle::trade
{
    class Trade;
    class TradeContext;

    // signing layer rejected the inputs
    class LedgerFormatException : public std::runtime_error
    {
    public:
        explicit LedgerFormatException(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    class KeyServiceException : public std::runtime_error
    {
    public:
        explicit KeyServiceException(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    //
    // Wallet side key management. Both calls are idempotent per (tradeID, purpose)
    // and may be used from several trades concurrently
    //
    struct IKeyService
    {
        using Ptr = std::shared_ptr<IKeyService>;

        virtual ~IKeyService() = default;

        virtual AddressEntry GetOrCreateAddressEntry(const TradeID& tradeID, AddressPurpose purpose) = 0;

        // returns the key pair whose public part is ownPublicKey, throws KeyServiceException if unknown
        virtual KeyPair GetMultiSigKeyPair(const TradeID& tradeID, const PubKey& ownPublicKey) = 0;
    };

    using PayoutSignatures = std::map<TradeRole, Signature>;

    //
    // Construction, signing and broadcasting of the escrow transactions.
    // Malformed inputs are reported with LedgerFormatException
    //
    struct ITradeTxService
    {
        using Ptr = std::shared_ptr<ITradeTxService>;
        using ConfirmationCallback = std::function<void(const TxID&)>;

        virtual ~ITradeTxService() = default;

        // the escrow output can only be spent to the given payout addresses
        virtual FundLockTx PublishFundLockTx(const TradeID& tradeID, Amount escrowAmount, const MultiSigKeySet& keySet, const PayoutAddresses& addresses) = 0;
        // checks that the fund lock pays escrowAmount into the 2-of-3 output of keySet bound to addresses
        virtual bool VerifyFundLockTx(const FundLockTx& tx, const MultiSigKeySet& keySet, const PayoutAddresses& addresses) = 0;
        // callback is invoked once, from the service's event loop
        virtual void WaitForConfirmation(const FundLockTx& tx, ConfirmationCallback&& callback) = 0;

        virtual Signature SignPayout(const PayoutTerms& terms, const KeyPair& ownKeyPair) = 0;
        virtual bool VerifyPayoutSignature(const PayoutTerms& terms, const PubKey& pubKey, const Signature& signature) = 0;
        // needs valid signatures of two distinct key set members
        virtual PayoutTx FinalizePayout(const PayoutTerms& terms, const PayoutSignatures& signatures) = 0;
        virtual bool VerifyPayoutTx(const PayoutTerms& terms, const PayoutTx& tx) = 0;
        virtual void PublishPayout(const PayoutTx& tx) = 0;
    };

    // outbound side of the peer messaging channel
    struct ITradeGateway
    {
        virtual ~ITradeGateway() = default;
        virtual void Send(const PeerID& peerID, const TradeMessage& message) = 0;
    };

    struct Award
    {
        Amount m_Buyer = 0;
        Amount m_Seller = 0;
    };

    // arbitrator's decision on how the escrow is split
    struct IDisputeResolver
    {
        using Ptr = std::shared_ptr<IDisputeResolver>;

        virtual ~IDisputeResolver() = default;
        virtual Award Resolve(const Trade& trade, const TradeContext& context) = 0;
    };
}
