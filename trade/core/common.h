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
#include "utility/serialize.h"
#include "utility/logger.h"

#include <boost/optional.hpp>
#include <algorithm>
#include <stdexcept>

namespace settle::trade
{
    using TradeID = std::string;
    using PeerID = std::string;
    using PubKey = ByteBuffer;     // 33 bytes, compressed secp256k1 point
    using Signature = ByteBuffer;  // DER encoded ECDSA
    using TxID = std::array<uint8_t, 32>;

    enum class TradeRole : uint8_t
    {
        Buyer,
        Seller,
        Arbitrator
    };

    enum class TradePhase : uint8_t
    {
        Negotiated,
        DepositPublished,
        DepositConfirmed,
        PayoutSigned,
        PayoutPublished,
        Completed,
        Error,
        Disputed,
        Canceled
    };

    enum class AddressPurpose : uint8_t
    {
        MultiSig,
        Payout
    };

    std::string to_string(TradeRole role);
    std::string to_string(TradePhase phase);
    std::string to_string(AddressPurpose purpose);
    std::string to_string(const TxID& id);

    std::ostream& operator<<(std::ostream& os, TradeRole role);
    std::ostream& operator<<(std::ostream& os, TradePhase phase);
    std::ostream& operator<<(std::ostream& os, AddressPurpose purpose);

    boost::optional<TradeRole> RoleFromString(const std::string& s);

    // the other trading party, none for the arbitrator
    boost::optional<TradeRole> GetCounterpartRole(TradeRole role);

#define SETTLE_TRADE_FAILURE_REASON_MAP(MACRO) \
    MACRO(Unknown,                        0, "Unexpected failure, see logs for details") \
    MACRO(Canceled,                       1, "Trade cancelled before the fund lock") \
    MACRO(InvalidTransition,              2, "Trade phase transition is not allowed") \
    MACRO(ProgrammingInvariantViolation,  3, "Required trade state is missing, protocol steps are out of order") \
    MACRO(SecurityIntegrityFailure,       4, "Key, signature or address inconsistency detected") \
    MACRO(PeerProtocolFailure,            5, "Unexpected message type or content from the counterparty") \
    MACRO(PeerTimeout,                    6, "No response from the counterparty within the time limit") \
    MACRO(TransactionConstructionFailure, 7, "Malformed amounts or addresses at the signing layer") \

    enum TradeFailureReason : int32_t
    {
#define MACRO(name, code, _) name = code,
        SETTLE_TRADE_FAILURE_REASON_MAP(MACRO)
#undef MACRO
    };

    std::string GetFailureMessage(TradeFailureReason reason);

    class TradeFailedException : public std::runtime_error
    {
    public:
        TradeFailedException(TradeFailureReason reason, const std::string& message = std::string());
        TradeFailureReason GetReason() const;
    private:
        TradeFailureReason m_Reason;
    };

    struct AddressEntry
    {
        TradeID m_TradeID;
        AddressPurpose m_Purpose = AddressPurpose::MultiSig;
        std::string m_Address;
        PubKey m_PubKey;
    };

    struct KeyPair
    {
        PubKey m_PubKey;
        ByteBuffer m_Secret;

        KeyPair() = default;
        KeyPair(const KeyPair&) = default;
        KeyPair& operator=(const KeyPair&) = default;
        KeyPair(KeyPair&&) = default;
        KeyPair& operator=(KeyPair&&) = default;
        ~KeyPair();
    };

    struct FundLockTx
    {
        TxID m_TxID = {};
        uint32_t m_OutputIndex = 0;
        Amount m_EscrowAmount = 0;
        ByteBuffer m_Raw;

        bool operator==(const FundLockTx& other) const
        {
            return m_TxID == other.m_TxID
                && m_OutputIndex == other.m_OutputIndex
                && m_EscrowAmount == other.m_EscrowAmount
                && m_Raw == other.m_Raw;
        }
        bool operator!=(const FundLockTx& other) const { return !(*this == other); }

        SERIALIZE(m_TxID, m_OutputIndex, m_EscrowAmount, m_Raw);
    };

    struct MultiSigKeySet
    {
        PubKey m_Buyer;
        PubKey m_Seller;
        PubKey m_Arbitrator;

        const PubKey& Get(TradeRole role) const;
        bool Contains(const PubKey& key) const;

        SERIALIZE(m_Buyer, m_Seller, m_Arbitrator);
    };

    // where the escrow may be paid out, committed by the fund lock
    struct PayoutAddresses
    {
        std::string m_Buyer;
        std::string m_Seller;

        bool operator==(const PayoutAddresses& other) const { return m_Buyer == other.m_Buyer && m_Seller == other.m_Seller; }
        bool operator!=(const PayoutAddresses& other) const { return !(*this == other); }

        SERIALIZE(m_Buyer, m_Seller);
    };

    struct PayoutTerms
    {
        FundLockTx m_FundLockTx;
        Amount m_BuyerAmount = 0;
        Amount m_SellerAmount = 0;
        std::string m_BuyerAddress;
        std::string m_SellerAddress;
        MultiSigKeySet m_KeySet;

        SERIALIZE(m_FundLockTx, m_BuyerAmount, m_SellerAmount, m_BuyerAddress, m_SellerAddress, m_KeySet);
    };

    struct PayoutTx
    {
        TxID m_TxID = {};
        ByteBuffer m_Raw;

        bool operator==(const PayoutTx& other) const { return m_TxID == other.m_TxID && m_Raw == other.m_Raw; }

        SERIALIZE(m_TxID, m_Raw);
    };

    // published by the seller, taken by the buyer
    struct Offer
    {
        TradeID m_OfferID;
        Amount m_Amount = 0;
        Amount m_BuyerDeposit = 0;
        Amount m_SellerDeposit = 0;
        PeerID m_Maker;
        PeerID m_Arbitrator;
        PubKey m_ArbitratorPubKey;
    };

    // tradeAmount + buyerDeposit + sellerDeposit, throws on overflow
    Amount GetEscrowAmount(Amount amount, Amount buyerDeposit, Amount sellerDeposit);

    template <typename T>
    ByteBuffer toByteBuffer(const T& value)
    {
        Serializer s;
        s & value;
        ByteBuffer b;
        s.swap_buf(b);
        return b;
    }

    // returns false if the buffer is empty, malformed or not consumed completely
    template <typename T>
    bool fromByteBuffer(const ByteBuffer& b, T& value)
    {
        if (b.empty())
        {
            return false;
        }
        try
        {
            Deserializer d;
            d.reset(b.data(), b.size());
            d & value;
            return d.bytes_left() == 0;
        }
        catch (const std::exception& ex)
        {
            LOG_WARNING() << "Failed to deserialize parameter: " << ex.what();
            return false;
        }
    }

#define SETTLE_TRADE_PARAMETERS_MAP(MACRO) \
    /* offer terms */ \
    MACRO(Amount,                   1, Amount) \
    MACRO(BuyerDeposit,             2, Amount) \
    MACRO(SellerDeposit,            3, Amount) \
    MACRO(ArbitratorID,             4, PeerID) \
    MACRO(BuyerID,                  5, PeerID) \
    MACRO(SellerID,                 6, PeerID) \
    /* exchanged keys and addresses */ \
    MACRO(BuyerMultiSigKey,        10, PubKey) \
    MACRO(SellerMultiSigKey,       11, PubKey) \
    MACRO(ArbitratorMultiSigKey,   12, PubKey) \
    MACRO(BuyerPayoutAddress,      13, std::string) \
    MACRO(SellerPayoutAddress,     14, std::string) \
    /* ledger artifacts */ \
    MACRO(FundLockTx,              20, FundLockTx) \
    MACRO(FundLockTxID,            21, TxID) \
    MACRO(BuyerPayoutSignature,    30, Signature) \
    MACRO(SellerPayoutSignature,   31, Signature) \
    MACRO(ArbitratorPayoutSignature, 32, Signature) \
    MACRO(PayoutTx,                33, PayoutTx) \
    /* dispute */ \
    MACRO(AwardedBuyerAmount,      40, Amount) \
    MACRO(AwardedSellerAmount,     41, Amount) \
    MACRO(DisputeOpener,           42, TradeRole) \

    enum class TradeParameterID : uint8_t
    {
#define MACRO(name, index, type) name = index,
        SETTLE_TRADE_PARAMETERS_MAP(MACRO)
#undef MACRO
    };

    std::string to_string(TradeParameterID id);

    using PackedTradeParameters = std::vector<std::pair<TradeParameterID, ByteBuffer>>;

    TradeParameterID GetMultiSigKeyParameter(TradeRole role);
    TradeParameterID GetPayoutAddressParameter(TradeRole role);
    TradeParameterID GetPayoutSignatureParameter(TradeRole role);
}
