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

#include "trade_context.h"
#include "utility/helpers.h"

namespace settle::trade
{
    namespace
    {
        void CheckPartyRole(TradeRole role)
        {
            if (role == TradeRole::Arbitrator)
            {
                throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "arbitrator has no payout address");
            }
        }

        template <typename T>
        boost::optional<T> Find(const std::map<TradeRole, T>& values, TradeRole role)
        {
            auto it = values.find(role);
            if (it == values.end())
            {
                return boost::none;
            }
            return it->second;
        }
    }

    TradeContext::TradeContext(IKeyService::Ptr keyService, ITradeTxService::Ptr txService)
        : m_KeyService(std::move(keyService))
        , m_TxService(std::move(txService))
    {
    }

    void TradeContext::SetMultiSigPubKey(TradeRole role, const PubKey& key)
    {
        if (key.empty())
        {
            throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "empty multisig key for " + to_string(role));
        }
        auto it = m_MultiSigKeys.find(role);
        if (it != m_MultiSigKeys.end())
        {
            if (it->second != key)
            {
                LOG_ERROR() << "Attempt to replace " << role << " multisig key " << to_hex(it->second) << " with " << to_hex(key);
                throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "multisig key of " + to_string(role) + " is already committed");
            }
            return;
        }
        m_MultiSigKeys.emplace(role, key);
    }

    boost::optional<PubKey> TradeContext::GetMultiSigPubKey(TradeRole role) const
    {
        return Find(m_MultiSigKeys, role);
    }

    boost::optional<MultiSigKeySet> TradeContext::GetMultiSigKeySet() const
    {
        if (m_MultiSigKeys.size() != 3)
        {
            return boost::none;
        }
        MultiSigKeySet keySet;
        keySet.m_Buyer = m_MultiSigKeys.at(TradeRole::Buyer);
        keySet.m_Seller = m_MultiSigKeys.at(TradeRole::Seller);
        keySet.m_Arbitrator = m_MultiSigKeys.at(TradeRole::Arbitrator);
        return keySet;
    }

    boost::optional<PayoutAddresses> TradeContext::GetPayoutAddresses() const
    {
        auto buyer = m_PayoutAddresses.find(TradeRole::Buyer);
        auto seller = m_PayoutAddresses.find(TradeRole::Seller);
        if (buyer == m_PayoutAddresses.end() || seller == m_PayoutAddresses.end())
        {
            return boost::none;
        }
        PayoutAddresses addresses;
        addresses.m_Buyer = buyer->second;
        addresses.m_Seller = seller->second;
        return addresses;
    }

    void TradeContext::SetPayoutAddress(TradeRole role, const std::string& address)
    {
        CheckPartyRole(role);
        if (address.empty())
        {
            throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "empty payout address for " + to_string(role));
        }
        auto it = m_PayoutAddresses.find(role);
        if (it != m_PayoutAddresses.end())
        {
            if (it->second != address)
            {
                LOG_ERROR() << "Attempt to replace " << role << " payout address " << it->second << " with " << address;
                throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "payout address of " + to_string(role) + " is already committed");
            }
            return;
        }
        m_PayoutAddresses.emplace(role, address);
    }

    boost::optional<std::string> TradeContext::GetPayoutAddress(TradeRole role) const
    {
        return Find(m_PayoutAddresses, role);
    }

    void TradeContext::SetFundLockTx(const FundLockTx& tx)
    {
        if (m_FundLockTx && *m_FundLockTx != tx)
        {
            throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "fund lock transaction is already recorded");
        }
        m_FundLockTx = tx;
    }

    void TradeContext::SetPayoutSignature(TradeRole role, const Signature& signature)
    {
        m_PayoutSignatures[role] = signature;
    }

    boost::optional<Signature> TradeContext::GetPayoutSignature(TradeRole role) const
    {
        return Find(m_PayoutSignatures, role);
    }

    void TradeContext::SetAward(const Award& award)
    {
        m_Award = award;
    }

    void TradeContext::SetPayoutTx(const PayoutTx& tx)
    {
        m_PayoutTx = tx;
    }

    boost::optional<PayoutTerms> TradeContext::GetPayoutTerms(Amount buyerAmount, Amount sellerAmount) const
    {
        auto keySet = GetMultiSigKeySet();
        auto buyerAddress = GetPayoutAddress(TradeRole::Buyer);
        auto sellerAddress = GetPayoutAddress(TradeRole::Seller);
        if (!m_FundLockTx || !keySet || !buyerAddress || !sellerAddress)
        {
            return boost::none;
        }

        PayoutTerms terms;
        terms.m_FundLockTx = *m_FundLockTx;
        terms.m_BuyerAmount = buyerAmount;
        terms.m_SellerAmount = sellerAmount;
        terms.m_BuyerAddress = *buyerAddress;
        terms.m_SellerAddress = *sellerAddress;
        terms.m_KeySet = *keySet;
        return terms;
    }

    PackedTradeParameters TradeContext::ExportParameters() const
    {
        PackedTradeParameters parameters;
        for (const auto& [role, key] : m_MultiSigKeys)
        {
            parameters.emplace_back(GetMultiSigKeyParameter(role), toByteBuffer(key));
        }
        for (const auto& [role, address] : m_PayoutAddresses)
        {
            parameters.emplace_back(GetPayoutAddressParameter(role), toByteBuffer(address));
        }
        if (m_FundLockTx)
        {
            parameters.emplace_back(TradeParameterID::FundLockTx, toByteBuffer(*m_FundLockTx));
        }
        for (const auto& [role, signature] : m_PayoutSignatures)
        {
            parameters.emplace_back(GetPayoutSignatureParameter(role), toByteBuffer(signature));
        }
        if (m_Award)
        {
            parameters.emplace_back(TradeParameterID::AwardedBuyerAmount, toByteBuffer(m_Award->m_Buyer));
            parameters.emplace_back(TradeParameterID::AwardedSellerAmount, toByteBuffer(m_Award->m_Seller));
        }
        if (m_PayoutTx)
        {
            parameters.emplace_back(TradeParameterID::PayoutTx, toByteBuffer(*m_PayoutTx));
        }
        return parameters;
    }

    void TradeContext::ImportParameters(const PackedTradeParameters& parameters)
    {
        Award award;
        bool hasBuyerAward = false;
        bool hasSellerAward = false;

        for (const auto& [id, value] : parameters)
        {
            bool ok = true;
            switch (id)
            {
            case TradeParameterID::BuyerMultiSigKey:
            case TradeParameterID::SellerMultiSigKey:
            case TradeParameterID::ArbitratorMultiSigKey:
                {
                    PubKey key;
                    ok = fromByteBuffer(value, key);
                    TradeRole role = id == TradeParameterID::BuyerMultiSigKey ? TradeRole::Buyer
                        : (id == TradeParameterID::SellerMultiSigKey ? TradeRole::Seller : TradeRole::Arbitrator);
                    if (ok) SetMultiSigPubKey(role, key);
                }
                break;
            case TradeParameterID::BuyerPayoutAddress:
            case TradeParameterID::SellerPayoutAddress:
                {
                    std::string address;
                    ok = fromByteBuffer(value, address);
                    if (ok) SetPayoutAddress(id == TradeParameterID::BuyerPayoutAddress ? TradeRole::Buyer : TradeRole::Seller, address);
                }
                break;
            case TradeParameterID::FundLockTx:
                {
                    FundLockTx tx;
                    ok = fromByteBuffer(value, tx);
                    if (ok) SetFundLockTx(tx);
                }
                break;
            case TradeParameterID::BuyerPayoutSignature:
            case TradeParameterID::SellerPayoutSignature:
            case TradeParameterID::ArbitratorPayoutSignature:
                {
                    Signature signature;
                    ok = fromByteBuffer(value, signature);
                    TradeRole role = id == TradeParameterID::BuyerPayoutSignature ? TradeRole::Buyer
                        : (id == TradeParameterID::SellerPayoutSignature ? TradeRole::Seller : TradeRole::Arbitrator);
                    if (ok) SetPayoutSignature(role, signature);
                }
                break;
            case TradeParameterID::AwardedBuyerAmount:
                ok = hasBuyerAward = fromByteBuffer(value, award.m_Buyer);
                break;
            case TradeParameterID::AwardedSellerAmount:
                ok = hasSellerAward = fromByteBuffer(value, award.m_Seller);
                break;
            case TradeParameterID::PayoutTx:
                {
                    PayoutTx tx;
                    ok = fromByteBuffer(value, tx);
                    if (ok) SetPayoutTx(tx);
                }
                break;
            default:
                LOG_WARNING() << "Ignoring unexpected stored parameter " << to_string(id);
                break;
            }
            if (!ok)
            {
                throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "corrupted stored parameter " + to_string(id));
            }
        }

        if (hasBuyerAward && hasSellerAward)
        {
            m_Award = award;
        }
    }
}
