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

#include "local_ledger.h"
#include "core/ecc.h"
#include "utility/helpers.h"

#include <algorithm>

namespace settle::trade
{
    namespace
    {
        const uint8_t kFundLockTag = 0x01;
        const uint8_t kPayoutTag = 0x02;
        const uint32_t kEscrowOutput = 0;

        // canonical unsigned layout, zero outputs are left out
        ByteBuffer SerializeUnsignedPayout(const PayoutTerms& terms)
        {
            Serializer s;
            s & kPayoutTag & terms.m_FundLockTx.m_TxID & terms.m_FundLockTx.m_OutputIndex;

            uint32_t outputs = (terms.m_BuyerAmount ? 1 : 0) + (terms.m_SellerAmount ? 1 : 0);
            s & outputs;
            if (terms.m_BuyerAmount)
            {
                s & terms.m_BuyerAmount & terms.m_BuyerAddress;
            }
            if (terms.m_SellerAmount)
            {
                s & terms.m_SellerAmount & terms.m_SellerAddress;
            }
            s & terms.m_KeySet;

            ByteBuffer b;
            s.swap_buf(b);
            return b;
        }

        struct SignedPayout
        {
            PayoutTerms m_Terms;
            std::vector<std::pair<TradeRole, Signature>> m_Signatures;

            SERIALIZE(m_Terms, m_Signatures);
        };

        bool ParsePayout(const PayoutTx& tx, SignedPayout& payout)
        {
            return fromByteBuffer(tx.m_Raw, payout);
        }

        bool IsValidAddress(const std::string& address)
        {
            if (address.empty() || address.size() > LocalLedger::kMaxAddressLength)
            {
                return false;
            }
            return std::all_of(address.begin(), address.end(), [](char c) { return c > 0x20 && c < 0x7f; });
        }
    }

    LocalLedger::LocalLedger(io::Reactor& reactor, uint32_t confirmationDelayMsec)
        : m_Reactor(reactor)
        , m_ConfirmationDelayMsec(confirmationDelayMsec)
    {
    }

    LocalLedger::~LocalLedger()
    {
        for (auto& [id, confirmation] : m_Confirmations)
        {
            confirmation.m_Timer->cancel();
        }
    }

    void LocalLedger::ValidateKeySet(const MultiSigKeySet& keySet) const
    {
        for (const auto* key : { &keySet.m_Buyer, &keySet.m_Seller, &keySet.m_Arbitrator })
        {
            if (!ecc::IsValidPublicKey(*key))
            {
                throw LedgerFormatException("multisig key " + to_hex(*key) + " is not a compressed secp256k1 key");
            }
        }
        if (keySet.m_Buyer == keySet.m_Seller || keySet.m_Buyer == keySet.m_Arbitrator || keySet.m_Seller == keySet.m_Arbitrator)
        {
            throw LedgerFormatException("multisig keys must be distinct");
        }
    }

    void LocalLedger::ValidateTerms(const PayoutTerms& terms) const
    {
        ValidateKeySet(terms.m_KeySet);

        if (terms.m_FundLockTx.m_EscrowAmount == 0)
        {
            throw LedgerFormatException("escrow amount is zero");
        }
        if (terms.m_BuyerAmount == 0 && terms.m_SellerAmount == 0)
        {
            throw LedgerFormatException("payout has no outputs");
        }
        if (terms.m_BuyerAmount && !IsValidAddress(terms.m_BuyerAddress))
        {
            throw LedgerFormatException("invalid buyer payout address '" + terms.m_BuyerAddress + "'");
        }
        if (terms.m_SellerAmount && !IsValidAddress(terms.m_SellerAddress))
        {
            throw LedgerFormatException("invalid seller payout address '" + terms.m_SellerAddress + "'");
        }

        Amount total = 0;
        if (!AddAmounts(terms.m_BuyerAmount, terms.m_SellerAmount, total) || total != terms.m_FundLockTx.m_EscrowAmount)
        {
            throw LedgerFormatException("payout does not spend the full escrow of " + std::to_string(terms.m_FundLockTx.m_EscrowAmount));
        }
    }

    TxID LocalLedger::GetPayoutDigest(const PayoutTerms& terms)
    {
        return ecc::DoubleSha256(SerializeUnsignedPayout(terms));
    }

    FundLockTx LocalLedger::PublishFundLockTx(const TradeID& tradeID, Amount escrowAmount, const MultiSigKeySet& keySet, const PayoutAddresses& addresses)
    {
        if (escrowAmount == 0)
        {
            throw LedgerFormatException("escrow amount is zero");
        }
        ValidateKeySet(keySet);
        if (!IsValidAddress(addresses.m_Buyer) || !IsValidAddress(addresses.m_Seller))
        {
            throw LedgerFormatException("invalid payout address in the fund lock");
        }

        std::unique_lock<std::mutex> lock(m_Mutex);

        Serializer s;
        s & kFundLockTag & tradeID & escrowAmount & keySet & addresses & static_cast<uint64_t>(m_Escrows.size());

        FundLockTx tx;
        s.swap_buf(tx.m_Raw);
        tx.m_TxID = ecc::DoubleSha256(tx.m_Raw);
        tx.m_OutputIndex = kEscrowOutput;
        tx.m_EscrowAmount = escrowAmount;

        Escrow& escrow = m_Escrows[tx.m_TxID];
        escrow.m_TradeID = tradeID;
        escrow.m_KeySet = keySet;
        escrow.m_Addresses = addresses;
        escrow.m_Tx = tx;

        LOG_INFO() << "Ledger: fund lock " << to_string(tx.m_TxID) << " for " << tradeID << " escrow=" << escrowAmount;
        return tx;
    }

    bool LocalLedger::VerifyFundLockTx(const FundLockTx& tx, const MultiSigKeySet& keySet, const PayoutAddresses& addresses)
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        auto it = m_Escrows.find(tx.m_TxID);
        if (it == m_Escrows.end())
        {
            LOG_WARNING() << "Ledger: fund lock " << to_string(tx.m_TxID) << " is not published";
            return false;
        }

        const Escrow& escrow = it->second;
        return escrow.m_Tx == tx
            && escrow.m_KeySet.m_Buyer == keySet.m_Buyer
            && escrow.m_KeySet.m_Seller == keySet.m_Seller
            && escrow.m_KeySet.m_Arbitrator == keySet.m_Arbitrator
            && escrow.m_Addresses == addresses;
    }

    void LocalLedger::WaitForConfirmation(const FundLockTx& tx, ConfirmationCallback&& callback)
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        if (!m_Escrows.count(tx.m_TxID))
        {
            throw LedgerFormatException("unknown fund lock " + to_string(tx.m_TxID));
        }

        uint64_t id = ++m_NextConfirmationID;
        Confirmation confirmation;
        confirmation.m_Timer = io::Timer::create(m_Reactor);
        confirmation.m_TxID = tx.m_TxID;
        confirmation.m_Callback = std::move(callback);
        confirmation.m_Timer->start(m_ConfirmationDelayMsec, false, [this, id]() { OnConfirmed(id); });
        m_Confirmations.emplace(id, std::move(confirmation));
    }

    void LocalLedger::OnConfirmed(uint64_t confirmationID)
    {
        TxID txID;
        ConfirmationCallback callback;
        {
            std::unique_lock<std::mutex> lock(m_Mutex);
            auto it = m_Confirmations.find(confirmationID);
            if (it == m_Confirmations.end())
            {
                return;
            }
            txID = it->second.m_TxID;
            callback = std::move(it->second.m_Callback);

            // a timer may be destroyed from its own callback
            m_Confirmations.erase(it);

            auto escrow = m_Escrows.find(txID);
            if (escrow != m_Escrows.end() && !escrow->second.m_Confirmed)
            {
                escrow->second.m_Confirmed = true;
                LOG_INFO() << "Ledger: fund lock " << to_string(txID) << " confirmed";
            }
        }

        if (callback)
        {
            callback(txID);
        }
    }

    bool LocalLedger::IsConfirmed(const TxID& fundLockTxID) const
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        auto it = m_Escrows.find(fundLockTxID);
        return it != m_Escrows.end() && it->second.m_Confirmed;
    }

    boost::optional<PayoutTerms> LocalLedger::GetSettlement(const TxID& fundLockTxID) const
    {
        std::unique_lock<std::mutex> lock(m_Mutex);
        auto it = m_Escrows.find(fundLockTxID);
        if (it == m_Escrows.end())
        {
            return boost::none;
        }
        return it->second.m_PayoutTerms;
    }

    Signature LocalLedger::SignPayout(const PayoutTerms& terms, const KeyPair& ownKeyPair)
    {
        ValidateTerms(terms);
        if (!terms.m_KeySet.Contains(ownKeyPair.m_PubKey))
        {
            throw LedgerFormatException("signing key is not part of the escrow key set");
        }

        TxID digest = GetPayoutDigest(terms);
        try
        {
            if (ecc::GetPublicKey(ownKeyPair.m_Secret) != ownKeyPair.m_PubKey)
            {
                throw LedgerFormatException("secret does not match the signing key");
            }
            return ecc::Sign(digest, ownKeyPair.m_Secret);
        }
        catch (const ecc::CryptoException& ex)
        {
            throw LedgerFormatException(ex.what());
        }
    }

    bool LocalLedger::VerifyPayoutSignature(const PayoutTerms& terms, const PubKey& pubKey, const Signature& signature)
    {
        ValidateTerms(terms);
        if (!terms.m_KeySet.Contains(pubKey))
        {
            return false;
        }
        return ecc::Verify(GetPayoutDigest(terms), pubKey, signature);
    }

    size_t LocalLedger::CountValidSignatures(const PayoutTerms& terms, const PayoutSignatures& signatures) const
    {
        TxID digest = GetPayoutDigest(terms);
        size_t count = 0;
        for (const auto& [role, signature] : signatures)
        {
            if (ecc::Verify(digest, terms.m_KeySet.Get(role), signature))
            {
                ++count;
            }
            else
            {
                LOG_WARNING() << "Ledger: invalid " << role << " payout signature";
            }
        }
        return count;
    }

    PayoutTx LocalLedger::FinalizePayout(const PayoutTerms& terms, const PayoutSignatures& signatures)
    {
        ValidateTerms(terms);
        if (CountValidSignatures(terms, signatures) < 2)
        {
            throw LedgerFormatException("payout needs two valid signatures of the 2-of-3 key set");
        }

        SignedPayout payout;
        payout.m_Terms = terms;
        payout.m_Signatures.assign(signatures.begin(), signatures.end());

        PayoutTx tx;
        tx.m_TxID = GetPayoutDigest(terms);
        tx.m_Raw = toByteBuffer(payout);
        return tx;
    }

    bool LocalLedger::VerifyPayoutTx(const PayoutTerms& terms, const PayoutTx& tx)
    {
        SignedPayout payout;
        if (!ParsePayout(tx, payout))
        {
            return false;
        }
        if (GetPayoutDigest(payout.m_Terms) != GetPayoutDigest(terms) || tx.m_TxID != GetPayoutDigest(terms))
        {
            return false;
        }

        PayoutSignatures signatures(payout.m_Signatures.begin(), payout.m_Signatures.end());
        return CountValidSignatures(terms, signatures) >= 2;
    }

    void LocalLedger::PublishPayout(const PayoutTx& tx)
    {
        SignedPayout payout;
        if (!ParsePayout(tx, payout))
        {
            throw LedgerFormatException("malformed payout transaction");
        }
        const PayoutTerms& terms = payout.m_Terms;
        ValidateTerms(terms);
        if (tx.m_TxID != GetPayoutDigest(terms))
        {
            throw LedgerFormatException("payout txID does not match its content");
        }

        PayoutSignatures signatures(payout.m_Signatures.begin(), payout.m_Signatures.end());
        if (signatures.size() != payout.m_Signatures.size() || CountValidSignatures(terms, signatures) < 2)
        {
            throw LedgerFormatException("payout needs two valid signatures of the 2-of-3 key set");
        }

        std::unique_lock<std::mutex> lock(m_Mutex);
        auto it = m_Escrows.find(terms.m_FundLockTx.m_TxID);
        if (it == m_Escrows.end() || !(it->second.m_Tx == terms.m_FundLockTx))
        {
            throw LedgerFormatException("payout spends an unknown fund lock");
        }

        Escrow& escrow = it->second;
        const MultiSigKeySet& locked = escrow.m_KeySet;
        if (locked.m_Buyer != terms.m_KeySet.m_Buyer || locked.m_Seller != terms.m_KeySet.m_Seller || locked.m_Arbitrator != terms.m_KeySet.m_Arbitrator)
        {
            throw LedgerFormatException("payout key set differs from the fund lock");
        }
        if ((terms.m_BuyerAmount && terms.m_BuyerAddress != escrow.m_Addresses.m_Buyer)
            || (terms.m_SellerAmount && terms.m_SellerAddress != escrow.m_Addresses.m_Seller))
        {
            throw LedgerFormatException("payout pays to an address the fund lock does not commit to");
        }

        if (escrow.m_Payout)
        {
            if (escrow.m_Payout->m_TxID == tx.m_TxID)
            {
                LOG_INFO() << "Ledger: payout " << to_string(tx.m_TxID) << " already published";
                return;
            }
            throw LedgerFormatException("escrow " + to_string(terms.m_FundLockTx.m_TxID) + " is already spent");
        }

        escrow.m_Payout = tx;
        escrow.m_PayoutTerms = terms;
        LOG_INFO() << "Ledger: payout " << to_string(tx.m_TxID) << " buyer=" << terms.m_BuyerAmount << " seller=" << terms.m_SellerAmount;
    }
}
