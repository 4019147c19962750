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
#include "utility/io/timer.h"
#include <mutex>

namespace settle::trade
{
    //
    // In-process ledger: builds, signs and keeps the escrow transactions.
    // Signing and verification may be called from any thread, publishing and
    // confirmation subscriptions belong to the reactor thread
    //
    class LocalLedger : public ITradeTxService
    {
    public:
        using Ptr = std::shared_ptr<LocalLedger>;

        static const size_t kMaxAddressLength = 90;
        static const uint32_t kDefaultConfirmationDelayMsec = 100;

        LocalLedger(io::Reactor& reactor, uint32_t confirmationDelayMsec = kDefaultConfirmationDelayMsec);
        ~LocalLedger() override;

        FundLockTx PublishFundLockTx(const TradeID& tradeID, Amount escrowAmount, const MultiSigKeySet& keySet, const PayoutAddresses& addresses) override;
        bool VerifyFundLockTx(const FundLockTx& tx, const MultiSigKeySet& keySet, const PayoutAddresses& addresses) override;
        void WaitForConfirmation(const FundLockTx& tx, ConfirmationCallback&& callback) override;

        Signature SignPayout(const PayoutTerms& terms, const KeyPair& ownKeyPair) override;
        bool VerifyPayoutSignature(const PayoutTerms& terms, const PubKey& pubKey, const Signature& signature) override;
        PayoutTx FinalizePayout(const PayoutTerms& terms, const PayoutSignatures& signatures) override;
        bool VerifyPayoutTx(const PayoutTerms& terms, const PayoutTx& tx) override;
        void PublishPayout(const PayoutTx& tx) override;

        bool IsConfirmed(const TxID& fundLockTxID) const;
        // terms of the payout that spent the escrow, none while it is unspent
        boost::optional<PayoutTerms> GetSettlement(const TxID& fundLockTxID) const;

        // hash of the unsigned payout, signed by every key holder and used as its txID
        static TxID GetPayoutDigest(const PayoutTerms& terms);

    private:
        struct Escrow
        {
            TradeID m_TradeID;
            MultiSigKeySet m_KeySet;
            PayoutAddresses m_Addresses;
            FundLockTx m_Tx;
            bool m_Confirmed = false;
            boost::optional<PayoutTx> m_Payout;
            boost::optional<PayoutTerms> m_PayoutTerms;
        };

        struct Confirmation
        {
            io::Timer::Ptr m_Timer;
            TxID m_TxID;
            ConfirmationCallback m_Callback;
        };

        void ValidateKeySet(const MultiSigKeySet& keySet) const;
        void ValidateTerms(const PayoutTerms& terms) const;
        size_t CountValidSignatures(const PayoutTerms& terms, const PayoutSignatures& signatures) const;
        void OnConfirmed(uint64_t confirmationID);

    private:
        io::Reactor& m_Reactor;
        uint32_t m_ConfirmationDelayMsec;

        mutable std::mutex m_Mutex;
        std::map<TxID, Escrow> m_Escrows;
        std::map<uint64_t, Confirmation> m_Confirmations;
        uint64_t m_NextConfirmationID = 0;
    };
}
