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

#include "services.h"

namespace settle::trade
{
    //
    // Per trade scratch state shared by the protocol steps.
    // Exchanged keys and payout addresses are write-once
    //
    class TradeContext
    {
    public:
        TradeContext(IKeyService::Ptr keyService, ITradeTxService::Ptr txService);

        const IKeyService::Ptr& GetKeyService() const { return m_KeyService; }
        const ITradeTxService::Ptr& GetTxService() const { return m_TxService; }

        // same key again is a no-op, a different key throws SecurityIntegrityFailure
        void SetMultiSigPubKey(TradeRole role, const PubKey& key);
        boost::optional<PubKey> GetMultiSigPubKey(TradeRole role) const;
        // none until all three keys are known
        boost::optional<MultiSigKeySet> GetMultiSigKeySet() const;

        void SetPayoutAddress(TradeRole role, const std::string& address);
        boost::optional<std::string> GetPayoutAddress(TradeRole role) const;
        // none until both addresses are known
        boost::optional<PayoutAddresses> GetPayoutAddresses() const;

        void SetFundLockTx(const FundLockTx& tx);
        const boost::optional<FundLockTx>& GetFundLockTx() const { return m_FundLockTx; }

        void SetPayoutSignature(TradeRole role, const Signature& signature);
        boost::optional<Signature> GetPayoutSignature(TradeRole role) const;

        void SetAward(const Award& award);
        const boost::optional<Award>& GetAward() const { return m_Award; }

        void SetPayoutTx(const PayoutTx& tx);
        const boost::optional<PayoutTx>& GetPayoutTx() const { return m_PayoutTx; }

        // none if the fund lock, an address or a key is missing
        boost::optional<PayoutTerms> GetPayoutTerms(Amount buyerAmount, Amount sellerAmount) const;

        // persistence
        PackedTradeParameters ExportParameters() const;
        void ImportParameters(const PackedTradeParameters& parameters);

    private:
        IKeyService::Ptr m_KeyService;
        ITradeTxService::Ptr m_TxService;

        std::map<TradeRole, PubKey> m_MultiSigKeys;
        std::map<TradeRole, std::string> m_PayoutAddresses;
        boost::optional<FundLockTx> m_FundLockTx;
        std::map<TradeRole, Signature> m_PayoutSignatures;
        boost::optional<Award> m_Award;
        boost::optional<PayoutTx> m_PayoutTx;
    };
}
