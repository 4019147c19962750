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

#include "trade/core/protocol_step.h"

namespace settle::trade
{
    // key service slot of the arbitrator's long-lived escrow key
    extern const char* kArbitratorKeyID;

    //
    // Step that handles one peer message, suspending until it arrives.
    // Accepts the message left by the previous step as well
    //
    class ReceiveStep : public IProtocolStep
    {
    public:
        ReceiveStep(TradeMessageType type, bool waitsForPeer);

        StepOutcome Run(StepContext& context) override;
        StepOutcome OnMessage(StepContext& context, const TradeMessage& message) override;
        StepOutcome OnTimeout(StepContext& context) override;
        boost::optional<TradeMessageType> GetPeerMessage() const override { return m_Type; }

    protected:
        virtual StepOutcome Process(StepContext& context, const TradeMessage& message) = 0;

    private:
        TradeMessageType m_Type;
        bool m_WaitsForPeer;
    };

    // before the fund lock a silent peer fails the trade, afterwards the arbitrator takes over
    StepOutcome EscalateTimeout(StepContext& context, const char* what);

    struct PayoutSplit
    {
        Amount m_Buyer = 0;
        Amount m_Seller = 0;
    };

    // seller gets the deposit back, buyer gets the deposit plus the trade amount
    PayoutSplit GetCooperativeSplit(const Trade& trade);

    // true if the split spends exactly tradeAmount + both deposits
    bool ConservesEscrow(const Trade& trade, Amount buyer, Amount seller);

    // re-derives the own multisig key from the key service under keyID and returns its key pair,
    // throws SecurityIntegrityFailure if it differs from the key committed for the trade's role
    KeyPair GetVerifiedMultiSigKeyPair(StepContext& context, const TradeID& keyID);
}
