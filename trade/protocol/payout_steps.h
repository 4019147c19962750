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

#include "common_steps.h"

namespace settle::trade
{
    // buyer: hands the own payout signature to the seller and waits for the broadcast payout
    class SendPayoutSignature : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "SendPayoutSignature"; }
        StepOutcome Run(StepContext& context) override;
        StepOutcome OnTimeout(StepContext& context) override;
        void OnResume(StepContext& context) override;
    private:
        void Send(StepContext& context);
    };

    // seller: checks the buyer's payout signature against the buyer's committed key
    class AwaitPeerPayoutSignature : public ReceiveStep
    {
    public:
        AwaitPeerPayoutSignature() : ReceiveStep(TradeMessageType::PayoutSignature, true) {}
        const char* GetName() const override { return "AwaitPeerPayoutSignature"; }
    protected:
        StepOutcome Process(StepContext& context, const TradeMessage& message) override;
    };

    // seller: combines both signatures, broadcasts the payout and informs the buyer
    class FinalizeAndPublishPayout : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "FinalizeAndPublishPayout"; }
        StepOutcome Run(StepContext& context) override;
    };

    // buyer: checks that the broadcast payout pays the agreed split
    class ProcessPayoutTxPublished : public ReceiveStep
    {
    public:
        ProcessPayoutTxPublished() : ReceiveStep(TradeMessageType::PayoutTxPublished, true) {}
        const char* GetName() const override { return "ProcessPayoutTxPublished"; }
    protected:
        StepOutcome Process(StepContext& context, const TradeMessage& message) override;
    };
}
