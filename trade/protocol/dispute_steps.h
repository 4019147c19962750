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
    // party: submits the dispute ticket to the arbitrator and waits for the ruling
    class SendDisputeToArbitrator : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "SendDisputeToArbitrator"; }
        StepOutcome Run(StepContext& context) override;
        void OnResume(StepContext& context) override;
    private:
        void Send(StepContext& context);
    };

    // party: checks the ruling, co-signs it and broadcasts the payout
    class ProcessDisputeResult : public ReceiveStep
    {
    public:
        ProcessDisputeResult() : ReceiveStep(TradeMessageType::DisputeResult, false) {}
        const char* GetName() const override { return "ProcessDisputeResult"; }
    protected:
        StepOutcome Process(StepContext& context, const TradeMessage& message) override;
    };

    // arbitrator: takes over the trade state from the ticket
    class ProcessDisputeTicket : public ReceiveStep
    {
    public:
        ProcessDisputeTicket() : ReceiveStep(TradeMessageType::DisputeOpened, false) {}
        const char* GetName() const override { return "ProcessDisputeTicket"; }
    protected:
        StepOutcome Process(StepContext& context, const TradeMessage& message) override;
    };

    // arbitrator: decides the split and signs it with the registered arbitrator key
    class ArbitratorSignsPayout : public IProtocolStep
    {
    public:
        explicit ArbitratorSignsPayout(IDisputeResolver::Ptr resolver);
        const char* GetName() const override { return "ArbitratorSignsPayout"; }
        StepOutcome Run(StepContext& context) override;
    private:
        IDisputeResolver::Ptr m_Resolver;
    };

    // arbitrator: hands the ruling to both parties
    class SendDisputeResult : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "SendDisputeResult"; }
        StepOutcome Run(StepContext& context) override;
    };
}
