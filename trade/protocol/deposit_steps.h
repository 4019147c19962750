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
    // buyer: commits own key and payout address, asks the maker to lock the funds
    class SendTakeOfferRequest : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "SendTakeOfferRequest"; }
        StepOutcome Run(StepContext& context) override;
        void OnResume(StepContext& context) override;
    private:
        void Send(StepContext& context);
    };

    // buyer: checks the seller's fund lock against the agreed escrow and key set
    class ProcessDepositTxPublished : public ReceiveStep
    {
    public:
        ProcessDepositTxPublished() : ReceiveStep(TradeMessageType::DepositTxPublished, true) {}
        const char* GetName() const override { return "ProcessDepositTxPublished"; }
    protected:
        StepOutcome Process(StepContext& context, const TradeMessage& message) override;
    };

    // seller: validates the taker's request against the published offer
    class ProcessTakeOffer : public ReceiveStep
    {
    public:
        ProcessTakeOffer() : ReceiveStep(TradeMessageType::TakeOffer, false) {}
        const char* GetName() const override { return "ProcessTakeOffer"; }
    protected:
        StepOutcome Process(StepContext& context, const TradeMessage& message) override;
    };

    // seller: broadcasts the 2-of-3 fund lock and hands it to the buyer
    class PublishFundLockTx : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "PublishFundLockTx"; }
        StepOutcome Run(StepContext& context) override;
    };

    //
    // Both parties: waits for the ledger to confirm the fund lock.
    // The confirmation is delivered to the own node as a FundLockConfirmed message
    //
    class AwaitFundLockConfirmation : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "AwaitFundLockConfirmation"; }
        StepOutcome Run(StepContext& context) override;
        StepOutcome OnMessage(StepContext& context, const TradeMessage& message) override;
        void OnResume(StepContext& context) override;
    private:
        void Subscribe(StepContext& context);
    };
}
