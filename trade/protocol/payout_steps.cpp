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

#include "payout_steps.h"

namespace settle::trade
{
    namespace
    {
        PayoutTerms GetCooperativeTerms(const StepContext& context)
        {
            PayoutSplit split = GetCooperativeSplit(context.m_Trade);
            return GetMandatory(context.m_Context.GetPayoutTerms(split.m_Buyer, split.m_Seller), "payout terms");
        }
    }

    ///////////////////////////
    // SendPayoutSignature

    StepOutcome SendPayoutSignature::Run(StepContext& context)
    {
        Send(context);
        return StepOutcome::Suspended(TradeMessageType::PayoutTxPublished, context.m_PeerTimeoutMsec);
    }

    StepOutcome SendPayoutSignature::OnTimeout(StepContext& context)
    {
        return EscalateTimeout(context, GetName());
    }

    void SendPayoutSignature::OnResume(StepContext& context)
    {
        Send(context);
    }

    void SendPayoutSignature::Send(StepContext& context)
    {
        TradeRole role = context.m_Trade.GetRole();
        Signature signature = GetMandatory(context.m_Context.GetPayoutSignature(role), "own payout signature");

        TradeMessage message = context.CreateMessage(TradeMessageType::PayoutSignature);
        message.AddParameter(GetPayoutSignatureParameter(role), signature);
        context.SendTo(TradeRole::Seller, message);
    }

    ///////////////////////////
    // AwaitPeerPayoutSignature

    StepOutcome AwaitPeerPayoutSignature::Process(StepContext& context, const TradeMessage& message)
    {
        auto& tradeContext = context.m_Context;

        auto signature = message.GetMandatoryParameter<Signature>(TradeParameterID::BuyerPayoutSignature);
        PayoutTerms terms = GetCooperativeTerms(context);

        if (!tradeContext.GetTxService()->VerifyPayoutSignature(terms, terms.m_KeySet.m_Buyer, signature))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "buyer payout signature does not match the committed key",
                TradePhase::Disputed);
        }

        tradeContext.SetPayoutSignature(TradeRole::Buyer, signature);
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // FinalizeAndPublishPayout

    StepOutcome FinalizeAndPublishPayout::Run(StepContext& context)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;
        auto txService = tradeContext.GetTxService();

        PayoutTerms terms = GetCooperativeTerms(context);
        PayoutSignatures signatures;
        signatures[TradeRole::Buyer] = GetMandatory(tradeContext.GetPayoutSignature(TradeRole::Buyer), "buyer payout signature");
        signatures[TradeRole::Seller] = GetMandatory(tradeContext.GetPayoutSignature(TradeRole::Seller), "seller payout signature");

        PayoutTx payout = txService->FinalizePayout(terms, signatures);
        txService->PublishPayout(payout);
        tradeContext.SetPayoutTx(payout);
        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] published payout " << to_string(payout.m_TxID);
        trade.TransitionTo(TradePhase::PayoutPublished);

        TradeMessage message = context.CreateMessage(TradeMessageType::PayoutTxPublished);
        message.AddParameter(TradeParameterID::PayoutTx, payout);
        context.SendTo(TradeRole::Buyer, message);

        trade.TransitionTo(TradePhase::Completed);
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // ProcessPayoutTxPublished

    StepOutcome ProcessPayoutTxPublished::Process(StepContext& context, const TradeMessage& message)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;

        auto payout = message.GetMandatoryParameter<PayoutTx>(TradeParameterID::PayoutTx);
        PayoutTerms terms = GetCooperativeTerms(context);

        if (!tradeContext.GetTxService()->VerifyPayoutTx(terms, payout))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "published payout does not match the agreed split",
                TradePhase::Disputed);
        }

        tradeContext.SetPayoutTx(payout);
        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] payout " << to_string(payout.m_TxID) << " verified";
        trade.TransitionTo(TradePhase::PayoutPublished);
        trade.TransitionTo(TradePhase::Completed);
        return StepOutcome::Complete();
    }
}
