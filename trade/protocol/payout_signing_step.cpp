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

#include "payout_signing_step.h"

namespace settle::trade
{
    StepOutcome PayoutSigningStep::Run(StepContext& context)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;
        TradeRole role = trade.GetRole();

        if (role == TradeRole::Arbitrator)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "arbitrator does not sign the cooperative payout");
        }
        if (!tradeContext.GetFundLockTx())
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "fund lock transaction is missing");
        }
        if (trade.GetAmount() == 0)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "trade amount is missing");
        }
        if (!tradeContext.GetPayoutAddress(TradeRole::Buyer) || !tradeContext.GetPayoutAddress(TradeRole::Seller))
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "payout address is missing");
        }
        if (!tradeContext.GetMultiSigKeySet())
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "multisig key is missing");
        }
        if (!trade.CanTransitionTo(TradePhase::PayoutSigned))
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation,
                "payout signing is not allowed in phase " + to_string(trade.GetPhase()));
        }

        try
        {
            PayoutSplit split = GetCooperativeSplit(trade);
            LOG_INFO() << trade.GetID() << "[" << role << "] signing payout buyer=" << split.m_Buyer << " seller=" << split.m_Seller;

            KeyPair keyPair = GetVerifiedMultiSigKeyPair(context, trade.GetID());

            auto terms = tradeContext.GetPayoutTerms(split.m_Buyer, split.m_Seller);
            Signature signature = tradeContext.GetTxService()->SignPayout(*terms, keyPair);

            tradeContext.SetPayoutSignature(role, signature);
        }
        catch (const TradeFailedException& ex)
        {
            return StepOutcome::Failed(ex.GetReason(), ex.what());
        }
        catch (const LedgerFormatException& ex)
        {
            return StepOutcome::Failed(TradeFailureReason::TransactionConstructionFailure, ex.what());
        }

        trade.TransitionTo(TradePhase::PayoutSigned);
        return StepOutcome::Complete();
    }
}
