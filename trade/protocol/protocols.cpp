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

#include "protocols.h"
#include "deposit_steps.h"
#include "payout_signing_step.h"
#include "payout_steps.h"
#include "dispute_steps.h"

namespace settle::trade
{
    StepSequencer::Steps CreateBuyerSteps()
    {
        return
        {
            std::make_shared<SendTakeOfferRequest>(),
            std::make_shared<ProcessDepositTxPublished>(),
            std::make_shared<AwaitFundLockConfirmation>(),
            std::make_shared<PayoutSigningStep>(),
            std::make_shared<SendPayoutSignature>(),
            std::make_shared<ProcessPayoutTxPublished>()
        };
    }

    StepSequencer::Steps CreateSellerSteps()
    {
        return
        {
            std::make_shared<ProcessTakeOffer>(),
            std::make_shared<PublishFundLockTx>(),
            std::make_shared<AwaitFundLockConfirmation>(),
            std::make_shared<AwaitPeerPayoutSignature>(),
            std::make_shared<PayoutSigningStep>(),
            std::make_shared<FinalizeAndPublishPayout>()
        };
    }

    StepSequencer::Steps CreateDisputeSteps()
    {
        return
        {
            std::make_shared<SendDisputeToArbitrator>(),
            std::make_shared<ProcessDisputeResult>()
        };
    }

    StepSequencer::Steps CreateArbitratorSteps(IDisputeResolver::Ptr resolver)
    {
        return
        {
            std::make_shared<ProcessDisputeTicket>(),
            std::make_shared<ArbitratorSignsPayout>(std::move(resolver)),
            std::make_shared<SendDisputeResult>()
        };
    }

    StepSequencer::Steps CreateSteps(TradeRole role, SequenceKind kind, const IDisputeResolver::Ptr& resolver)
    {
        switch (role)
        {
        case TradeRole::Buyer:
            return kind == SequenceKind::Main ? CreateBuyerSteps() : CreateDisputeSteps();
        case TradeRole::Seller:
            return kind == SequenceKind::Main ? CreateSellerSteps() : CreateDisputeSteps();
        case TradeRole::Arbitrator:
            return CreateArbitratorSteps(resolver);
        }
        throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "no protocol for role");
    }

    FixedAwardResolver::FixedAwardResolver(boost::optional<Amount> buyerAward)
        : m_BuyerAward(buyerAward)
    {
    }

    Award FixedAwardResolver::Resolve(const Trade& trade, const TradeContext&)
    {
        Award award;
        if (!m_BuyerAward)
        {
            PayoutSplit split = GetCooperativeSplit(trade);
            award.m_Buyer = split.m_Buyer;
            award.m_Seller = split.m_Seller;
            return award;
        }

        Amount escrow = GetEscrowAmount(trade.GetAmount(), trade.GetBuyerDeposit(), trade.GetSellerDeposit());
        award.m_Buyer = *m_BuyerAward;
        // an award above the escrow is left unbalanced and rejected by the caller
        award.m_Seller = award.m_Buyer <= escrow ? escrow - award.m_Buyer : 0;
        return award;
    }
}
