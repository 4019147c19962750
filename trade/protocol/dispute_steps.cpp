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

#include "dispute_steps.h"

namespace settle::trade
{
    ///////////////////////////
    // SendDisputeToArbitrator

    StepOutcome SendDisputeToArbitrator::Run(StepContext& context)
    {
        auto& trade = context.m_Trade;
        if (trade.GetRole() == TradeRole::Arbitrator)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "arbitrator cannot open a dispute");
        }
        if (!trade.IsFundLocked())
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "nothing to dispute before the fund lock");
        }

        if (trade.GetPhase() != TradePhase::Disputed)
        {
            trade.TransitionTo(TradePhase::Disputed);
        }

        Send(context);
        return StepOutcome::Suspended(TradeMessageType::DisputeResult, kNoTimeout);
    }

    void SendDisputeToArbitrator::OnResume(StepContext& context)
    {
        // arbitrator ignores a ticket for a dispute it already handles
        Send(context);
    }

    void SendDisputeToArbitrator::Send(StepContext& context)
    {
        const auto& trade = context.m_Trade;
        const auto& tradeContext = context.m_Context;

        MultiSigKeySet keySet = GetMandatory(tradeContext.GetMultiSigKeySet(), "multisig key set");

        TradeMessage ticket = context.CreateMessage(TradeMessageType::DisputeOpened);
        ticket.AddParameter(TradeParameterID::Amount, trade.GetAmount())
            .AddParameter(TradeParameterID::BuyerDeposit, trade.GetBuyerDeposit())
            .AddParameter(TradeParameterID::SellerDeposit, trade.GetSellerDeposit())
            .AddParameter(TradeParameterID::BuyerID, trade.GetPeerID(TradeRole::Buyer))
            .AddParameter(TradeParameterID::SellerID, trade.GetPeerID(TradeRole::Seller))
            .AddParameter(TradeParameterID::BuyerMultiSigKey, keySet.m_Buyer)
            .AddParameter(TradeParameterID::SellerMultiSigKey, keySet.m_Seller)
            .AddParameter(TradeParameterID::ArbitratorMultiSigKey, keySet.m_Arbitrator)
            .AddParameter(TradeParameterID::BuyerPayoutAddress, GetMandatory(tradeContext.GetPayoutAddress(TradeRole::Buyer), "buyer payout address"))
            .AddParameter(TradeParameterID::SellerPayoutAddress, GetMandatory(tradeContext.GetPayoutAddress(TradeRole::Seller), "seller payout address"))
            .AddParameter(TradeParameterID::FundLockTx, GetMandatory(tradeContext.GetFundLockTx(), "fund lock transaction"))
            .AddParameter(TradeParameterID::DisputeOpener, trade.GetRole());

        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] dispute submitted to " << trade.GetArbitrator();
        context.SendTo(TradeRole::Arbitrator, ticket);
    }

    ///////////////////////////
    // ProcessDisputeResult

    StepOutcome ProcessDisputeResult::Process(StepContext& context, const TradeMessage& message)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;
        auto txService = tradeContext.GetTxService();
        TradeRole role = trade.GetRole();

        if (message.m_SenderRole != TradeRole::Arbitrator)
        {
            return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "dispute result not sent by the arbitrator");
        }

        Award award;
        award.m_Buyer = message.GetMandatoryParameter<Amount>(TradeParameterID::AwardedBuyerAmount);
        award.m_Seller = message.GetMandatoryParameter<Amount>(TradeParameterID::AwardedSellerAmount);
        auto arbitratorSignature = message.GetMandatoryParameter<Signature>(TradeParameterID::ArbitratorPayoutSignature);

        if (!ConservesEscrow(trade, award.m_Buyer, award.m_Seller))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "awarded amounts do not add up to the escrow");
        }

        PayoutTerms terms = GetMandatory(tradeContext.GetPayoutTerms(award.m_Buyer, award.m_Seller), "payout terms");
        if (!txService->VerifyPayoutSignature(terms, terms.m_KeySet.m_Arbitrator, arbitratorSignature))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "arbitrator signature does not match the awarded payout");
        }

        if (trade.GetPhase() != TradePhase::Disputed)
        {
            trade.TransitionTo(TradePhase::Disputed);
        }

        KeyPair keyPair = GetVerifiedMultiSigKeyPair(context, trade.GetID());
        Signature ownSignature = txService->SignPayout(terms, keyPair);

        PayoutSignatures signatures;
        signatures[TradeRole::Arbitrator] = arbitratorSignature;
        signatures[role] = ownSignature;
        PayoutTx payout = txService->FinalizePayout(terms, signatures);

        // the other party may publish the same payout, the ledger accepts it once
        txService->PublishPayout(payout);

        tradeContext.SetAward(award);
        tradeContext.SetPayoutSignature(TradeRole::Arbitrator, arbitratorSignature);
        tradeContext.SetPayoutSignature(role, ownSignature);
        tradeContext.SetPayoutTx(payout);

        LOG_INFO() << trade.GetID() << "[" << role << "] dispute payout " << to_string(payout.m_TxID)
            << " buyer=" << award.m_Buyer << " seller=" << award.m_Seller;
        trade.TransitionTo(TradePhase::Completed);
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // ProcessDisputeTicket

    StepOutcome ProcessDisputeTicket::Process(StepContext& context, const TradeMessage& message)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;

        if (trade.GetRole() != TradeRole::Arbitrator)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "dispute ticket delivered to a trading party");
        }

        auto opener = message.GetMandatoryParameter<TradeRole>(TradeParameterID::DisputeOpener);
        if (opener == TradeRole::Arbitrator || opener != message.m_SenderRole)
        {
            return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "dispute opened on behalf of " + to_string(opener));
        }

        auto fundLock = message.GetMandatoryParameter<FundLockTx>(TradeParameterID::FundLockTx);

        // the ticket defines the trade on the arbitrator side
        if (!trade.IsFundLocked())
        {
            trade.SetTerms(message.GetMandatoryParameter<Amount>(TradeParameterID::Amount),
                message.GetMandatoryParameter<Amount>(TradeParameterID::BuyerDeposit),
                message.GetMandatoryParameter<Amount>(TradeParameterID::SellerDeposit));
        }
        trade.SetPeerID(TradeRole::Buyer, message.GetMandatoryParameter<PeerID>(TradeParameterID::BuyerID));
        trade.SetPeerID(TradeRole::Seller, message.GetMandatoryParameter<PeerID>(TradeParameterID::SellerID));

        if (fundLock.m_EscrowAmount != GetEscrowAmount(trade.GetAmount(), trade.GetBuyerDeposit(), trade.GetSellerDeposit()))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "fund lock escrow differs from the disputed terms");
        }

        MultiSigKeySet keySet;
        keySet.m_Buyer = message.GetMandatoryParameter<PubKey>(TradeParameterID::BuyerMultiSigKey);
        keySet.m_Seller = message.GetMandatoryParameter<PubKey>(TradeParameterID::SellerMultiSigKey);
        keySet.m_Arbitrator = message.GetMandatoryParameter<PubKey>(TradeParameterID::ArbitratorMultiSigKey);

        PayoutAddresses addresses;
        addresses.m_Buyer = message.GetMandatoryParameter<std::string>(TradeParameterID::BuyerPayoutAddress);
        addresses.m_Seller = message.GetMandatoryParameter<std::string>(TradeParameterID::SellerPayoutAddress);

        AddressEntry own = tradeContext.GetKeyService()->GetOrCreateAddressEntry(kArbitratorKeyID, AddressPurpose::MultiSig);
        if (keySet.m_Arbitrator != own.m_PubKey)
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "escrow is not locked to this arbitrator's key");
        }
        // the opener must not redirect the other party's share
        if (!tradeContext.GetTxService()->VerifyFundLockTx(fundLock, keySet, addresses))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "fund lock does not commit to the disputed keys and payout addresses");
        }

        tradeContext.SetMultiSigPubKey(TradeRole::Buyer, keySet.m_Buyer);
        tradeContext.SetMultiSigPubKey(TradeRole::Seller, keySet.m_Seller);
        tradeContext.SetMultiSigPubKey(TradeRole::Arbitrator, keySet.m_Arbitrator);
        tradeContext.SetPayoutAddress(TradeRole::Buyer, addresses.m_Buyer);
        tradeContext.SetPayoutAddress(TradeRole::Seller, addresses.m_Seller);
        tradeContext.SetFundLockTx(fundLock);

        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] dispute opened by " << opener;
        if (trade.GetPhase() != TradePhase::Disputed)
        {
            trade.TransitionTo(TradePhase::Disputed);
        }
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // ArbitratorSignsPayout

    ArbitratorSignsPayout::ArbitratorSignsPayout(IDisputeResolver::Ptr resolver)
        : m_Resolver(std::move(resolver))
    {
    }

    StepOutcome ArbitratorSignsPayout::Run(StepContext& context)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;

        if (!m_Resolver)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "no dispute resolver configured");
        }

        Award award = m_Resolver->Resolve(trade, tradeContext);
        if (!ConservesEscrow(trade, award.m_Buyer, award.m_Seller))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure,
                "award buyer=" + std::to_string(award.m_Buyer) + " seller=" + std::to_string(award.m_Seller) + " does not conserve the escrow");
        }

        PayoutTerms terms = GetMandatory(tradeContext.GetPayoutTerms(award.m_Buyer, award.m_Seller), "payout terms");
        KeyPair keyPair = GetVerifiedMultiSigKeyPair(context, kArbitratorKeyID);
        Signature signature = tradeContext.GetTxService()->SignPayout(terms, keyPair);

        tradeContext.SetAward(award);
        tradeContext.SetPayoutSignature(TradeRole::Arbitrator, signature);
        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] awarded buyer=" << award.m_Buyer << " seller=" << award.m_Seller;
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // SendDisputeResult

    StepOutcome SendDisputeResult::Run(StepContext& context)
    {
        auto& trade = context.m_Trade;
        const auto& tradeContext = context.m_Context;

        Award award = GetMandatory(tradeContext.GetAward(), "award");
        Signature signature = GetMandatory(tradeContext.GetPayoutSignature(TradeRole::Arbitrator), "arbitrator payout signature");

        TradeMessage message = context.CreateMessage(TradeMessageType::DisputeResult);
        message.AddParameter(TradeParameterID::AwardedBuyerAmount, award.m_Buyer)
            .AddParameter(TradeParameterID::AwardedSellerAmount, award.m_Seller)
            .AddParameter(TradeParameterID::ArbitratorPayoutSignature, signature);

        context.SendTo(TradeRole::Buyer, message);
        context.SendTo(TradeRole::Seller, message);

        trade.TransitionTo(TradePhase::Completed);
        return StepOutcome::Complete();
    }
}
