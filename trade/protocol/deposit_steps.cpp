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

#include "deposit_steps.h"
#include "utility/helpers.h"

namespace settle::trade
{
    namespace
    {
        void CommitOwnAddresses(StepContext& context)
        {
            auto& trade = context.m_Trade;
            auto keyService = context.m_Context.GetKeyService();

            AddressEntry multiSig = keyService->GetOrCreateAddressEntry(trade.GetID(), AddressPurpose::MultiSig);
            AddressEntry payout = keyService->GetOrCreateAddressEntry(trade.GetID(), AddressPurpose::Payout);

            context.m_Context.SetMultiSigPubKey(trade.GetRole(), multiSig.m_PubKey);
            context.m_Context.SetPayoutAddress(trade.GetRole(), payout.m_Address);
        }

        bool EscrowMatches(const Trade& trade, const FundLockTx& fundLock)
        {
            return fundLock.m_EscrowAmount == GetEscrowAmount(trade.GetAmount(), trade.GetBuyerDeposit(), trade.GetSellerDeposit());
        }
    }

    ///////////////////////////
    // SendTakeOfferRequest

    StepOutcome SendTakeOfferRequest::Run(StepContext& context)
    {
        if (context.m_Trade.GetRole() != TradeRole::Buyer)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "only the buyer takes an offer");
        }

        CommitOwnAddresses(context);
        Send(context);
        return StepOutcome::Suspended(TradeMessageType::DepositTxPublished, context.m_PeerTimeoutMsec);
    }

    void SendTakeOfferRequest::OnResume(StepContext& context)
    {
        // seller ignores a repeated request for a trade it already runs
        Send(context);
    }

    void SendTakeOfferRequest::Send(StepContext& context)
    {
        const auto& trade = context.m_Trade;
        const auto& tradeContext = context.m_Context;

        TradeMessage message = context.CreateMessage(TradeMessageType::TakeOffer);
        message.AddParameter(TradeParameterID::Amount, trade.GetAmount())
            .AddParameter(TradeParameterID::BuyerDeposit, trade.GetBuyerDeposit())
            .AddParameter(TradeParameterID::SellerDeposit, trade.GetSellerDeposit())
            .AddParameter(TradeParameterID::ArbitratorID, trade.GetArbitrator())
            .AddParameter(TradeParameterID::BuyerID, trade.GetOwnID())
            .AddParameter(TradeParameterID::BuyerMultiSigKey, GetMandatory(tradeContext.GetMultiSigPubKey(TradeRole::Buyer), "buyer multisig key"))
            .AddParameter(TradeParameterID::BuyerPayoutAddress, GetMandatory(tradeContext.GetPayoutAddress(TradeRole::Buyer), "buyer payout address"));

        context.SendTo(TradeRole::Seller, message);
    }

    ///////////////////////////
    // ProcessDepositTxPublished

    StepOutcome ProcessDepositTxPublished::Process(StepContext& context, const TradeMessage& message)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;

        auto sellerKey = message.GetMandatoryParameter<PubKey>(TradeParameterID::SellerMultiSigKey);
        auto sellerAddress = message.GetMandatoryParameter<std::string>(TradeParameterID::SellerPayoutAddress);
        auto arbitratorKey = message.GetMandatoryParameter<PubKey>(TradeParameterID::ArbitratorMultiSigKey);
        auto fundLock = message.GetMandatoryParameter<FundLockTx>(TradeParameterID::FundLockTx);

        if (!EscrowMatches(trade, fundLock))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure,
                "fund lock escrow " + std::to_string(fundLock.m_EscrowAmount) + " differs from the agreed terms");
        }

        // arbitrator key was committed from the offer, a different one throws
        if (!tradeContext.GetMultiSigPubKey(TradeRole::Arbitrator))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "arbitrator key was not committed with the offer");
        }
        tradeContext.SetMultiSigPubKey(TradeRole::Arbitrator, arbitratorKey);
        tradeContext.SetMultiSigPubKey(TradeRole::Seller, sellerKey);
        tradeContext.SetPayoutAddress(TradeRole::Seller, sellerAddress);

        MultiSigKeySet keySet = GetMandatory(tradeContext.GetMultiSigKeySet(), "multisig key set");
        PayoutAddresses addresses = GetMandatory(tradeContext.GetPayoutAddresses(), "payout addresses");
        if (!tradeContext.GetTxService()->VerifyFundLockTx(fundLock, keySet, addresses))
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure, "fund lock does not pay into the agreed 2-of-3 output");
        }

        tradeContext.SetFundLockTx(fundLock);
        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] fund lock " << to_string(fundLock.m_TxID) << " accepted";
        trade.TransitionTo(TradePhase::DepositPublished);
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // ProcessTakeOffer

    StepOutcome ProcessTakeOffer::Process(StepContext& context, const TradeMessage& message)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;

        if (trade.GetRole() != TradeRole::Seller)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "only the seller accepts a take offer request");
        }

        auto amount = message.GetMandatoryParameter<Amount>(TradeParameterID::Amount);
        auto buyerDeposit = message.GetMandatoryParameter<Amount>(TradeParameterID::BuyerDeposit);
        auto sellerDeposit = message.GetMandatoryParameter<Amount>(TradeParameterID::SellerDeposit);
        auto arbitrator = message.GetMandatoryParameter<PeerID>(TradeParameterID::ArbitratorID);

        if (amount != trade.GetAmount()
            || buyerDeposit != trade.GetBuyerDeposit()
            || sellerDeposit != trade.GetSellerDeposit())
        {
            return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "take offer request does not match the offer terms");
        }
        if (arbitrator != trade.GetArbitrator())
        {
            return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "take offer request names another arbitrator " + arbitrator);
        }

        tradeContext.SetMultiSigPubKey(TradeRole::Buyer, message.GetMandatoryParameter<PubKey>(TradeParameterID::BuyerMultiSigKey));
        tradeContext.SetPayoutAddress(TradeRole::Buyer, message.GetMandatoryParameter<std::string>(TradeParameterID::BuyerPayoutAddress));

        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] offer taken by " << trade.GetPeerID(TradeRole::Buyer);
        return StepOutcome::Complete();
    }

    ///////////////////////////
    // PublishFundLockTx

    StepOutcome PublishFundLockTx::Run(StepContext& context)
    {
        auto& trade = context.m_Trade;
        auto& tradeContext = context.m_Context;

        if (trade.GetRole() != TradeRole::Seller)
        {
            return StepOutcome::Failed(TradeFailureReason::ProgrammingInvariantViolation, "only the seller locks the funds");
        }

        CommitOwnAddresses(context);

        MultiSigKeySet keySet = GetMandatory(tradeContext.GetMultiSigKeySet(), "multisig key set");
        Amount escrow = GetEscrowAmount(trade.GetAmount(), trade.GetBuyerDeposit(), trade.GetSellerDeposit());

        PayoutAddresses addresses = GetMandatory(tradeContext.GetPayoutAddresses(), "payout addresses");
        FundLockTx fundLock = tradeContext.GetTxService()->PublishFundLockTx(trade.GetID(), escrow, keySet, addresses);
        tradeContext.SetFundLockTx(fundLock);
        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] published fund lock " << to_string(fundLock.m_TxID) << " escrow=" << escrow;
        trade.TransitionTo(TradePhase::DepositPublished);

        TradeMessage message = context.CreateMessage(TradeMessageType::DepositTxPublished);
        message.AddParameter(TradeParameterID::SellerMultiSigKey, keySet.m_Seller)
            .AddParameter(TradeParameterID::SellerPayoutAddress, GetMandatory(tradeContext.GetPayoutAddress(TradeRole::Seller), "seller payout address"))
            .AddParameter(TradeParameterID::ArbitratorMultiSigKey, keySet.m_Arbitrator)
            .AddParameter(TradeParameterID::FundLockTx, fundLock);
        context.SendTo(TradeRole::Buyer, message);

        return StepOutcome::Complete();
    }

    ///////////////////////////
    // AwaitFundLockConfirmation

    StepOutcome AwaitFundLockConfirmation::Run(StepContext& context)
    {
        Subscribe(context);
        return StepOutcome::Suspended(TradeMessageType::FundLockConfirmed, kNoTimeout);
    }

    StepOutcome AwaitFundLockConfirmation::OnMessage(StepContext& context, const TradeMessage& message)
    {
        context.TakeInbound(TradeMessageType::FundLockConfirmed);

        auto& trade = context.m_Trade;
        const FundLockTx& fundLock = GetMandatory(context.m_Context.GetFundLockTx(), "fund lock transaction");
        auto txID = message.GetMandatoryParameter<TxID>(TradeParameterID::FundLockTxID);
        if (txID != fundLock.m_TxID)
        {
            return StepOutcome::Failed(TradeFailureReason::SecurityIntegrityFailure,
                "confirmation for a foreign transaction " + to_string(txID), TradePhase::Disputed);
        }

        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] fund lock confirmed";
        trade.TransitionTo(TradePhase::DepositConfirmed);
        return StepOutcome::Complete();
    }

    void AwaitFundLockConfirmation::OnResume(StepContext& context)
    {
        Subscribe(context);
    }

    void AwaitFundLockConfirmation::Subscribe(StepContext& context)
    {
        const FundLockTx& fundLock = GetMandatory(context.m_Context.GetFundLockTx(), "fund lock transaction");

        // the gateway outlives the trades it serves
        auto& gateway = context.m_Gateway;
        PeerID self = context.m_Trade.GetOwnID();
        TradeMessage notification = context.CreateMessage(TradeMessageType::FundLockConfirmed);

        context.m_Context.GetTxService()->WaitForConfirmation(fundLock,
            [&gateway, self, notification](const TxID& txID) mutable
            {
                notification.AddParameter(TradeParameterID::FundLockTxID, txID);
                gateway.Send(self, notification);
            });
    }
}
