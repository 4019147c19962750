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

#include "common_steps.h"
#include "utility/helpers.h"

namespace settle::trade
{
    const char* kArbitratorKeyID = "arbitrator";

    ReceiveStep::ReceiveStep(TradeMessageType type, bool waitsForPeer)
        : m_Type(type)
        , m_WaitsForPeer(waitsForPeer)
    {
    }

    StepOutcome ReceiveStep::Run(StepContext& context)
    {
        auto message = context.TakeInbound(m_Type);
        if (!message)
        {
            return StepOutcome::Suspended(m_Type, m_WaitsForPeer ? context.m_PeerTimeoutMsec : kNoTimeout);
        }
        return Process(context, *message);
    }

    StepOutcome ReceiveStep::OnMessage(StepContext& context, const TradeMessage& message)
    {
        context.TakeInbound(m_Type);
        return Process(context, message);
    }

    StepOutcome ReceiveStep::OnTimeout(StepContext& context)
    {
        return EscalateTimeout(context, GetName());
    }

    StepOutcome EscalateTimeout(StepContext& context, const char* what)
    {
        std::string message = std::string(what) + ": peer did not respond";
        if (context.m_Trade.IsFundLocked())
        {
            LOG_WARNING() << context.m_Trade.GetID() << " funds are locked, escalating to the arbitrator";
            return StepOutcome::Failed(TradeFailureReason::PeerTimeout, message, TradePhase::Disputed);
        }
        return StepOutcome::Failed(TradeFailureReason::PeerTimeout, message, TradePhase::Error);
    }

    PayoutSplit GetCooperativeSplit(const Trade& trade)
    {
        PayoutSplit split;
        split.m_Seller = trade.GetSellerDeposit();
        if (!AddAmounts(trade.GetBuyerDeposit(), trade.GetAmount(), split.m_Buyer))
        {
            throw TradeFailedException(TradeFailureReason::TransactionConstructionFailure, "buyer payout overflow");
        }
        return split;
    }

    bool ConservesEscrow(const Trade& trade, Amount buyer, Amount seller)
    {
        Amount total = 0;
        if (!AddAmounts(buyer, seller, total))
        {
            return false;
        }
        return total == GetEscrowAmount(trade.GetAmount(), trade.GetBuyerDeposit(), trade.GetSellerDeposit());
    }

    KeyPair GetVerifiedMultiSigKeyPair(StepContext& context, const TradeID& keyID)
    {
        const auto& trade = context.m_Trade;
        PubKey committed = GetMandatory(context.m_Context.GetMultiSigPubKey(trade.GetRole()), "committed multisig key");

        AddressEntry entry = context.m_Context.GetKeyService()->GetOrCreateAddressEntry(keyID, AddressPurpose::MultiSig);
        if (entry.m_PubKey != committed)
        {
            LOG_ERROR() << trade.GetID() << " re-derived multisig key " << to_hex(entry.m_PubKey) << " differs from committed " << to_hex(committed);
            throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "own multisig key differs from the committed one");
        }

        KeyPair keyPair = context.m_Context.GetKeyService()->GetMultiSigKeyPair(keyID, committed);
        if (keyPair.m_PubKey != committed || keyPair.m_Secret.empty())
        {
            throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "key service returned a foreign key pair");
        }
        return keyPair;
    }
}
