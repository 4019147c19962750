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

#include "trade.h"

namespace settle::trade
{
    namespace
    {
        const PeerID kNoPeer;
    }

    std::string to_string(SequenceKind kind)
    {
        return kind == SequenceKind::Main ? "Main" : "Dispute";
    }

    Trade::Trade(const TradeID& tradeID, TradeRole role, IKeyService::Ptr keyService, ITradeTxService::Ptr txService)
        : m_ID(tradeID)
        , m_Role(role)
        , m_CreateTime(getTimestamp())
        , m_ModifyTime(m_CreateTime)
        , m_Context(std::move(keyService), std::move(txService))
    {
    }

    void Trade::SetPeerID(TradeRole role, const PeerID& peerID)
    {
        m_Peers[role] = peerID;
    }

    const PeerID& Trade::GetPeerID(TradeRole role) const
    {
        auto it = m_Peers.find(role);
        return it == m_Peers.end() ? kNoPeer : it->second;
    }

    const PeerID& Trade::GetCounterparty() const
    {
        auto role = GetCounterpartRole(m_Role);
        return role ? GetPeerID(*role) : kNoPeer;
    }

    boost::optional<TradeRole> Trade::FindRoleOf(const PeerID& peerID) const
    {
        for (const auto& [role, id] : m_Peers)
        {
            if (!id.empty() && id == peerID)
            {
                return role;
            }
        }
        return boost::none;
    }

    void Trade::CheckTermsMutable() const
    {
        if (m_Phase != TradePhase::Negotiated || IsFundLocked())
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation,
                "trade terms are immutable in phase " + to_string(m_Phase));
        }
    }

    void Trade::SetTerms(Amount amount, Amount buyerDeposit, Amount sellerDeposit)
    {
        CheckTermsMutable();
        m_Amount = amount;
        m_BuyerDeposit = buyerDeposit;
        m_SellerDeposit = sellerDeposit;
    }

    void Trade::SetAmount(Amount amount)
    {
        CheckTermsMutable();
        m_Amount = amount;
    }

    void Trade::SetBuyerDeposit(Amount deposit)
    {
        CheckTermsMutable();
        m_BuyerDeposit = deposit;
    }

    void Trade::SetSellerDeposit(Amount deposit)
    {
        CheckTermsMutable();
        m_SellerDeposit = deposit;
    }

    bool Trade::IsTransitionAllowed(TradePhase from, TradePhase to, bool fundsLocked)
    {
        switch (from)
        {
        case TradePhase::Negotiated:
            return to == TradePhase::DepositPublished
                || to == TradePhase::Canceled
                || to == TradePhase::Error
                || to == TradePhase::Disputed;
        case TradePhase::DepositPublished:
            return to == TradePhase::DepositConfirmed || to == TradePhase::Error || to == TradePhase::Disputed;
        case TradePhase::DepositConfirmed:
            return to == TradePhase::PayoutSigned || to == TradePhase::Error || to == TradePhase::Disputed;
        case TradePhase::PayoutSigned:
            return to == TradePhase::PayoutPublished || to == TradePhase::Error || to == TradePhase::Disputed;
        case TradePhase::PayoutPublished:
            return to == TradePhase::Completed || to == TradePhase::Error || to == TradePhase::Disputed;
        case TradePhase::Disputed:
            return to == TradePhase::Completed || to == TradePhase::Error;
        case TradePhase::Error:
            // funds committed on-ledger, the arbitrator is the way out
            return to == TradePhase::Disputed && fundsLocked;
        case TradePhase::Completed:
        case TradePhase::Canceled:
            return false;
        }
        return false;
    }

    bool Trade::CanTransitionTo(TradePhase newPhase) const
    {
        return IsTransitionAllowed(m_Phase, newPhase, IsFundLocked());
    }

    void Trade::TransitionTo(TradePhase newPhase)
    {
        if (!CanTransitionTo(newPhase))
        {
            throw TradeFailedException(TradeFailureReason::InvalidTransition,
                "transition " + to_string(m_Phase) + " -> " + to_string(newPhase) + " is not allowed");
        }

        TradePhase from = m_Phase;
        m_Phase = newPhase;
        m_ModifyTime = getTimestamp();
        LOG_INFO() << m_ID << "[" << m_Role << "] " << from << " -> " << newPhase;
        if (m_PhaseListener)
        {
            m_PhaseListener(*this, from, newPhase);
        }
    }

    bool Trade::IsFundLocked() const
    {
        return m_Context.GetFundLockTx().is_initialized();
    }

    bool Trade::IsTerminal() const
    {
        switch (m_Phase)
        {
        case TradePhase::Completed:
        case TradePhase::Canceled:
            return true;
        case TradePhase::Error:
            return !IsFundLocked();
        default:
            return false;
        }
    }

    bool Trade::CanCancel() const
    {
        return m_Phase == TradePhase::Negotiated && !IsFundLocked();
    }

    void Trade::SetFailure(TradeFailureReason reason, const std::string& message)
    {
        m_FailureReason = reason;
        m_FailureMessage = message;
        m_ModifyTime = getTimestamp();
    }
}
