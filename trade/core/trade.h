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

#include "trade_context.h"

namespace settle::trade
{
    enum class SequenceKind : uint8_t
    {
        Main,
        Dispute
    };

    std::string to_string(SequenceKind kind);

    // where a suspended sequence resumes after restart
    struct SequencerCheckpoint
    {
        SequenceKind m_Kind = SequenceKind::Main;
        uint32_t m_NextStep = 0;
        boost::optional<TradeMessageType> m_Awaited;
    };

    //
    // One negotiated deal. Owns its shared context, mutated only by the steps
    // running under its sequencer
    //
    class Trade
    {
    public:
        using Ptr = std::shared_ptr<Trade>;
        using PhaseListener = std::function<void(const Trade&, TradePhase from, TradePhase to)>;

        Trade(const TradeID& tradeID, TradeRole role, IKeyService::Ptr keyService, ITradeTxService::Ptr txService);

        const TradeID& GetID() const { return m_ID; }
        TradeRole GetRole() const { return m_Role; }

        Timestamp GetCreateTime() const { return m_CreateTime; }
        void SetCreateTime(Timestamp t) { m_CreateTime = t; }
        Timestamp GetModifyTime() const { return m_ModifyTime; }
        void SetModifyTime(Timestamp t) { m_ModifyTime = t; }

        // network identities of the participants, own identity included
        void SetPeerID(TradeRole role, const PeerID& peerID);
        const PeerID& GetPeerID(TradeRole role) const;
        const PeerID& GetOwnID() const { return GetPeerID(m_Role); }
        // the other trading party for buyer and seller, empty for the arbitrator
        const PeerID& GetCounterparty() const;
        const PeerID& GetArbitrator() const { return GetPeerID(TradeRole::Arbitrator); }
        boost::optional<TradeRole> FindRoleOf(const PeerID& peerID) const;

        // terms are immutable once the fund lock is broadcast
        void SetTerms(Amount amount, Amount buyerDeposit, Amount sellerDeposit);
        void SetAmount(Amount amount);
        void SetBuyerDeposit(Amount deposit);
        void SetSellerDeposit(Amount deposit);
        Amount GetAmount() const { return m_Amount; }
        Amount GetBuyerDeposit() const { return m_BuyerDeposit; }
        Amount GetSellerDeposit() const { return m_SellerDeposit; }

        TradePhase GetPhase() const { return m_Phase; }
        // throws TradeFailedException(InvalidTransition) if newPhase is not reachable
        void TransitionTo(TradePhase newPhase);
        bool CanTransitionTo(TradePhase newPhase) const;
        static bool IsTransitionAllowed(TradePhase from, TradePhase to, bool fundsLocked);
        bool IsFundLocked() const;
        bool IsTerminal() const;
        bool CanCancel() const;

        void SetFailure(TradeFailureReason reason, const std::string& message);
        const boost::optional<TradeFailureReason>& GetFailureReason() const { return m_FailureReason; }
        const std::string& GetFailureMessage() const { return m_FailureMessage; }

        const SequencerCheckpoint& GetCheckpoint() const { return m_Checkpoint; }
        void SetCheckpoint(const SequencerCheckpoint& checkpoint) { m_Checkpoint = checkpoint; }

        TradeContext& GetContext() { return m_Context; }
        const TradeContext& GetContext() const { return m_Context; }

        void SetPhaseListener(PhaseListener listener) { m_PhaseListener = std::move(listener); }

        // loading from storage, bypasses the state machine
        void RestorePhase(TradePhase phase) { m_Phase = phase; }

    private:
        void CheckTermsMutable() const;

    private:
        TradeID m_ID;
        TradeRole m_Role;
        Timestamp m_CreateTime;
        Timestamp m_ModifyTime;
        std::map<TradeRole, PeerID> m_Peers;

        Amount m_Amount = 0;
        Amount m_BuyerDeposit = 0;
        Amount m_SellerDeposit = 0;

        TradePhase m_Phase = TradePhase::Negotiated;
        boost::optional<TradeFailureReason> m_FailureReason;
        std::string m_FailureMessage;
        SequencerCheckpoint m_Checkpoint;

        TradeContext m_Context;
        PhaseListener m_PhaseListener;
    };
}
