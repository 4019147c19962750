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

#include "sequencer.h"
#include "trade_db.h"
#include "utility/io/timer.h"

namespace settle::trade
{
    struct ITradeObserver
    {
        virtual ~ITradeObserver() = default;
        virtual void OnTradePhaseChanged(const TradeID& tradeID, TradePhase from, TradePhase to) = 0;
    };

    //
    // Runs all trades of one local identity on the reactor thread and routes
    // inbound messages to them. The gateway must deliver asynchronously,
    // through the reactor, never from inside Send
    //
    class TradeManager
    {
    public:
        using TradeHandle = std::shared_ptr<const Trade>;

        enum class CancelResult : uint8_t
        {
            Canceled,
            NotFound,
            NotAllowed
        };

        static constexpr uint32_t kDefaultPeerTimeoutMsec = 60000;

        TradeManager(const PeerID& ownID,
                     io::Reactor& reactor,
                     TradeDB::Ptr db,
                     IKeyService::Ptr keyService,
                     ITradeTxService::Ptr txService,
                     ITradeGateway& gateway,
                     IDisputeResolver::Ptr resolver = IDisputeResolver::Ptr(),
                     uint32_t peerTimeoutMsec = kDefaultPeerTimeoutMsec);
        ~TradeManager();

        const PeerID& GetOwnID() const { return m_OwnID; }

        // makes the offer takeable, a TakeOffer for it starts the seller side
        void PublishOffer(const Offer& offer);

        // throws TradeFailedException(ProgrammingInvariantViolation) if the trade already exists
        TradeHandle StartTrade(const Offer& offer, TradeRole role, const PeerID& counterparty);
        CancelResult CancelTrade(const TradeID& tradeID);
        bool OpenDispute(const TradeID& tradeID);

        boost::optional<TradePhase> GetPhase(const TradeID& tradeID) const;
        TradeHandle GetTrade(const TradeID& tradeID) const;
        // status of the sequencer currently driving the trade
        boost::optional<StepSequencer::Status> GetSequencerStatus(const TradeID& tradeID) const;

        void Subscribe(ITradeObserver* observer);
        void Unsubscribe(ITradeObserver* observer);

        // inbound channel
        void OnTradeMessage(const PeerID& from, const TradeMessage& message);

        // restores unfinished trades from the database, returns their count
        size_t ResumeAllTrades();
        // restores them without running any step, the owner may still cancel or dispute them
        size_t LoadAllTrades();

        // applied to every sequencer created afterwards
        void SetInterceptHook(StepSequencer::InterceptHook hook);

    private:
        struct ActiveTrade
        {
            Trade::Ptr m_Trade;
            std::unique_ptr<StepSequencer> m_Sequencer;
            io::Timer::Ptr m_Timer;
            // arrived ahead of the step that consumes them
            std::vector<TradeMessage> m_HeldBack;
        };

        ActiveTrade& AddTrade(Trade::Ptr trade);
        Trade::Ptr CreateTrade(const Offer& offer, TradeRole role, const PeerID& counterparty);
        void StartSequence(ActiveTrade& active, SequenceKind kind, uint32_t firstStep = 0);
        void CreateSequencer(ActiveTrade& active, SequenceKind kind);
        void DeliverMessage(ActiveTrade& active, const TradeMessage& message);
        void HoldBack(ActiveTrade& active, const TradeMessage& message);
        void DeliverHeldBack(ActiveTrade& active);
        void OnTimeout(const TradeID& tradeID);
        void UpdateTrade(ActiveTrade& active);
        void ArmTimer(ActiveTrade& active);
        void CancelTimer(ActiveTrade& active);
        void SaveTrade(const Trade& trade);
        void NotifyPhaseChanged(const Trade& trade, TradePhase from, TradePhase to);

        void OnNewTradeMessage(const PeerID& from, const TradeMessage& message);
        void OnCancelMessage(ActiveTrade& active, const TradeMessage& message);
        void OnUninvitedDisputeResult(ActiveTrade& active, const TradeMessage& message);
        bool IsValidSender(const Trade& trade, const PeerID& from, const TradeMessage& message) const;

    private:
        PeerID m_OwnID;
        io::Reactor& m_Reactor;
        TradeDB::Ptr m_DB;
        IKeyService::Ptr m_KeyService;
        ITradeTxService::Ptr m_TxService;
        ITradeGateway& m_Gateway;
        IDisputeResolver::Ptr m_Resolver;
        uint32_t m_PeerTimeoutMsec;
        StepSequencer::InterceptHook m_Hook;

        std::map<TradeID, Offer> m_Offers;
        std::map<TradeID, ActiveTrade> m_ActiveTrades;
        std::vector<ITradeObserver*> m_Subscribers;
    };

    std::string to_string(TradeManager::CancelResult result);
}
