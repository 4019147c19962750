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

#include "trade_manager.h"
#include "trade/protocol/protocols.h"

#include <algorithm>
#include <assert.h>

namespace settle::trade
{
    namespace
    {
        // messages that open a trade on the receiving side
        bool IsOpeningMessage(TradeMessageType type)
        {
            return type == TradeMessageType::TakeOffer || type == TradeMessageType::DisputeOpened;
        }

        bool IsDisputeMessage(TradeMessageType type)
        {
            return type == TradeMessageType::DisputeOpened || type == TradeMessageType::DisputeResult;
        }
    }

    std::string to_string(TradeManager::CancelResult result)
    {
        switch (result)
        {
        case TradeManager::CancelResult::Canceled: return "Canceled";
        case TradeManager::CancelResult::NotFound: return "NotFound";
        case TradeManager::CancelResult::NotAllowed: return "NotAllowed";
        }
        return "Unknown";
    }

    TradeManager::TradeManager(const PeerID& ownID,
                               io::Reactor& reactor,
                               TradeDB::Ptr db,
                               IKeyService::Ptr keyService,
                               ITradeTxService::Ptr txService,
                               ITradeGateway& gateway,
                               IDisputeResolver::Ptr resolver,
                               uint32_t peerTimeoutMsec)
        : m_OwnID(ownID)
        , m_Reactor(reactor)
        , m_DB(std::move(db))
        , m_KeyService(std::move(keyService))
        , m_TxService(std::move(txService))
        , m_Gateway(gateway)
        , m_Resolver(std::move(resolver))
        , m_PeerTimeoutMsec(peerTimeoutMsec)
    {
        if (m_OwnID.empty() || !m_KeyService || !m_TxService)
        {
            throw std::invalid_argument("trade manager needs an identity, a key service and a transaction service");
        }
    }

    TradeManager::~TradeManager()
    {
        for (auto& [id, active] : m_ActiveTrades)
        {
            active.m_Trade->SetPhaseListener(Trade::PhaseListener());
            CancelTimer(active);
        }
    }

    void TradeManager::PublishOffer(const Offer& offer)
    {
        if (offer.m_OfferID.empty() || offer.m_Arbitrator.empty())
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "offer needs an id and an arbitrator");
        }
        if (offer.m_ArbitratorPubKey.empty())
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "offer " + offer.m_OfferID + " has no arbitrator key");
        }
        LOG_INFO() << m_OwnID << " published offer " << offer.m_OfferID << " amount=" << offer.m_Amount;
        m_Offers[offer.m_OfferID] = offer;
    }

    TradeManager::TradeHandle TradeManager::StartTrade(const Offer& offer, TradeRole role, const PeerID& counterparty)
    {
        auto trade = CreateTrade(offer, role, counterparty);
        LOG_INFO() << trade->GetID() << "[" << role << "] starting trade with " << counterparty;

        auto& active = AddTrade(trade);
        StartSequence(active, SequenceKind::Main);
        return trade;
    }

    Trade::Ptr TradeManager::CreateTrade(const Offer& offer, TradeRole role, const PeerID& counterparty)
    {
        const TradeID& tradeID = offer.m_OfferID;
        if (tradeID.empty())
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "offer has no id");
        }
        if (m_ActiveTrades.count(tradeID) || (m_DB && m_DB->loadTrade(m_OwnID, tradeID, m_KeyService, m_TxService)))
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "trade " + tradeID + " already exists");
        }

        // the escrow is only 2-of-3 if the arbitrator key is fixed before any peer supplies one
        if (role != TradeRole::Arbitrator && offer.m_ArbitratorPubKey.empty())
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "offer " + tradeID + " has no arbitrator key");
        }

        auto trade = std::make_shared<Trade>(tradeID, role, m_KeyService, m_TxService);
        trade->SetPeerID(role, m_OwnID);
        trade->SetPeerID(TradeRole::Arbitrator, role == TradeRole::Arbitrator ? m_OwnID : offer.m_Arbitrator);

        auto counterpartRole = GetCounterpartRole(role);
        if (counterpartRole)
        {
            trade->SetPeerID(*counterpartRole, counterparty);
        }

        trade->SetTerms(offer.m_Amount, offer.m_BuyerDeposit, offer.m_SellerDeposit);
        if (role != TradeRole::Arbitrator)
        {
            trade->GetContext().SetMultiSigPubKey(TradeRole::Arbitrator, offer.m_ArbitratorPubKey);
        }
        return trade;
    }

    TradeManager::ActiveTrade& TradeManager::AddTrade(Trade::Ptr trade)
    {
        trade->SetPhaseListener([this](const Trade& t, TradePhase from, TradePhase to)
        {
            NotifyPhaseChanged(t, from, to);
        });

        auto& active = m_ActiveTrades[trade->GetID()];
        active.m_Trade = std::move(trade);
        return active;
    }

    void TradeManager::CreateSequencer(ActiveTrade& active, SequenceKind kind)
    {
        const auto& trade = *active.m_Trade;
        auto steps = CreateSteps(trade.GetRole(), kind, m_Resolver);
        active.m_Sequencer = std::make_unique<StepSequencer>(*active.m_Trade, kind, std::move(steps), m_Gateway, m_PeerTimeoutMsec);
        if (m_Hook)
        {
            active.m_Sequencer->SetInterceptHook(m_Hook);
        }
    }

    void TradeManager::StartSequence(ActiveTrade& active, SequenceKind kind, uint32_t firstStep)
    {
        CancelTimer(active);
        active.m_HeldBack.clear();
        if (kind != SequenceKind::Main || firstStep != 0)
        {
            SequencerCheckpoint checkpoint;
            checkpoint.m_Kind = kind;
            checkpoint.m_NextStep = firstStep;
            active.m_Trade->SetCheckpoint(checkpoint);
        }

        CreateSequencer(active, kind);
        SaveTrade(*active.m_Trade);
        active.m_Sequencer->Run();
        UpdateTrade(active);
    }

    void TradeManager::UpdateTrade(ActiveTrade& active)
    {
        auto& trade = *active.m_Trade;
        auto& sequencer = *active.m_Sequencer;

        CancelTimer(active);
        if (sequencer.GetStatus() == StepSequencer::Status::Suspended && sequencer.GetTimeout() != kNoTimeout)
        {
            ArmTimer(active);
        }
        SaveTrade(trade);

        // a main sequence that escalated hands the trade to the arbitrator
        if (sequencer.GetStatus() == StepSequencer::Status::Failed
            && sequencer.GetKind() == SequenceKind::Main
            && trade.GetPhase() == TradePhase::Disputed
            && trade.GetRole() != TradeRole::Arbitrator)
        {
            LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] opening dispute";
            StartSequence(active, SequenceKind::Dispute);
            return;
        }

        if (!active.m_HeldBack.empty())
        {
            DeliverHeldBack(active);
        }
    }

    void TradeManager::ArmTimer(ActiveTrade& active)
    {
        if (!active.m_Timer)
        {
            active.m_Timer = io::Timer::create(m_Reactor);
        }
        TradeID tradeID = active.m_Trade->GetID();
        active.m_Timer->start(active.m_Sequencer->GetTimeout(), false, [this, tradeID]()
        {
            OnTimeout(tradeID);
        });
    }

    void TradeManager::CancelTimer(ActiveTrade& active)
    {
        if (active.m_Timer)
        {
            active.m_Timer->cancel();
        }
    }

    void TradeManager::OnTimeout(const TradeID& tradeID)
    {
        auto it = m_ActiveTrades.find(tradeID);
        if (it == m_ActiveTrades.end() || !it->second.m_Sequencer)
        {
            return;
        }
        try
        {
            it->second.m_Sequencer->OnTimeout();
            UpdateTrade(it->second);
        }
        catch (const std::exception& ex)
        {
            LOG_ERROR() << tradeID << " timeout handling failed: " << ex.what();
        }
    }

    void TradeManager::SaveTrade(const Trade& trade)
    {
        if (m_DB)
        {
            m_DB->saveTrade(trade);
        }
    }

    void TradeManager::NotifyPhaseChanged(const Trade& trade, TradePhase from, TradePhase to)
    {
        auto subscribers = m_Subscribers;
        for (auto* subscriber : subscribers)
        {
            subscriber->OnTradePhaseChanged(trade.GetID(), from, to);
        }
    }

    TradeManager::CancelResult TradeManager::CancelTrade(const TradeID& tradeID)
    {
        auto it = m_ActiveTrades.find(tradeID);
        if (it == m_ActiveTrades.end())
        {
            LOG_WARNING() << tradeID << " cannot cancel, trade is unknown";
            return CancelResult::NotFound;
        }

        auto& active = it->second;
        auto& trade = *active.m_Trade;
        if (trade.GetRole() == TradeRole::Arbitrator || !trade.CanCancel())
        {
            LOG_WARNING() << tradeID << " cannot cancel in phase " << trade.GetPhase();
            return CancelResult::NotAllowed;
        }

        LOG_INFO() << tradeID << "[" << trade.GetRole() << "] canceling trade";
        CancelTimer(active);
        trade.SetFailure(TradeFailureReason::Canceled, "canceled by the owner");
        trade.TransitionTo(TradePhase::Canceled);
        SaveTrade(trade);

        const PeerID& counterparty = trade.GetCounterparty();
        if (!counterparty.empty())
        {
            TradeMessage message(trade.GetID(), trade.GetRole(), TradeMessageType::CancelTrade);
            message.m_From = m_OwnID;
            m_Gateway.Send(counterparty, message);
        }
        return CancelResult::Canceled;
    }

    bool TradeManager::OpenDispute(const TradeID& tradeID)
    {
        auto it = m_ActiveTrades.find(tradeID);
        if (it == m_ActiveTrades.end())
        {
            LOG_WARNING() << tradeID << " cannot open dispute, trade is unknown";
            return false;
        }

        auto& active = it->second;
        const auto& trade = *active.m_Trade;
        if (trade.GetRole() == TradeRole::Arbitrator || !trade.IsFundLocked() || trade.IsTerminal())
        {
            LOG_WARNING() << tradeID << " cannot open dispute in phase " << trade.GetPhase();
            return false;
        }
        auto kind = active.m_Sequencer ? active.m_Sequencer->GetKind() : trade.GetCheckpoint().m_Kind;
        if (kind == SequenceKind::Dispute)
        {
            LOG_WARNING() << tradeID << " dispute is already open";
            return false;
        }
        if (trade.GetPhase() != TradePhase::Disputed && !trade.CanTransitionTo(TradePhase::Disputed))
        {
            LOG_WARNING() << tradeID << " cannot open dispute in phase " << trade.GetPhase();
            return false;
        }

        LOG_INFO() << tradeID << "[" << trade.GetRole() << "] opening dispute";
        StartSequence(active, SequenceKind::Dispute);
        return true;
    }

    boost::optional<TradePhase> TradeManager::GetPhase(const TradeID& tradeID) const
    {
        auto trade = GetTrade(tradeID);
        if (!trade)
        {
            return boost::none;
        }
        return trade->GetPhase();
    }

    TradeManager::TradeHandle TradeManager::GetTrade(const TradeID& tradeID) const
    {
        auto it = m_ActiveTrades.find(tradeID);
        if (it != m_ActiveTrades.end())
        {
            return it->second.m_Trade;
        }
        if (m_DB)
        {
            return m_DB->loadTrade(m_OwnID, tradeID, m_KeyService, m_TxService);
        }
        return TradeHandle();
    }

    boost::optional<StepSequencer::Status> TradeManager::GetSequencerStatus(const TradeID& tradeID) const
    {
        auto it = m_ActiveTrades.find(tradeID);
        if (it == m_ActiveTrades.end() || !it->second.m_Sequencer)
        {
            return boost::none;
        }
        return it->second.m_Sequencer->GetStatus();
    }

    void TradeManager::Subscribe(ITradeObserver* observer)
    {
        assert(std::find(m_Subscribers.begin(), m_Subscribers.end(), observer) == m_Subscribers.end());
        m_Subscribers.push_back(observer);
    }

    void TradeManager::Unsubscribe(ITradeObserver* observer)
    {
        auto it = std::find(m_Subscribers.begin(), m_Subscribers.end(), observer);
        if (it != m_Subscribers.end())
        {
            m_Subscribers.erase(it);
        }
    }

    void TradeManager::SetInterceptHook(StepSequencer::InterceptHook hook)
    {
        m_Hook = std::move(hook);
    }

    size_t TradeManager::LoadAllTrades()
    {
        if (!m_DB)
        {
            return 0;
        }

        size_t count = 0;
        for (auto& trade : m_DB->loadActiveTrades(m_OwnID, m_KeyService, m_TxService))
        {
            if (!m_ActiveTrades.count(trade->GetID()))
            {
                AddTrade(trade);
                ++count;
            }
        }
        return count;
    }

    size_t TradeManager::ResumeAllTrades()
    {
        if (!m_DB)
        {
            return 0;
        }

        size_t count = 0;
        for (auto& trade : m_DB->loadActiveTrades(m_OwnID, m_KeyService, m_TxService))
        {
            if (m_ActiveTrades.count(trade->GetID()))
            {
                continue;
            }

            SequenceKind kind = trade->GetCheckpoint().m_Kind;
            auto& active = AddTrade(trade);
            ++count;

            if (kind == SequenceKind::Main && trade->GetPhase() == TradePhase::Disputed && trade->GetRole() != TradeRole::Arbitrator)
            {
                // escalated before the dispute sequence was stored
                LOG_INFO() << trade->GetID() << "[" << trade->GetRole() << "] resuming escalated trade";
                StartSequence(active, SequenceKind::Dispute);
                continue;
            }

            CreateSequencer(active, kind);

            auto& sequencer = *active.m_Sequencer;
            LOG_INFO() << trade->GetID() << "[" << trade->GetRole() << "] resuming " << to_string(kind)
                << " sequence at " << sequencer.GetCurrentStepName() << " in phase " << trade->GetPhase();

            if (sequencer.GetStatus() == StepSequencer::Status::Suspended)
            {
                sequencer.Resume();
            }
            else if (trade->GetPhase() != TradePhase::Error && trade->GetPhase() != TradePhase::Disputed)
            {
                sequencer.Run();
            }
            UpdateTrade(active);
        }
        return count;
    }

    void TradeManager::OnTradeMessage(const PeerID& from, const TradeMessage& message)
    {
        try
        {
            if (message.m_From != from)
            {
                LOG_WARNING() << message.m_TradeID << " sender " << from << " claims to be " << message.m_From << ", dropped";
                return;
            }

            auto it = m_ActiveTrades.find(message.m_TradeID);
            if (it == m_ActiveTrades.end())
            {
                OnNewTradeMessage(from, message);
                return;
            }

            auto& active = it->second;
            const auto& trade = *active.m_Trade;
            if (!IsValidSender(trade, from, message))
            {
                return;
            }
            if (!active.m_Sequencer && message.m_Type != TradeMessageType::CancelTrade)
            {
                LOG_INFO() << trade.GetID() << " is not running, " << message.m_Type << " dropped";
                return;
            }

            switch (message.m_Type)
            {
            case TradeMessageType::CancelTrade:
                OnCancelMessage(active, message);
                return;

            case TradeMessageType::DisputeResult:
                if (active.m_Sequencer->GetKind() == SequenceKind::Main && trade.GetRole() != TradeRole::Arbitrator)
                {
                    OnUninvitedDisputeResult(active, message);
                    return;
                }
                break;

            default:
                break;
            }

            auto awaited = active.m_Sequencer->GetAwaitedMessage();
            if (IsOpeningMessage(message.m_Type) && awaited != message.m_Type)
            {
                LOG_DEBUG() << trade.GetID() << " repeated " << message.m_Type << " ignored";
                return;
            }
            if (active.m_Sequencer->GetKind() == SequenceKind::Dispute && !IsDisputeMessage(message.m_Type))
            {
                LOG_INFO() << trade.GetID() << " " << message.m_Type << " arrived after the dispute was opened, ignored";
                return;
            }
            if (awaited && *awaited != message.m_Type && active.m_Sequencer->IsAwaitedLater(message.m_Type))
            {
                HoldBack(active, message);
                return;
            }

            DeliverMessage(active, message);
        }
        catch (const std::exception& ex)
        {
            LOG_ERROR() << message.m_TradeID << " failed to handle " << message.m_Type << " from " << from << ": " << ex.what();
        }
    }

    bool TradeManager::IsValidSender(const Trade& trade, const PeerID& from, const TradeMessage& message) const
    {
        if (message.m_Type == TradeMessageType::FundLockConfirmed)
        {
            if (from != m_OwnID)
            {
                LOG_WARNING() << trade.GetID() << " confirmation from " << from << " dropped";
                return false;
            }
            return true;
        }

        auto role = trade.FindRoleOf(from);
        if (!role || *role == trade.GetRole() || *role != message.m_SenderRole)
        {
            LOG_WARNING() << trade.GetID() << " " << message.m_Type << " from unrelated peer " << from << " dropped";
            return false;
        }
        return true;
    }

    void TradeManager::DeliverMessage(ActiveTrade& active, const TradeMessage& message)
    {
        active.m_Sequencer->OnMessage(message);
        UpdateTrade(active);
    }

    void TradeManager::HoldBack(ActiveTrade& active, const TradeMessage& message)
    {
        LOG_INFO() << active.m_Trade->GetID() << " " << message.m_Type << " arrived while awaiting "
            << *active.m_Sequencer->GetAwaitedMessage() << ", held back";

        // a repeat replaces the held copy
        auto it = std::find_if(active.m_HeldBack.begin(), active.m_HeldBack.end(), [&](const TradeMessage& held)
        {
            return held.m_Type == message.m_Type;
        });
        if (it != active.m_HeldBack.end())
        {
            *it = message;
        }
        else
        {
            active.m_HeldBack.push_back(message);
        }
    }

    void TradeManager::DeliverHeldBack(ActiveTrade& active)
    {
        auto awaited = active.m_Sequencer->GetAwaitedMessage();
        if (!awaited)
        {
            return;
        }

        auto it = std::find_if(active.m_HeldBack.begin(), active.m_HeldBack.end(), [&](const TradeMessage& held)
        {
            return held.m_Type == *awaited;
        });
        if (it == active.m_HeldBack.end())
        {
            return;
        }

        TradeMessage message = std::move(*it);
        active.m_HeldBack.erase(it);
        LOG_DEBUG() << active.m_Trade->GetID() << " delivering held back " << message.m_Type;
        DeliverMessage(active, message);
    }

    void TradeManager::OnNewTradeMessage(const PeerID& from, const TradeMessage& message)
    {
        switch (message.m_Type)
        {
        case TradeMessageType::TakeOffer:
            {
                auto offer = m_Offers.find(message.m_TradeID);
                if (offer == m_Offers.end() || message.m_SenderRole != TradeRole::Buyer)
                {
                    LOG_WARNING() << message.m_TradeID << " take request from " << from << " for unknown offer dropped";
                    return;
                }

                auto trade = CreateTrade(offer->second, TradeRole::Seller, from);
                LOG_INFO() << trade->GetID() << "[" << TradeRole::Seller << "] offer taken by " << from;
                auto& active = AddTrade(trade);
                StartSequence(active, SequenceKind::Main);
                DeliverMessage(active, message);
            }
            break;

        case TradeMessageType::DisputeOpened:
            {
                if (message.m_SenderRole == TradeRole::Arbitrator)
                {
                    LOG_WARNING() << message.m_TradeID << " dispute ticket from an arbitrator dropped";
                    return;
                }

                auto trade = std::make_shared<Trade>(message.m_TradeID, TradeRole::Arbitrator, m_KeyService, m_TxService);
                trade->SetPeerID(TradeRole::Arbitrator, m_OwnID);
                trade->SetPeerID(message.m_SenderRole, from);
                LOG_INFO() << trade->GetID() << "[" << TradeRole::Arbitrator << "] dispute ticket from " << from;

                auto& active = AddTrade(trade);
                StartSequence(active, SequenceKind::Main);
                DeliverMessage(active, message);
            }
            break;

        default:
            LOG_WARNING() << message.m_TradeID << " " << message.m_Type << " for unknown trade from " << from << " dropped";
            break;
        }
    }

    void TradeManager::OnCancelMessage(ActiveTrade& active, const TradeMessage& message)
    {
        auto& trade = *active.m_Trade;
        if (message.m_SenderRole == TradeRole::Arbitrator)
        {
            LOG_WARNING() << trade.GetID() << " cancel from the arbitrator ignored";
            return;
        }
        if (!trade.CanCancel())
        {
            LOG_WARNING() << trade.GetID() << " peer asked to cancel in phase " << trade.GetPhase() << ", ignored";
            return;
        }

        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] canceled by " << message.m_SenderRole;
        CancelTimer(active);
        trade.SetFailure(TradeFailureReason::Canceled, "canceled by the " + to_string(message.m_SenderRole));
        trade.TransitionTo(TradePhase::Canceled);
        SaveTrade(trade);
    }

    void TradeManager::OnUninvitedDisputeResult(ActiveTrade& active, const TradeMessage& message)
    {
        auto& trade = *active.m_Trade;
        if (message.m_SenderRole != TradeRole::Arbitrator || !trade.IsFundLocked() || trade.IsTerminal()
            || trade.GetPhase() == TradePhase::Completed)
        {
            LOG_WARNING() << trade.GetID() << " dispute result in phase " << trade.GetPhase() << " ignored";
            return;
        }

        LOG_INFO() << trade.GetID() << "[" << trade.GetRole() << "] dispute opened by the counterparty";
        if (trade.GetPhase() != TradePhase::Disputed)
        {
            trade.TransitionTo(TradePhase::Disputed);
        }
        StartSequence(active, SequenceKind::Dispute, kDisputeResultStep);
        DeliverMessage(active, message);
    }
}
