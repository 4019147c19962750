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

#include "protocol_step.h"

namespace settle::trade
{
    StepOutcome StepOutcome::Complete()
    {
        return StepOutcome();
    }

    StepOutcome StepOutcome::Failed(TradeFailureReason reason, const std::string& message, TradePhase targetPhase)
    {
        StepOutcome outcome;
        outcome.m_Kind = Kind::Failed;
        outcome.m_Reason = reason;
        outcome.m_Message = message.empty() ? GetFailureMessage(reason) : message;
        outcome.m_TargetPhase = targetPhase;
        return outcome;
    }

    StepOutcome StepOutcome::Suspended(TradeMessageType awaited, uint32_t timeoutMsec)
    {
        StepOutcome outcome;
        outcome.m_Kind = Kind::Suspended;
        outcome.m_Awaited = awaited;
        outcome.m_TimeoutMsec = timeoutMsec;
        return outcome;
    }

    std::ostream& operator<<(std::ostream& os, const StepOutcome& outcome)
    {
        switch (outcome.m_Kind)
        {
        case StepOutcome::Kind::Complete:
            return os << "Complete";
        case StepOutcome::Kind::Failed:
            return os << "Failed(" << outcome.m_Reason << ", " << outcome.m_Message << ", -> " << outcome.m_TargetPhase << ")";
        case StepOutcome::Kind::Suspended:
            return os << "Suspended(" << outcome.m_Awaited << ", " << outcome.m_TimeoutMsec << "ms)";
        }
        return os;
    }

    StepContext::StepContext(Trade& trade, ITradeGateway& gateway, uint32_t peerTimeoutMsec)
        : m_Trade(trade)
        , m_Context(trade.GetContext())
        , m_Gateway(gateway)
        , m_PeerTimeoutMsec(peerTimeoutMsec)
    {
    }

    TradeMessage StepContext::CreateMessage(TradeMessageType type) const
    {
        TradeMessage message(m_Trade.GetID(), m_Trade.GetRole(), type);
        message.m_From = m_Trade.GetOwnID();
        return message;
    }

    void StepContext::SendTo(TradeRole role, const TradeMessage& message)
    {
        const PeerID& peerID = m_Trade.GetPeerID(role);
        if (peerID.empty())
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "unknown peer for " + to_string(role));
        }
        LOG_DEBUG() << m_Trade.GetID() << "[" << m_Trade.GetRole() << "] sending " << message.m_Type << " to " << role << " " << peerID;
        m_Gateway.Send(peerID, message);
    }

    boost::optional<TradeMessage> StepContext::TakeInbound(TradeMessageType type)
    {
        if (!m_Inbound || m_Inbound->m_Type != type)
        {
            return boost::none;
        }
        boost::optional<TradeMessage> message = std::move(m_Inbound);
        m_Inbound.reset();
        return message;
    }

    StepOutcome IProtocolStep::OnMessage(StepContext&, const TradeMessage&)
    {
        return StepOutcome::Complete();
    }

    StepOutcome IProtocolStep::OnTimeout(StepContext&)
    {
        return StepOutcome::Failed(TradeFailureReason::PeerTimeout, "", TradePhase::Error);
    }
}
