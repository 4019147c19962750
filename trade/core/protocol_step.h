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

#include "trade.h"

namespace settle::trade
{
    constexpr uint32_t kNoTimeout = 0;

    struct StepOutcome
    {
        enum class Kind : uint8_t
        {
            Complete,
            Failed,
            Suspended
        };

        Kind m_Kind = Kind::Complete;

        // Failed
        TradeFailureReason m_Reason = TradeFailureReason::Unknown;
        std::string m_Message;
        TradePhase m_TargetPhase = TradePhase::Error;

        // Suspended
        TradeMessageType m_Awaited = TradeMessageType::TakeOffer;
        uint32_t m_TimeoutMsec = kNoTimeout;

        static StepOutcome Complete();
        // targetPhase is Error or Disputed
        static StepOutcome Failed(TradeFailureReason reason, const std::string& message, TradePhase targetPhase = TradePhase::Error);
        static StepOutcome Suspended(TradeMessageType awaited, uint32_t timeoutMsec);

        bool IsComplete() const { return m_Kind == Kind::Complete; }
        bool IsFailed() const { return m_Kind == Kind::Failed; }
        bool IsSuspended() const { return m_Kind == Kind::Suspended; }
    };

    std::ostream& operator<<(std::ostream& os, const StepOutcome& outcome);

    //
    // Everything a step may touch, passed explicitly on every call
    //
    struct StepContext
    {
        StepContext(Trade& trade, ITradeGateway& gateway, uint32_t peerTimeoutMsec);

        Trade& m_Trade;
        TradeContext& m_Context;
        ITradeGateway& m_Gateway;
        uint32_t m_PeerTimeoutMsec;

        // the message that resumed the previous step, consumed by the next one
        boost::optional<TradeMessage> m_Inbound;

        TradeMessage CreateMessage(TradeMessageType type) const;
        void SendTo(TradeRole role, const TradeMessage& message);
        // returns the pending inbound message of the given type and clears it
        boost::optional<TradeMessage> TakeInbound(TradeMessageType type);
    };

    //
    // Unit of protocol work
    //
    class IProtocolStep
    {
    public:
        using Ptr = std::shared_ptr<IProtocolStep>;

        virtual ~IProtocolStep() = default;

        virtual const char* GetName() const = 0;
        virtual StepOutcome Run(StepContext& context) = 0;

        // called with the awaited message, already type-checked. Default accepts it
        virtual StepOutcome OnMessage(StepContext& context, const TradeMessage& message);

        // default: the peer did not answer before the fund lock
        virtual StepOutcome OnTimeout(StepContext& context);

        // a suspended step was restored after restart
        virtual void OnResume(StepContext& context) {}

        // peer message the step consumes, if any
        virtual boost::optional<TradeMessageType> GetPeerMessage() const { return boost::none; }
    };

    // helpers shared by the step library
    template <typename T>
    T GetMandatory(const boost::optional<T>& value, const char* what)
    {
        if (!value)
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, std::string(what) + " is missing");
        }
        return *value;
    }
}
