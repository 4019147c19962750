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

#include "protocol_step.h"

namespace settle::trade
{
    //
    // Executes the ordered steps of one trade. Steps run strictly one after another,
    // a suspended step is re-entered by the awaited message or by its timeout
    //
    class StepSequencer
    {
    public:
        enum class Status : uint8_t
        {
            Idle,
            Running,
            Suspended,
            Completed,
            Failed
        };

        using Steps = std::vector<IProtocolStep::Ptr>;
        // runs before a step's own logic, an outcome short-circuits the step
        using InterceptHook = std::function<boost::optional<StepOutcome>(const IProtocolStep& step, StepContext& context)>;

        // continues from the trade's checkpoint if it belongs to the given kind
        StepSequencer(Trade& trade, SequenceKind kind, Steps steps, ITradeGateway& gateway, uint32_t peerTimeoutMsec);

        void SetInterceptHook(InterceptHook hook);

        Status Run();
        Status OnMessage(const TradeMessage& message);
        Status OnTimeout();
        // re-arms external subscriptions of a suspended step restored from storage
        void Resume();

        Status GetStatus() const { return m_Status; }
        SequenceKind GetKind() const { return m_Kind; }
        size_t GetCurrentStep() const { return m_Current; }
        size_t GetStepCount() const { return m_Steps.size(); }
        const char* GetCurrentStepName() const;
        boost::optional<TradeMessageType> GetAwaitedMessage() const;
        // a step after the current one consumes this message
        bool IsAwaitedLater(TradeMessageType type) const;
        uint32_t GetTimeout() const { return m_TimeoutMsec; }

    private:
        Status Execute();
        Status Handle(const StepOutcome& outcome);
        Status Fail(TradeFailureReason reason, const std::string& message, TradePhase targetPhase);
        void SaveCheckpoint();

        template <typename Func>
        StepOutcome Invoke(Func&& func);

    private:
        Trade& m_Trade;
        SequenceKind m_Kind;
        Steps m_Steps;
        StepContext m_Context;
        InterceptHook m_Hook;

        size_t m_Current = 0;
        Status m_Status = Status::Idle;
        TradeMessageType m_Awaited = TradeMessageType::TakeOffer;
        uint32_t m_TimeoutMsec = kNoTimeout;
    };

    std::string to_string(StepSequencer::Status status);
}
