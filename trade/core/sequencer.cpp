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

#include "sequencer.h"

namespace settle::trade
{
    std::string to_string(StepSequencer::Status status)
    {
        switch (status)
        {
        case StepSequencer::Status::Idle: return "Idle";
        case StepSequencer::Status::Running: return "Running";
        case StepSequencer::Status::Suspended: return "Suspended";
        case StepSequencer::Status::Completed: return "Completed";
        case StepSequencer::Status::Failed: return "Failed";
        }
        return "Unknown";
    }

    StepSequencer::StepSequencer(Trade& trade, SequenceKind kind, Steps steps, ITradeGateway& gateway, uint32_t peerTimeoutMsec)
        : m_Trade(trade)
        , m_Kind(kind)
        , m_Steps(std::move(steps))
        , m_Context(trade, gateway, peerTimeoutMsec)
    {
        const auto& checkpoint = m_Trade.GetCheckpoint();
        if (checkpoint.m_Kind == m_Kind)
        {
            m_Current = std::min<size_t>(checkpoint.m_NextStep, m_Steps.size());
            if (checkpoint.m_Awaited && m_Current < m_Steps.size())
            {
                m_Status = Status::Suspended;
                m_Awaited = *checkpoint.m_Awaited;
                m_TimeoutMsec = peerTimeoutMsec;
            }
        }
        else
        {
            SaveCheckpoint();
        }
    }

    void StepSequencer::SetInterceptHook(InterceptHook hook)
    {
        m_Hook = std::move(hook);
    }

    const char* StepSequencer::GetCurrentStepName() const
    {
        return m_Current < m_Steps.size() ? m_Steps[m_Current]->GetName() : "";
    }

    boost::optional<TradeMessageType> StepSequencer::GetAwaitedMessage() const
    {
        if (m_Status != Status::Suspended)
        {
            return boost::none;
        }
        return m_Awaited;
    }

    bool StepSequencer::IsAwaitedLater(TradeMessageType type) const
    {
        for (size_t i = m_Current + 1; i < m_Steps.size(); ++i)
        {
            if (m_Steps[i]->GetPeerMessage() == type)
            {
                return true;
            }
        }
        return false;
    }

    StepSequencer::Status StepSequencer::Run()
    {
        if (m_Status != Status::Idle)
        {
            LOG_WARNING() << m_Trade.GetID() << " sequencer is " << to_string(m_Status) << ", run ignored";
            return m_Status;
        }
        return Execute();
    }

    StepSequencer::Status StepSequencer::OnMessage(const TradeMessage& message)
    {
        if (m_Status != Status::Suspended)
        {
            LOG_WARNING() << m_Trade.GetID() << " got " << message.m_Type << " while " << to_string(m_Status) << ", ignored";
            return m_Status;
        }

        auto& step = *m_Steps[m_Current];
        if (message.m_Type != m_Awaited)
        {
            LOG_ERROR() << m_Trade.GetID() << "[" << step.GetName() << "] expected " << m_Awaited << ", got " << message.m_Type;
            return Fail(TradeFailureReason::PeerProtocolFailure,
                "unexpected message " + to_string(message.m_Type) + ", awaiting " + to_string(m_Awaited),
                TradePhase::Error);
        }

        LOG_DEBUG() << m_Trade.GetID() << "[" << step.GetName() << "] resumed by " << message.m_Type;
        m_Status = Status::Running;
        // kept for the next step if this one completes
        m_Context.m_Inbound = message;
        Handle(Invoke([&] { return step.OnMessage(m_Context, message); }));
        return m_Status == Status::Running ? Execute() : m_Status;
    }

    StepSequencer::Status StepSequencer::OnTimeout()
    {
        if (m_Status != Status::Suspended)
        {
            return m_Status;
        }

        auto& step = *m_Steps[m_Current];
        LOG_WARNING() << m_Trade.GetID() << "[" << step.GetName() << "] timed out waiting for " << m_Awaited;
        m_Status = Status::Running;
        Handle(Invoke([&] { return step.OnTimeout(m_Context); }));
        return m_Status == Status::Running ? Execute() : m_Status;
    }

    void StepSequencer::Resume()
    {
        if (m_Status != Status::Suspended)
        {
            return;
        }
        auto& step = *m_Steps[m_Current];
        LOG_INFO() << m_Trade.GetID() << "[" << step.GetName() << "] restored, awaiting " << m_Awaited;
        try
        {
            step.OnResume(m_Context);
        }
        catch (const std::exception& ex)
        {
            LOG_ERROR() << m_Trade.GetID() << "[" << step.GetName() << "] failed to resume: " << ex.what();
            m_Status = Status::Running;
            Fail(TradeFailureReason::Unknown, ex.what(), TradePhase::Error);
        }
    }

    StepSequencer::Status StepSequencer::Execute()
    {
        m_Status = Status::Running;
        while (m_Status == Status::Running)
        {
            if (m_Current >= m_Steps.size())
            {
                m_Status = Status::Completed;
                SaveCheckpoint();
                LOG_INFO() << m_Trade.GetID() << " " << to_string(m_Kind) << " sequence completed";
                break;
            }

            auto& step = *m_Steps[m_Current];
            LOG_DEBUG() << m_Trade.GetID() << "[" << step.GetName() << "] started";

            StepOutcome outcome = Invoke([&]
            {
                if (m_Hook)
                {
                    auto intercepted = m_Hook(step, m_Context);
                    if (intercepted)
                    {
                        LOG_DEBUG() << m_Trade.GetID() << "[" << step.GetName() << "] intercepted";
                        return *intercepted;
                    }
                }
                return step.Run(m_Context);
            });

            Handle(outcome);
            m_Context.m_Inbound.reset();
        }
        return m_Status;
    }

    StepSequencer::Status StepSequencer::Handle(const StepOutcome& outcome)
    {
        auto& step = *m_Steps[m_Current];
        LOG_DEBUG() << m_Trade.GetID() << "[" << step.GetName() << "] " << outcome;

        switch (outcome.m_Kind)
        {
        case StepOutcome::Kind::Complete:
            ++m_Current;
            SaveCheckpoint();
            return m_Status;

        case StepOutcome::Kind::Suspended:
            m_Status = Status::Suspended;
            m_Awaited = outcome.m_Awaited;
            m_TimeoutMsec = outcome.m_TimeoutMsec;
            m_Context.m_Inbound.reset();
            SaveCheckpoint();
            return m_Status;

        case StepOutcome::Kind::Failed:
            return Fail(outcome.m_Reason, outcome.m_Message, outcome.m_TargetPhase);
        }
        return m_Status;
    }

    StepSequencer::Status StepSequencer::Fail(TradeFailureReason reason, const std::string& message, TradePhase targetPhase)
    {
        const char* stepName = GetCurrentStepName();
        if (reason == TradeFailureReason::SecurityIntegrityFailure)
        {
            LOG_ERROR() << m_Trade.GetID() << "[" << stepName << "] SECURITY FAILURE: " << message;
        }
        else
        {
            LOG_ERROR() << m_Trade.GetID() << "[" << stepName << "] failed: " << GetFailureMessage(reason) << " (" << message << ")";
        }

        m_Status = Status::Failed;
        m_Context.m_Inbound.reset();
        m_Trade.SetFailure(reason, message);

        if (m_Trade.CanTransitionTo(targetPhase))
        {
            m_Trade.TransitionTo(targetPhase);
        }
        else if (targetPhase != TradePhase::Error && m_Trade.CanTransitionTo(TradePhase::Error))
        {
            m_Trade.TransitionTo(TradePhase::Error);
        }
        else
        {
            LOG_WARNING() << m_Trade.GetID() << " stays in " << m_Trade.GetPhase();
        }

        SaveCheckpoint();
        return m_Status;
    }

    void StepSequencer::SaveCheckpoint()
    {
        SequencerCheckpoint checkpoint;
        checkpoint.m_Kind = m_Kind;
        checkpoint.m_NextStep = static_cast<uint32_t>(m_Current);
        if (m_Status == Status::Suspended)
        {
            checkpoint.m_Awaited = m_Awaited;
        }
        m_Trade.SetCheckpoint(checkpoint);
    }

    template <typename Func>
    StepOutcome StepSequencer::Invoke(Func&& func)
    {
        try
        {
            return func();
        }
        catch (const TradeFailedException& ex)
        {
            return StepOutcome::Failed(ex.GetReason(), ex.what(), TradePhase::Error);
        }
        catch (const LedgerFormatException& ex)
        {
            return StepOutcome::Failed(TradeFailureReason::TransactionConstructionFailure, ex.what(), TradePhase::Error);
        }
        catch (const std::exception& ex)
        {
            LOG_UNHANDLED_EXCEPTION() << ex.what();
            return StepOutcome::Failed(TradeFailureReason::Unknown, ex.what(), TradePhase::Error);
        }
    }
}
