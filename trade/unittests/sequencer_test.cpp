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

#include "trade/core/sequencer.h"
#include "test_helpers.h"

#include "utility/logger.h"

using namespace std;
using namespace settle;
using namespace settle::trade;

TRADE_TEST_INIT

namespace
{
    struct TestGateway : ITradeGateway
    {
        void Send(const PeerID& peerID, const TradeMessage& message) override
        {
            m_Sent.emplace_back(peerID, message);
        }

        vector<pair<PeerID, TradeMessage>> m_Sent;
    };

    class TestStep : public IProtocolStep
    {
    public:
        using RunFunc = function<StepOutcome(StepContext&)>;
        using MessageFunc = function<StepOutcome(StepContext&, const TradeMessage&)>;

        TestStep(const char* name, RunFunc run, MessageFunc onMessage = MessageFunc())
            : m_Name(name)
            , m_Run(move(run))
            , m_OnMessage(move(onMessage))
        {
        }

        const char* GetName() const override { return m_Name; }

        StepOutcome Run(StepContext& context) override
        {
            ++m_RunCount;
            return m_Run(context);
        }

        StepOutcome OnMessage(StepContext& context, const TradeMessage& message) override
        {
            if (m_OnMessage)
            {
                return m_OnMessage(context, message);
            }
            return IProtocolStep::OnMessage(context, message);
        }

        void OnResume(StepContext&) override
        {
            ++m_ResumeCount;
        }

        boost::optional<TradeMessageType> GetPeerMessage() const override
        {
            return m_PeerMessage;
        }

        int m_RunCount = 0;
        int m_ResumeCount = 0;
        boost::optional<TradeMessageType> m_PeerMessage;

    private:
        const char* m_Name;
        RunFunc m_Run;
        MessageFunc m_OnMessage;
    };

    shared_ptr<TestStep> MakeStep(const char* name, TestStep::RunFunc run, TestStep::MessageFunc onMessage = TestStep::MessageFunc())
    {
        return make_shared<TestStep>(name, move(run), move(onMessage));
    }

    StepOutcome Complete(StepContext&)
    {
        return StepOutcome::Complete();
    }

    Trade MakeTrade()
    {
        Trade trade("trade-1", TradeRole::Buyer, IKeyService::Ptr(), ITradeTxService::Ptr());
        trade.SetPeerID(TradeRole::Buyer, "alice");
        trade.SetPeerID(TradeRole::Seller, "bob");
        trade.SetPeerID(TradeRole::Arbitrator, "carol");
        trade.SetTerms(100, 10, 10);
        return trade;
    }

    TradeMessage MakeMessage(TradeMessageType type, TradeRole sender = TradeRole::Seller)
    {
        TradeMessage message("trade-1", sender, type);
        message.m_From = sender == TradeRole::Seller ? "bob" : "carol";
        return message;
    }

    void TestStepsRunInOrder()
    {
        cout << "Test steps run in order\n";

        auto trade = MakeTrade();
        TestGateway gateway;
        vector<string> order;
        auto record = [&order](const char* name)
        {
            return [&order, name](StepContext&) { order.push_back(name); return StepOutcome::Complete(); };
        };

        StepSequencer sequencer(trade, SequenceKind::Main, { MakeStep("a", record("a")), MakeStep("b", record("b")), MakeStep("c", record("c")) }, gateway, 1000);
        TRADE_CHECK(sequencer.GetStatus() == StepSequencer::Status::Idle);
        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Completed);
        TRADE_CHECK((order == vector<string>{ "a", "b", "c" }));
        TRADE_CHECK(trade.GetCheckpoint().m_NextStep == 3);
        TRADE_CHECK(!trade.GetCheckpoint().m_Awaited);

        // completed sequencer doesn't run twice
        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Completed);
        TRADE_CHECK(order.size() == 3);
    }

    void TestSuspendAndResumeByMessage()
    {
        cout << "Test suspend and resume by message\n";

        auto trade = MakeTrade();
        TestGateway gateway;
        boost::optional<TradeMessage> seenByNext;

        auto waiting = MakeStep("wait", [](StepContext& context)
        {
            context.SendTo(TradeRole::Seller, context.CreateMessage(TradeMessageType::TakeOffer));
            return StepOutcome::Suspended(TradeMessageType::DepositTxPublished, context.m_PeerTimeoutMsec);
        });
        auto next = MakeStep("next", [&seenByNext](StepContext& context)
        {
            seenByNext = context.TakeInbound(TradeMessageType::DepositTxPublished);
            return StepOutcome::Complete();
        });

        StepSequencer sequencer(trade, SequenceKind::Main, { waiting, next }, gateway, 750);
        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Suspended);
        TRADE_CHECK(sequencer.GetCurrentStep() == 0);
        TRADE_CHECK(sequencer.GetTimeout() == 750);
        TRADE_CHECK(sequencer.GetAwaitedMessage() == TradeMessageType::DepositTxPublished);
        TRADE_CHECK(trade.GetCheckpoint().m_Awaited == TradeMessageType::DepositTxPublished);
        TRADE_CHECK(gateway.m_Sent.size() == 1);
        TRADE_CHECK(gateway.m_Sent[0].first == "bob");
        TRADE_CHECK(gateway.m_Sent[0].second.m_From == "alice");
        TRADE_CHECK(gateway.m_Sent[0].second.m_SenderRole == TradeRole::Buyer);

        auto message = MakeMessage(TradeMessageType::DepositTxPublished);
        message.AddParameter(TradeParameterID::Amount, Amount(100));
        TRADE_CHECK(sequencer.OnMessage(message) == StepSequencer::Status::Completed);
        TRADE_CHECK(seenByNext.is_initialized());
        TRADE_CHECK(seenByNext && seenByNext->GetMandatoryParameter<Amount>(TradeParameterID::Amount) == 100);
        TRADE_CHECK(next->m_RunCount == 1);
    }

    void TestUnexpectedMessage()
    {
        cout << "Test unexpected message\n";

        auto trade = MakeTrade();
        TestGateway gateway;
        auto waiting = MakeStep("wait", [](StepContext&) { return StepOutcome::Suspended(TradeMessageType::PayoutSignature, kNoTimeout); });
        auto next = MakeStep("next", Complete);

        StepSequencer sequencer(trade, SequenceKind::Main, { waiting, next }, gateway, 1000);
        sequencer.Run();
        TRADE_CHECK(sequencer.OnMessage(MakeMessage(TradeMessageType::PayoutTxPublished)) == StepSequencer::Status::Failed);
        TRADE_CHECK(trade.GetPhase() == TradePhase::Error);
        TRADE_CHECK(trade.GetFailureReason() == TradeFailureReason::PeerProtocolFailure);
        TRADE_CHECK(next->m_RunCount == 0);

        // nothing is accepted after the failure
        TRADE_CHECK(sequencer.OnMessage(MakeMessage(TradeMessageType::PayoutSignature)) == StepSequencer::Status::Failed);
        TRADE_CHECK(next->m_RunCount == 0);
    }

    void TestMessagesAwaitedLater()
    {
        cout << "Test messages awaited by later steps\n";

        auto trade = MakeTrade();
        TestGateway gateway;
        auto confirmation = MakeStep("confirmation", [](StepContext&) { return StepOutcome::Suspended(TradeMessageType::FundLockConfirmed, kNoTimeout); });
        auto signature = MakeStep("signature", [](StepContext& context)
        {
            if (context.TakeInbound(TradeMessageType::PayoutSignature))
            {
                return StepOutcome::Complete();
            }
            return StepOutcome::Suspended(TradeMessageType::PayoutSignature, 1000);
        });
        signature->m_PeerMessage = TradeMessageType::PayoutSignature;
        auto payout = MakeStep("payout", Complete);
        payout->m_PeerMessage = TradeMessageType::PayoutTxPublished;

        StepSequencer sequencer(trade, SequenceKind::Main, { confirmation, signature, payout }, gateway, 1000);
        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Suspended);

        TRADE_CHECK(sequencer.IsAwaitedLater(TradeMessageType::PayoutSignature));
        TRADE_CHECK(sequencer.IsAwaitedLater(TradeMessageType::PayoutTxPublished));
        TRADE_CHECK(!sequencer.IsAwaitedLater(TradeMessageType::FundLockConfirmed));
        TRADE_CHECK(!sequencer.IsAwaitedLater(TradeMessageType::DepositTxPublished));

        // the sequencer itself still takes only the awaited message
        TRADE_CHECK(sequencer.OnMessage(MakeMessage(TradeMessageType::FundLockConfirmed)) == StepSequencer::Status::Suspended);
        TRADE_CHECK(sequencer.GetAwaitedMessage() == TradeMessageType::PayoutSignature);
        TRADE_CHECK(!sequencer.IsAwaitedLater(TradeMessageType::PayoutSignature));
        TRADE_CHECK(sequencer.IsAwaitedLater(TradeMessageType::PayoutTxPublished));

        TRADE_CHECK(sequencer.OnMessage(MakeMessage(TradeMessageType::PayoutSignature)) == StepSequencer::Status::Completed);
        TRADE_CHECK(!sequencer.IsAwaitedLater(TradeMessageType::PayoutTxPublished));
    }

    void TestStepExceptions()
    {
        cout << "Test step exceptions\n";

        auto runThrowing = [](function<void()> thrower)
        {
            auto trade = MakeTrade();
            TestGateway gateway;
            auto step = MakeStep("throwing", [thrower](StepContext&) { thrower(); return StepOutcome::Complete(); });
            StepSequencer sequencer(trade, SequenceKind::Main, { step }, gateway, 1000);
            TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Failed);
            TRADE_CHECK(trade.GetPhase() == TradePhase::Error);
            return trade.GetFailureReason();
        };

        TRADE_CHECK(runThrowing([] { throw TradeFailedException(TradeFailureReason::SecurityIntegrityFailure, "bad key"); })
            == TradeFailureReason::SecurityIntegrityFailure);
        TRADE_CHECK(runThrowing([] { throw LedgerFormatException("bad address"); })
            == TradeFailureReason::TransactionConstructionFailure);
        TRADE_CHECK(runThrowing([] { throw std::runtime_error("boom"); })
            == TradeFailureReason::Unknown);
    }

    void TestFailureTargetPhase()
    {
        cout << "Test failure target phase\n";

        {
            auto trade = MakeTrade();
            TestGateway gateway;
            auto step = MakeStep("escalate", [](StepContext& context)
            {
                context.m_Trade.TransitionTo(TradePhase::DepositPublished);
                return StepOutcome::Failed(TradeFailureReason::PeerTimeout, "", TradePhase::Disputed);
            });
            StepSequencer sequencer(trade, SequenceKind::Main, { step }, gateway, 1000);
            TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Failed);
            TRADE_CHECK(trade.GetPhase() == TradePhase::Disputed);
            TRADE_CHECK(trade.GetFailureReason() == TradeFailureReason::PeerTimeout);
            TRADE_CHECK(trade.GetFailureMessage() == GetFailureMessage(TradeFailureReason::PeerTimeout));
        }
        {
            // a completed trade stays completed
            auto trade = MakeTrade();
            trade.RestorePhase(TradePhase::Completed);
            TestGateway gateway;
            auto step = MakeStep("late", [](StepContext&)
            {
                return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "late failure");
            });
            StepSequencer sequencer(trade, SequenceKind::Main, { step }, gateway, 1000);
            TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Failed);
            TRADE_CHECK(trade.GetPhase() == TradePhase::Completed);
        }
    }

    void TestTimeout()
    {
        cout << "Test timeout\n";

        auto trade = MakeTrade();
        TestGateway gateway;
        auto waiting = MakeStep("wait", [](StepContext& context) { return StepOutcome::Suspended(TradeMessageType::DepositTxPublished, context.m_PeerTimeoutMsec); });
        StepSequencer sequencer(trade, SequenceKind::Main, { waiting }, gateway, 10);

        // not suspended yet
        TRADE_CHECK(sequencer.OnTimeout() == StepSequencer::Status::Idle);

        sequencer.Run();
        TRADE_CHECK(sequencer.OnTimeout() == StepSequencer::Status::Failed);
        TRADE_CHECK(trade.GetFailureReason() == TradeFailureReason::PeerTimeout);
        TRADE_CHECK(trade.GetPhase() == TradePhase::Error);
    }

    void TestInterceptHook()
    {
        cout << "Test intercept hook\n";

        auto trade = MakeTrade();
        TestGateway gateway;
        auto first = MakeStep("first", Complete);
        auto second = MakeStep("second", Complete);
        StepSequencer sequencer(trade, SequenceKind::Main, { first, second }, gateway, 1000);

        vector<string> intercepted;
        sequencer.SetInterceptHook([&intercepted](const IProtocolStep& step, StepContext&) -> boost::optional<StepOutcome>
        {
            intercepted.push_back(step.GetName());
            if (string(step.GetName()) == "second")
            {
                return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "injected");
            }
            return boost::none;
        });

        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Failed);
        TRADE_CHECK((intercepted == vector<string>{ "first", "second" }));
        TRADE_CHECK(first->m_RunCount == 1);
        TRADE_CHECK(second->m_RunCount == 0);
        TRADE_CHECK(trade.GetFailureMessage() == "injected");
        TRADE_CHECK(trade.GetCheckpoint().m_NextStep == 1);
    }

    void TestRestoreFromCheckpoint()
    {
        cout << "Test restore from checkpoint\n";

        auto trade = MakeTrade();
        SequencerCheckpoint checkpoint;
        checkpoint.m_Kind = SequenceKind::Main;
        checkpoint.m_NextStep = 1;
        checkpoint.m_Awaited = TradeMessageType::PayoutTxPublished;
        trade.SetCheckpoint(checkpoint);

        TestGateway gateway;
        auto first = MakeStep("first", Complete);
        auto waiting = MakeStep("wait", [](StepContext&) { return StepOutcome::Suspended(TradeMessageType::PayoutTxPublished, kNoTimeout); });
        auto last = MakeStep("last", Complete);

        StepSequencer sequencer(trade, SequenceKind::Main, { first, waiting, last }, gateway, 1000);
        TRADE_CHECK(sequencer.GetStatus() == StepSequencer::Status::Suspended);
        TRADE_CHECK(sequencer.GetCurrentStep() == 1);
        TRADE_CHECK(string(sequencer.GetCurrentStepName()) == "wait");

        // restored sequencer is not started again
        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Suspended);
        sequencer.Resume();
        TRADE_CHECK(waiting->m_ResumeCount == 1);
        TRADE_CHECK(first->m_RunCount == 0);

        TRADE_CHECK(sequencer.OnMessage(MakeMessage(TradeMessageType::PayoutTxPublished)) == StepSequencer::Status::Completed);
        TRADE_CHECK(last->m_RunCount == 1);
        TRADE_CHECK(waiting->m_RunCount == 0);

        // checkpoint of another sequence is replaced
        StepSequencer dispute(trade, SequenceKind::Dispute, { MakeStep("d", Complete) }, gateway, 1000);
        TRADE_CHECK(dispute.GetStatus() == StepSequencer::Status::Idle);
        TRADE_CHECK(trade.GetCheckpoint().m_Kind == SequenceKind::Dispute);
        TRADE_CHECK(trade.GetCheckpoint().m_NextStep == 0);
    }
}

int main()
{
    int logLevel = LOG_LEVEL_WARNING;
#if LOG_VERBOSE_ENABLED
    logLevel = LOG_LEVEL_VERBOSE;
#endif
    auto logger = Logger::create(logLevel, logLevel);

    TestStepsRunInOrder();
    TestSuspendAndResumeByMessage();
    TestUnexpectedMessage();
    TestMessagesAwaitedLater();
    TestStepExceptions();
    TestFailureTargetPhase();
    TestTimeout();
    TestInterceptHook();
    TestRestoreFromCheckpoint();

    return TRADE_CHECK_RESULT;
}
