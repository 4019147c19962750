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

#include "trade/protocol/payout_signing_step.h"
#include "trade/protocol/common_steps.h"
#include "trade/protocol/deposit_steps.h"
#include "trade/protocol/protocols.h"
#include "trade/core/sequencer.h"
#include "keykeeper/local_key_service.h"
#include "ledger/local_ledger.h"
#include "test_helpers.h"

#include "utility/logger.h"

#include <functional>
#include <thread>

using namespace std;
using namespace settle;
using namespace settle::trade;

TRADE_TEST_INIT

namespace
{
    const TradeID kTradeID = "signing-trade";

    struct NullGateway : ITradeGateway
    {
        void Send(const PeerID&, const TradeMessage&) override {}
    };

    struct RecordingGateway : ITradeGateway
    {
        void Send(const PeerID& peerID, const TradeMessage& message) override
        {
            m_Sent.emplace_back(peerID, message);
        }

        vector<pair<PeerID, TradeMessage>> m_Sent;
    };

    ByteBuffer MakeSeed(const string& name)
    {
        return ByteBuffer(name.begin(), name.end());
    }

    //
    // Buyer and seller of one funded trade, seen from the given role
    //
    struct SigningSetup
    {
        io::Reactor::Ptr m_Reactor = io::Reactor::create();
        LocalLedger::Ptr m_Ledger = make_shared<LocalLedger>(*m_Reactor);
        LocalKeyService::Ptr m_BuyerKeys = make_shared<LocalKeyService>(MakeSeed("buyer"));
        LocalKeyService::Ptr m_SellerKeys = make_shared<LocalKeyService>(MakeSeed("seller"));
        LocalKeyService::Ptr m_ArbitratorKeys = make_shared<LocalKeyService>(MakeSeed("arbitrator"));
        Trade::Ptr m_Trade;
        NullGateway m_Gateway;

        explicit SigningSetup(TradeRole role, Amount amount = 100)
        {
            auto keys = role == TradeRole::Buyer ? m_BuyerKeys : (role == TradeRole::Seller ? m_SellerKeys : m_ArbitratorKeys);
            m_Trade = make_shared<Trade>(kTradeID, role, keys, m_Ledger);
            m_Trade->SetPeerID(TradeRole::Buyer, "alice");
            m_Trade->SetPeerID(TradeRole::Seller, "bob");
            m_Trade->SetPeerID(TradeRole::Arbitrator, "carol");
            m_Trade->SetTerms(amount, 15, 20);
        }

        MultiSigKeySet GetKeySet() const
        {
            MultiSigKeySet keySet;
            keySet.m_Buyer = m_BuyerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::MultiSig).m_PubKey;
            keySet.m_Seller = m_SellerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::MultiSig).m_PubKey;
            keySet.m_Arbitrator = m_ArbitratorKeys->GetOrCreateAddressEntry("arbitrator", AddressPurpose::MultiSig).m_PubKey;
            return keySet;
        }

        PayoutAddresses GetAddresses() const
        {
            PayoutAddresses addresses;
            addresses.m_Buyer = m_BuyerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::Payout).m_Address;
            addresses.m_Seller = m_SellerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::Payout).m_Address;
            return addresses;
        }

        void CommitKeys()
        {
            auto keySet = GetKeySet();
            auto& context = m_Trade->GetContext();
            context.SetMultiSigPubKey(TradeRole::Buyer, keySet.m_Buyer);
            context.SetMultiSigPubKey(TradeRole::Seller, keySet.m_Seller);
            context.SetMultiSigPubKey(TradeRole::Arbitrator, keySet.m_Arbitrator);
        }

        void CommitAddresses()
        {
            auto& context = m_Trade->GetContext();
            context.SetPayoutAddress(TradeRole::Buyer, m_BuyerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::Payout).m_Address);
            context.SetPayoutAddress(TradeRole::Seller, m_SellerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::Payout).m_Address);
        }

        void LockFunds()
        {
            auto escrow = GetEscrowAmount(m_Trade->GetAmount(), m_Trade->GetBuyerDeposit(), m_Trade->GetSellerDeposit());
            auto fundLock = m_Ledger->PublishFundLockTx(kTradeID, escrow, GetKeySet(), GetAddresses());
            m_Trade->GetContext().SetFundLockTx(fundLock);
        }

        void Prepare()
        {
            CommitKeys();
            CommitAddresses();
            LockFunds();
            m_Trade->TransitionTo(TradePhase::DepositPublished);
            m_Trade->TransitionTo(TradePhase::DepositConfirmed);
        }

        StepOutcome Sign()
        {
            StepContext context(*m_Trade, m_Gateway, 1000);
            PayoutSigningStep step;
            return step.Run(context);
        }
    };

    void CheckFailure(const StepOutcome& outcome, TradeFailureReason reason)
    {
        TRADE_CHECK(outcome.IsFailed());
        TRADE_CHECK(outcome.m_Reason == reason);
        TRADE_CHECK(outcome.m_TargetPhase == TradePhase::Error);
    }

    void TestSellerSigns()
    {
        cout << "Test seller signs cooperative payout\n";

        SigningSetup setup(TradeRole::Seller);
        setup.Prepare();

        auto outcome = setup.Sign();
        TRADE_CHECK(outcome.IsComplete());
        TRADE_CHECK(setup.m_Trade->GetPhase() == TradePhase::PayoutSigned);

        auto& context = setup.m_Trade->GetContext();
        auto signature = context.GetPayoutSignature(TradeRole::Seller);
        TRADE_CHECK(signature.is_initialized());
        TRADE_CHECK(!context.GetPayoutSignature(TradeRole::Buyer));

        // buyer gets amount plus own deposit, seller gets the deposit back
        auto terms = context.GetPayoutTerms(115, 20);
        TRADE_CHECK(terms && signature && setup.m_Ledger->VerifyPayoutSignature(*terms, terms->m_KeySet.m_Seller, *signature));
        auto wrongSplit = context.GetPayoutTerms(100, 35);
        TRADE_CHECK(wrongSplit && signature && !setup.m_Ledger->VerifyPayoutSignature(*wrongSplit, wrongSplit->m_KeySet.m_Seller, *signature));
    }

    void TestBuyerSigns()
    {
        cout << "Test buyer signs cooperative payout\n";

        SigningSetup setup(TradeRole::Buyer);
        setup.Prepare();
        TRADE_CHECK(setup.Sign().IsComplete());
        TRADE_CHECK(setup.m_Trade->GetContext().GetPayoutSignature(TradeRole::Buyer).is_initialized());
    }

    void TestMissingState()
    {
        cout << "Test signing with missing state\n";

        {
            SigningSetup setup(TradeRole::Arbitrator);
            setup.Prepare();
            CheckFailure(setup.Sign(), TradeFailureReason::ProgrammingInvariantViolation);
        }
        {
            // no fund lock, nothing is recorded
            SigningSetup setup(TradeRole::Seller);
            setup.CommitKeys();
            setup.CommitAddresses();
            auto before = setup.m_Trade->GetContext().ExportParameters();
            CheckFailure(setup.Sign(), TradeFailureReason::ProgrammingInvariantViolation);
            TRADE_CHECK(setup.m_Trade->GetContext().ExportParameters() == before);
            TRADE_CHECK(!setup.m_Trade->GetContext().GetPayoutSignature(TradeRole::Seller));
            TRADE_CHECK(setup.m_Trade->GetPhase() == TradePhase::Negotiated);
        }
        {
            SigningSetup setup(TradeRole::Seller, 0);
            setup.Prepare();
            CheckFailure(setup.Sign(), TradeFailureReason::ProgrammingInvariantViolation);
            TRADE_CHECK(setup.m_Trade->GetPhase() == TradePhase::DepositConfirmed);
        }
        {
            SigningSetup setup(TradeRole::Seller);
            setup.CommitKeys();
            setup.LockFunds();
            setup.m_Trade->TransitionTo(TradePhase::DepositPublished);
            setup.m_Trade->TransitionTo(TradePhase::DepositConfirmed);
            CheckFailure(setup.Sign(), TradeFailureReason::ProgrammingInvariantViolation);
        }
        {
            SigningSetup setup(TradeRole::Seller);
            setup.CommitAddresses();
            setup.LockFunds();
            setup.m_Trade->TransitionTo(TradePhase::DepositPublished);
            setup.m_Trade->TransitionTo(TradePhase::DepositConfirmed);
            CheckFailure(setup.Sign(), TradeFailureReason::ProgrammingInvariantViolation);
        }
        {
            // not confirmed yet
            SigningSetup setup(TradeRole::Seller);
            setup.CommitKeys();
            setup.CommitAddresses();
            setup.LockFunds();
            setup.m_Trade->TransitionTo(TradePhase::DepositPublished);
            CheckFailure(setup.Sign(), TradeFailureReason::ProgrammingInvariantViolation);
            TRADE_CHECK(!setup.m_Trade->GetContext().GetPayoutSignature(TradeRole::Seller));
        }
    }

    void TestForeignKey()
    {
        cout << "Test signing with a foreign committed key\n";

        SigningSetup setup(TradeRole::Seller);
        auto& context = setup.m_Trade->GetContext();
        auto keySet = setup.GetKeySet();

        // seller's slot holds a key this wallet doesn't own
        auto stranger = make_shared<LocalKeyService>(MakeSeed("stranger"));
        auto foreign = stranger->GetOrCreateAddressEntry(kTradeID, AddressPurpose::MultiSig).m_PubKey;
        context.SetMultiSigPubKey(TradeRole::Buyer, keySet.m_Buyer);
        context.SetMultiSigPubKey(TradeRole::Seller, foreign);
        context.SetMultiSigPubKey(TradeRole::Arbitrator, keySet.m_Arbitrator);
        setup.CommitAddresses();

        keySet.m_Seller = foreign;
        context.SetFundLockTx(setup.m_Ledger->PublishFundLockTx(kTradeID, 135, keySet, setup.GetAddresses()));
        setup.m_Trade->TransitionTo(TradePhase::DepositPublished);
        setup.m_Trade->TransitionTo(TradePhase::DepositConfirmed);

        CheckFailure(setup.Sign(), TradeFailureReason::SecurityIntegrityFailure);
        TRADE_CHECK(setup.m_Trade->GetPhase() == TradePhase::DepositConfirmed);
        TRADE_CHECK(!context.GetPayoutSignature(TradeRole::Seller));
    }

    void TestMalformedTerms()
    {
        cout << "Test signing malformed terms\n";

        SigningSetup setup(TradeRole::Seller);
        auto& context = setup.m_Trade->GetContext();
        setup.CommitKeys();
        context.SetPayoutAddress(TradeRole::Buyer, "not a valid address");
        context.SetPayoutAddress(TradeRole::Seller, setup.m_SellerKeys->GetOrCreateAddressEntry(kTradeID, AddressPurpose::Payout).m_Address);
        setup.LockFunds();
        setup.m_Trade->TransitionTo(TradePhase::DepositPublished);
        setup.m_Trade->TransitionTo(TradePhase::DepositConfirmed);

        CheckFailure(setup.Sign(), TradeFailureReason::TransactionConstructionFailure);
    }

    void TestSigningUnderSequencer()
    {
        cout << "Test signing under sequencer\n";

        SigningSetup setup(TradeRole::Seller);
        setup.Prepare();
        StepSequencer sequencer(*setup.m_Trade, SequenceKind::Main, { make_shared<PayoutSigningStep>() }, setup.m_Gateway, 1000);
        TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Completed);
        TRADE_CHECK(setup.m_Trade->GetPhase() == TradePhase::PayoutSigned);

        SigningSetup unfunded(TradeRole::Buyer);
        StepSequencer failing(*unfunded.m_Trade, SequenceKind::Main, { make_shared<PayoutSigningStep>() }, unfunded.m_Gateway, 1000);
        TRADE_CHECK(failing.Run() == StepSequencer::Status::Failed);
        TRADE_CHECK(unfunded.m_Trade->GetPhase() == TradePhase::Error);
        TRADE_CHECK(unfunded.m_Trade->GetFailureReason() == TradeFailureReason::ProgrammingInvariantViolation);
    }

    void TestParallelSequencers()
    {
        cout << "Test parallel sequencers\n";

        io::Reactor::Ptr reactor = io::Reactor::create();
        auto ledger = make_shared<LocalLedger>(*reactor);
        auto buyerKeys = make_shared<LocalKeyService>(MakeSeed("buyer"));
        auto sellerKeys = make_shared<LocalKeyService>(MakeSeed("seller"));
        auto arbitratorKeys = make_shared<LocalKeyService>(MakeSeed("arbitrator"));
        NullGateway gateway;

        // same seller wallet on both trades, different amounts
        const vector<pair<TradeID, Amount>> deals = { { "parallel-a", 100 }, { "parallel-b", 200 } };
        vector<Trade::Ptr> trades;
        for (const auto& [tradeID, amount] : deals)
        {
            auto trade = make_shared<Trade>(tradeID, TradeRole::Seller, sellerKeys, ledger);
            trade->SetPeerID(TradeRole::Buyer, "alice");
            trade->SetPeerID(TradeRole::Seller, "bob");
            trade->SetPeerID(TradeRole::Arbitrator, "carol");
            trade->SetTerms(amount, 15, 20);

            MultiSigKeySet keySet;
            keySet.m_Buyer = buyerKeys->GetOrCreateAddressEntry(tradeID, AddressPurpose::MultiSig).m_PubKey;
            keySet.m_Seller = sellerKeys->GetOrCreateAddressEntry(tradeID, AddressPurpose::MultiSig).m_PubKey;
            keySet.m_Arbitrator = arbitratorKeys->GetOrCreateAddressEntry(kArbitratorKeyID, AddressPurpose::MultiSig).m_PubKey;
            PayoutAddresses addresses;
            addresses.m_Buyer = buyerKeys->GetOrCreateAddressEntry(tradeID, AddressPurpose::Payout).m_Address;
            addresses.m_Seller = sellerKeys->GetOrCreateAddressEntry(tradeID, AddressPurpose::Payout).m_Address;

            auto& context = trade->GetContext();
            context.SetMultiSigPubKey(TradeRole::Buyer, keySet.m_Buyer);
            context.SetMultiSigPubKey(TradeRole::Seller, keySet.m_Seller);
            context.SetMultiSigPubKey(TradeRole::Arbitrator, keySet.m_Arbitrator);
            context.SetPayoutAddress(TradeRole::Buyer, addresses.m_Buyer);
            context.SetPayoutAddress(TradeRole::Seller, addresses.m_Seller);
            context.SetFundLockTx(ledger->PublishFundLockTx(tradeID, GetEscrowAmount(amount, 15, 20), keySet, addresses));
            trade->TransitionTo(TradePhase::DepositPublished);
            trade->TransitionTo(TradePhase::DepositConfirmed);
            trades.push_back(trade);
        }

        vector<unique_ptr<StepSequencer>> sequencers;
        for (auto& trade : trades)
        {
            StepSequencer::Steps steps = { make_shared<PayoutSigningStep>() };
            sequencers.push_back(make_unique<StepSequencer>(*trade, SequenceKind::Main, move(steps), gateway, 1000));
        }

        vector<StepSequencer::Status> results(sequencers.size(), StepSequencer::Status::Idle);
        vector<thread> workers;
        for (size_t i = 0; i < sequencers.size(); ++i)
        {
            workers.emplace_back([&, i]() { results[i] = sequencers[i]->Run(); });
        }
        for (auto& worker : workers)
        {
            worker.join();
        }

        for (size_t i = 0; i < trades.size(); ++i)
        {
            const auto& trade = *trades[i];
            TRADE_CHECK(results[i] == StepSequencer::Status::Completed);
            TRADE_CHECK(trade.GetPhase() == TradePhase::PayoutSigned);
            TRADE_CHECK(!trade.GetFailureReason());

            // each signature covers its own trade only
            const auto& context = trade.GetContext();
            auto signature = context.GetPayoutSignature(TradeRole::Seller);
            auto own = context.GetPayoutTerms(deals[i].second + 15, 20);
            TRADE_CHECK(signature && own && ledger->VerifyPayoutSignature(*own, own->m_KeySet.m_Seller, *signature));

            const auto& other = trades[1 - i]->GetContext();
            auto foreign = other.GetPayoutTerms(deals[1 - i].second + 15, 20);
            TRADE_CHECK(signature && foreign && !ledger->VerifyPayoutSignature(*foreign, foreign->m_KeySet.m_Seller, *signature));
        }
    }

    TradeMessage MakeDisputeTicket(const SigningSetup& setup, const FundLockTx& fundLock, const PayoutAddresses& addresses)
    {
        auto keySet = setup.GetKeySet();
        TradeMessage ticket(kTradeID, TradeRole::Buyer, TradeMessageType::DisputeOpened);
        ticket.m_From = "alice";
        ticket.AddParameter(TradeParameterID::Amount, Amount(100))
            .AddParameter(TradeParameterID::BuyerDeposit, Amount(15))
            .AddParameter(TradeParameterID::SellerDeposit, Amount(20))
            .AddParameter(TradeParameterID::BuyerID, PeerID("alice"))
            .AddParameter(TradeParameterID::SellerID, PeerID("bob"))
            .AddParameter(TradeParameterID::BuyerMultiSigKey, keySet.m_Buyer)
            .AddParameter(TradeParameterID::SellerMultiSigKey, keySet.m_Seller)
            .AddParameter(TradeParameterID::ArbitratorMultiSigKey, keySet.m_Arbitrator)
            .AddParameter(TradeParameterID::BuyerPayoutAddress, addresses.m_Buyer)
            .AddParameter(TradeParameterID::SellerPayoutAddress, addresses.m_Seller)
            .AddParameter(TradeParameterID::FundLockTx, fundLock)
            .AddParameter(TradeParameterID::DisputeOpener, TradeRole::Buyer);
        return ticket;
    }

    void TestRedirectedDisputeTicket()
    {
        cout << "Test dispute ticket with redirected payout addresses\n";

        using Redirect = function<void(PayoutAddresses&)>;
        const vector<Redirect> redirects =
        {
            [](PayoutAddresses& addresses) { addresses.m_Seller = addresses.m_Buyer; },
            [](PayoutAddresses& addresses) { swap(addresses.m_Buyer, addresses.m_Seller); }
        };

        for (const auto& redirect : redirects)
        {
            SigningSetup setup(TradeRole::Arbitrator);
            auto fundLock = setup.m_Ledger->PublishFundLockTx(kTradeID, 135, setup.GetKeySet(), setup.GetAddresses());
            auto claimed = setup.GetAddresses();
            redirect(claimed);

            RecordingGateway gateway;
            StepSequencer sequencer(*setup.m_Trade, SequenceKind::Main, CreateArbitratorSteps(make_shared<FixedAwardResolver>(Amount(135))), gateway, 1000);
            TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Suspended);
            TRADE_CHECK(sequencer.GetAwaitedMessage() == TradeMessageType::DisputeOpened);

            TRADE_CHECK(sequencer.OnMessage(MakeDisputeTicket(setup, fundLock, claimed)) == StepSequencer::Status::Failed);
            TRADE_CHECK(setup.m_Trade->GetFailureReason() == TradeFailureReason::SecurityIntegrityFailure);
            TRADE_CHECK(setup.m_Trade->GetPhase() == TradePhase::Error);

            // nothing signed, nothing recorded, no ruling sent
            const auto& context = setup.m_Trade->GetContext();
            TRADE_CHECK(!context.GetPayoutSignature(TradeRole::Arbitrator));
            TRADE_CHECK(!context.GetFundLockTx());
            TRADE_CHECK(!context.GetPayoutAddress(TradeRole::Seller));
            TRADE_CHECK(gateway.m_Sent.empty());
        }
    }

    void TestFundLockWithoutArbitratorKey()
    {
        cout << "Test fund lock without committed arbitrator key\n";

        for (bool commitArbitrator : { false, true })
        {
            SigningSetup setup(TradeRole::Buyer);
            auto keySet = setup.GetKeySet();
            auto addresses = setup.GetAddresses();
            auto& context = setup.m_Trade->GetContext();
            context.SetMultiSigPubKey(TradeRole::Buyer, keySet.m_Buyer);
            context.SetPayoutAddress(TradeRole::Buyer, addresses.m_Buyer);
            if (commitArbitrator)
            {
                context.SetMultiSigPubKey(TradeRole::Arbitrator, keySet.m_Arbitrator);
            }

            // the seller names the arbitrator key itself
            auto fundLock = setup.m_Ledger->PublishFundLockTx(kTradeID, 135, keySet, addresses);
            TradeMessage published(kTradeID, TradeRole::Seller, TradeMessageType::DepositTxPublished);
            published.m_From = "bob";
            published.AddParameter(TradeParameterID::SellerMultiSigKey, keySet.m_Seller)
                .AddParameter(TradeParameterID::SellerPayoutAddress, addresses.m_Seller)
                .AddParameter(TradeParameterID::ArbitratorMultiSigKey, keySet.m_Arbitrator)
                .AddParameter(TradeParameterID::FundLockTx, fundLock);

            StepSequencer::Steps steps = { make_shared<ProcessDepositTxPublished>() };
            StepSequencer sequencer(*setup.m_Trade, SequenceKind::Main, move(steps), setup.m_Gateway, 1000);
            TRADE_CHECK(sequencer.Run() == StepSequencer::Status::Suspended);
            auto status = sequencer.OnMessage(published);

            const auto& trade = *setup.m_Trade;
            if (commitArbitrator)
            {
                TRADE_CHECK(status == StepSequencer::Status::Completed);
                TRADE_CHECK(trade.GetPhase() == TradePhase::DepositPublished);
                TRADE_CHECK(trade.GetContext().GetFundLockTx().is_initialized());
            }
            else
            {
                TRADE_CHECK(status == StepSequencer::Status::Failed);
                TRADE_CHECK(trade.GetFailureReason() == TradeFailureReason::SecurityIntegrityFailure);
                TRADE_CHECK(!trade.GetContext().GetFundLockTx());
                TRADE_CHECK(!trade.GetContext().GetMultiSigPubKey(TradeRole::Arbitrator));
                TRADE_CHECK(!trade.IsFundLocked());
            }
        }
    }

    void TestCooperativeSplit()
    {
        cout << "Test cooperative split\n";

        Trade trade("split", TradeRole::Seller, make_shared<LocalKeyService>(MakeSeed("seller")), LocalLedger::Ptr());
        trade.SetTerms(100, 15, 15);

        auto split = GetCooperativeSplit(trade);
        TRADE_CHECK(split.m_Buyer == 115);
        TRADE_CHECK(split.m_Seller == 15);
        TRADE_CHECK(ConservesEscrow(trade, split.m_Buyer, split.m_Seller));
        TRADE_CHECK(ConservesEscrow(trade, 130, 0));
        TRADE_CHECK(!ConservesEscrow(trade, 115, 14));
        TRADE_CHECK(!ConservesEscrow(trade, 116, 15));
    }
}

int main()
{
    int logLevel = LOG_LEVEL_WARNING;
#if LOG_VERBOSE_ENABLED
    logLevel = LOG_LEVEL_VERBOSE;
#endif
    auto logger = Logger::create(logLevel, logLevel);

    TestCooperativeSplit();
    TestSellerSigns();
    TestBuyerSigns();
    TestMissingState();
    TestForeignKey();
    TestMalformedTerms();
    TestSigningUnderSequencer();
    TestParallelSequencers();
    TestRedirectedDisputeTicket();
    TestFundLockWithoutArbitratorKey();

    return TRADE_CHECK_RESULT;
}
