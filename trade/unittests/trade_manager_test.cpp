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

#include "trade/core/trade_manager.h"
#include "trade/protocol/protocols.h"
#include "trade/protocol/common_steps.h"
#include "keykeeper/local_key_service.h"
#include "ledger/local_ledger.h"
#include "test_helpers.h"

#include "utility/logger.h"
#include "utility/io/asyncevent.h"
#include "utility/io/timer.h"

#include <deque>

using namespace std;
using namespace settle;
using namespace settle::trade;

TRADE_TEST_INIT

namespace
{
    const PeerID kBuyer = "alice";
    const PeerID kSeller = "bob";
    const PeerID kArbitrator = "carol";

    //
    // In-process message bus. A filter may drop, hold or modify messages in flight
    //
    class TestNetwork : public ITradeGateway
    {
    public:
        // returns false to drop the message
        using Filter = function<bool(const PeerID& to, TradeMessage& message)>;

        explicit TestNetwork(io::Reactor& reactor)
            : m_Event(io::AsyncEvent::create(reactor, [this]() { Deliver(); }))
        {
        }

        void Register(TradeManager& manager)
        {
            m_Peers[manager.GetOwnID()] = &manager;
        }

        void Unregister(const PeerID& peerID)
        {
            m_Peers.erase(peerID);
        }

        void SetFilter(Filter filter)
        {
            m_Filter = move(filter);
        }

        void Send(const PeerID& peerID, const TradeMessage& message) override
        {
            m_Queue.emplace_back(peerID, toByteBuffer(message));
            m_Event->post();
        }

    private:
        void Deliver()
        {
            while (!m_Queue.empty())
            {
                auto [peerID, buffer] = move(m_Queue.front());
                m_Queue.pop_front();

                TradeMessage message;
                TRADE_CHECK(fromByteBuffer(buffer, message));
                if (m_Filter && !m_Filter(peerID, message))
                {
                    continue;
                }

                auto it = m_Peers.find(peerID);
                if (it != m_Peers.end())
                {
                    it->second->OnTradeMessage(message.m_From, message);
                }
            }
        }

    private:
        io::AsyncEvent::Ptr m_Event;
        map<PeerID, TradeManager*> m_Peers;
        deque<pair<PeerID, ByteBuffer>> m_Queue;
        Filter m_Filter;
    };

    struct PhaseRecorder : ITradeObserver
    {
        void OnTradePhaseChanged(const TradeID& tradeID, TradePhase from, TradePhase to) override
        {
            m_Phases[tradeID].push_back(to);
        }

        map<TradeID, vector<TradePhase>> m_Phases;
    };

    ByteBuffer MakeSeed(const string& name)
    {
        return ByteBuffer(name.begin(), name.end());
    }

    bool RunUntil(io::Reactor& reactor, function<bool()> done, unsigned timeoutMsec = 5000)
    {
        if (done())
        {
            return true;
        }
        auto poll = io::Timer::create(reactor);
        poll->start(5, true, [&]()
        {
            if (done())
            {
                reactor.stop();
            }
        });
        auto deadline = io::Timer::create(reactor);
        deadline->start(timeoutMsec, false, [&reactor]() { reactor.stop(); });
        reactor.run();
        return done();
    }

    //
    // Three parties of one deal on a shared reactor and ledger
    //
    struct Market
    {
        io::Reactor::Ptr m_Reactor = io::Reactor::create();
        io::Reactor::Scope m_Scope{ *m_Reactor };
        LocalLedger::Ptr m_Ledger = make_shared<LocalLedger>(*m_Reactor, 10);
        TradeDB::Ptr m_DB = TradeDB::open(":memory:");
        LocalKeyService::Ptr m_BuyerKeys = make_shared<LocalKeyService>(MakeSeed("buyer"));
        LocalKeyService::Ptr m_SellerKeys = make_shared<LocalKeyService>(MakeSeed("seller"));
        LocalKeyService::Ptr m_ArbitratorKeys = make_shared<LocalKeyService>(MakeSeed("arbitrator"));
        TestNetwork m_Network{ *m_Reactor };

        unique_ptr<TradeManager> m_Buyer;
        unique_ptr<TradeManager> m_Seller;
        unique_ptr<TradeManager> m_Arbitrator;
        PhaseRecorder m_BuyerPhases;
        PhaseRecorder m_SellerPhases;

        explicit Market(boost::optional<Amount> award = boost::none, uint32_t buyerTimeout = 5000, uint32_t sellerTimeout = 5000)
        {
            m_Buyer = make_unique<TradeManager>(kBuyer, *m_Reactor, m_DB, m_BuyerKeys, m_Ledger, m_Network, IDisputeResolver::Ptr(), buyerTimeout);
            m_Seller = make_unique<TradeManager>(kSeller, *m_Reactor, m_DB, m_SellerKeys, m_Ledger, m_Network, IDisputeResolver::Ptr(), sellerTimeout);
            m_Arbitrator = make_unique<TradeManager>(kArbitrator, *m_Reactor, m_DB, m_ArbitratorKeys, m_Ledger, m_Network,
                                                     make_shared<FixedAwardResolver>(award));
            m_Network.Register(*m_Buyer);
            m_Network.Register(*m_Seller);
            m_Network.Register(*m_Arbitrator);
            m_Buyer->Subscribe(&m_BuyerPhases);
            m_Seller->Subscribe(&m_SellerPhases);
        }

        ~Market()
        {
            m_Buyer->Unsubscribe(&m_BuyerPhases);
            if (m_Seller)
            {
                m_Seller->Unsubscribe(&m_SellerPhases);
            }
        }

        Offer MakeOffer(const TradeID& id) const
        {
            Offer offer;
            offer.m_OfferID = id;
            offer.m_Amount = 100;
            offer.m_BuyerDeposit = 15;
            offer.m_SellerDeposit = 20;
            offer.m_Maker = kSeller;
            offer.m_Arbitrator = kArbitrator;
            offer.m_ArbitratorPubKey = m_ArbitratorKeys->GetOrCreateAddressEntry(kArbitratorKeyID, AddressPurpose::MultiSig).m_PubKey;
            return offer;
        }

        Offer Start(const TradeID& id)
        {
            auto offer = MakeOffer(id);
            m_Seller->PublishOffer(offer);
            m_Buyer->StartTrade(offer, TradeRole::Buyer, kSeller);
            return offer;
        }

        bool IsPhase(TradeManager& manager, const TradeID& id, TradePhase phase) const
        {
            auto current = manager.GetPhase(id);
            return current && *current == phase;
        }

        bool BothCompleted(const TradeID& id) const
        {
            return IsPhase(*m_Buyer, id, TradePhase::Completed) && IsPhase(*m_Seller, id, TradePhase::Completed);
        }

        boost::optional<PayoutTerms> GetSettlement(const TradeID& id) const
        {
            auto trade = m_Buyer->GetTrade(id);
            if (!trade || !trade->GetContext().GetFundLockTx())
            {
                return boost::none;
            }
            return m_Ledger->GetSettlement(trade->GetContext().GetFundLockTx()->m_TxID);
        }
    };

    void TestCooperativeTrade()
    {
        cout << "Test cooperative trade\n";

        Market market;
        market.Start("coop");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.BothCompleted("coop"); }));

        auto settlement = market.GetSettlement("coop");
        TRADE_CHECK(settlement.is_initialized());
        if (settlement)
        {
            TRADE_CHECK(settlement->m_BuyerAmount == 115);
            TRADE_CHECK(settlement->m_SellerAmount == 20);
            TRADE_CHECK(settlement->m_FundLockTx.m_EscrowAmount == 135);
            TRADE_CHECK(settlement->m_BuyerAddress == market.m_BuyerKeys->GetOrCreateAddressEntry("coop", AddressPurpose::Payout).m_Address);
        }

        const vector<TradePhase> expected =
        {
            TradePhase::DepositPublished,
            TradePhase::DepositConfirmed,
            TradePhase::PayoutSigned,
            TradePhase::PayoutPublished,
            TradePhase::Completed
        };
        TRADE_CHECK(market.m_BuyerPhases.m_Phases["coop"] == expected);
        TRADE_CHECK(market.m_SellerPhases.m_Phases["coop"] == expected);

        // the arbitrator never heard of it
        TRADE_CHECK(!market.m_Arbitrator->GetTrade("coop"));

        // both sides hold the same payout
        auto buyerTrade = market.m_Buyer->GetTrade("coop");
        auto sellerTrade = market.m_Seller->GetTrade("coop");
        TRADE_CHECK(buyerTrade && sellerTrade && buyerTrade->GetContext().GetPayoutTx() == sellerTrade->GetContext().GetPayoutTx());
        TRADE_CHECK(buyerTrade && !buyerTrade->GetFailureReason());

        // finished trades are stored and not resumed
        auto records = market.m_DB->getTrades();
        TRADE_CHECK(records.size() == 2);
        for (const auto& record : records)
        {
            TRADE_CHECK(record.m_Phase == TradePhase::Completed);
        }
        TRADE_CHECK(market.m_DB->loadActiveTrades(kBuyer, market.m_BuyerKeys, market.m_Ledger).empty());

        // same offer can't be taken twice
        TRADE_CHECK_THROW(market.m_Buyer->StartTrade(market.MakeOffer("coop"), TradeRole::Buyer, kSeller));
    }

    void TestDisputedTrade()
    {
        cout << "Test disputed trade\n";

        Market market(Amount(60));

        // the buyer refuses to sign
        market.m_Buyer->SetInterceptHook([](const IProtocolStep& step, StepContext&) -> boost::optional<StepOutcome>
        {
            if (string(step.GetName()) == "PayoutSigning")
            {
                return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "goods not delivered", TradePhase::Disputed);
            }
            return boost::none;
        });
        market.Start("dispute");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&]
        {
            return market.BothCompleted("dispute") && market.IsPhase(*market.m_Arbitrator, "dispute", TradePhase::Completed);
        }));

        auto settlement = market.GetSettlement("dispute");
        TRADE_CHECK(settlement && settlement->m_BuyerAmount == 60 && settlement->m_SellerAmount == 75);

        auto arbitratorTrade = market.m_Arbitrator->GetTrade("dispute");
        TRADE_CHECK(arbitratorTrade && arbitratorTrade->GetRole() == TradeRole::Arbitrator);
        TRADE_CHECK(arbitratorTrade && arbitratorTrade->GetContext().GetAward() && arbitratorTrade->GetContext().GetAward()->m_Buyer == 60);

        const auto& buyerPhases = market.m_BuyerPhases.m_Phases["dispute"];
        TRADE_CHECK(find(buyerPhases.begin(), buyerPhases.end(), TradePhase::Disputed) != buyerPhases.end());
        TRADE_CHECK(find(buyerPhases.begin(), buyerPhases.end(), TradePhase::PayoutSigned) == buyerPhases.end());

        // the seller learned about the dispute from the ruling
        const auto& sellerPhases = market.m_SellerPhases.m_Phases["dispute"];
        TRADE_CHECK(sellerPhases.size() >= 2 && sellerPhases[sellerPhases.size() - 2] == TradePhase::Disputed);

        auto buyerTrade = market.m_Buyer->GetTrade("dispute");
        auto sellerTrade = market.m_Seller->GetTrade("dispute");
        TRADE_CHECK(buyerTrade && sellerTrade && buyerTrade->GetContext().GetPayoutTx() == sellerTrade->GetContext().GetPayoutTx());
    }

    void TestOpenDispute()
    {
        cout << "Test open dispute\n";

        Market market;

        // the buyer's signature is lost, the seller waits
        market.m_Network.SetFilter([](const PeerID&, TradeMessage& message)
        {
            return message.m_Type != TradeMessageType::PayoutSignature;
        });
        market.Start("manual");
        TRADE_CHECK(!market.m_Buyer->OpenDispute("manual"));

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&]
        {
            auto status = market.m_Seller->GetSequencerStatus("manual");
            return market.IsPhase(*market.m_Seller, "manual", TradePhase::DepositConfirmed)
                && status && *status == StepSequencer::Status::Suspended;
        }));

        TRADE_CHECK(!market.m_Arbitrator->OpenDispute("manual"));
        TRADE_CHECK(!market.m_Seller->OpenDispute("unknown"));
        TRADE_CHECK(market.m_Seller->OpenDispute("manual"));
        TRADE_CHECK(!market.m_Seller->OpenDispute("manual"));
        TRADE_CHECK(market.IsPhase(*market.m_Seller, "manual", TradePhase::Disputed));

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.BothCompleted("manual"); }));

        // without an award the arbitrator confirms the cooperative split
        auto settlement = market.GetSettlement("manual");
        TRADE_CHECK(settlement && settlement->m_BuyerAmount == 115 && settlement->m_SellerAmount == 20);
    }

    void TestCancel()
    {
        cout << "Test cancel\n";

        Market market;

        // nobody published this offer, the buyer waits for the fund lock
        auto offer = market.MakeOffer("cancel");
        market.m_Buyer->StartTrade(offer, TradeRole::Buyer, kSeller);
        RunUntil(*market.m_Reactor, [] { return false; }, 50);

        TRADE_CHECK(market.IsPhase(*market.m_Buyer, "cancel", TradePhase::Negotiated));
        TRADE_CHECK(market.m_Buyer->CancelTrade("unknown") == TradeManager::CancelResult::NotFound);
        TRADE_CHECK(market.m_Buyer->CancelTrade("cancel") == TradeManager::CancelResult::Canceled);
        TRADE_CHECK(market.IsPhase(*market.m_Buyer, "cancel", TradePhase::Canceled));
        TRADE_CHECK(market.m_Buyer->CancelTrade("cancel") == TradeManager::CancelResult::NotAllowed);

        auto trade = market.m_Buyer->GetTrade("cancel");
        TRADE_CHECK(trade && trade->GetFailureReason() == TradeFailureReason::Canceled);

        // funded trades can't be canceled
        market.Start("funded");
        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.BothCompleted("funded"); }));
        TRADE_CHECK(market.m_Seller->CancelTrade("funded") == TradeManager::CancelResult::NotAllowed);
    }

    void TestCancelByPeer()
    {
        cout << "Test cancel by peer\n";

        Market market;
        market.m_Buyer->StartTrade(market.MakeOffer("peer-cancel"), TradeRole::Buyer, kSeller);
        RunUntil(*market.m_Reactor, [] { return false; }, 30);

        // only the counterparty may cancel
        TradeMessage cancel("peer-cancel", TradeRole::Arbitrator, TradeMessageType::CancelTrade);
        cancel.m_From = kArbitrator;
        market.m_Buyer->OnTradeMessage(kArbitrator, cancel);
        TRADE_CHECK(market.IsPhase(*market.m_Buyer, "peer-cancel", TradePhase::Negotiated));

        cancel.m_SenderRole = TradeRole::Seller;
        cancel.m_From = kSeller;
        market.m_Buyer->OnTradeMessage(kSeller, cancel);
        TRADE_CHECK(market.IsPhase(*market.m_Buyer, "peer-cancel", TradePhase::Canceled));

        auto trade = market.m_Buyer->GetTrade("peer-cancel");
        TRADE_CHECK(trade && trade->GetFailureReason() == TradeFailureReason::Canceled);
        TRADE_CHECK(trade && trade->IsTerminal());
    }

    void TestTimeoutBeforeFundLock()
    {
        cout << "Test timeout before fund lock\n";

        Market market(boost::none, 50);
        market.m_Buyer->StartTrade(market.MakeOffer("silent"), TradeRole::Buyer, kSeller);

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.IsPhase(*market.m_Buyer, "silent", TradePhase::Error); }));
        auto trade = market.m_Buyer->GetTrade("silent");
        TRADE_CHECK(trade && trade->GetFailureReason() == TradeFailureReason::PeerTimeout);
        TRADE_CHECK(trade && trade->IsTerminal());

        // no funds, no dispute
        TRADE_CHECK(!market.m_Buyer->OpenDispute("silent"));
        TRADE_CHECK(!market.m_Arbitrator->GetTrade("silent"));
    }

    void TestTimeoutEscalates()
    {
        cout << "Test timeout after fund lock escalates\n";

        Market market(boost::none, 10000, 50);
        market.m_Network.SetFilter([](const PeerID&, TradeMessage& message)
        {
            return message.m_Type != TradeMessageType::PayoutSignature;
        });
        market.Start("stalled");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&]
        {
            return market.BothCompleted("stalled") && market.IsPhase(*market.m_Arbitrator, "stalled", TradePhase::Completed);
        }));

        auto sellerTrade = market.m_Seller->GetTrade("stalled");
        TRADE_CHECK(sellerTrade && sellerTrade->GetFailureReason() == TradeFailureReason::PeerTimeout);

        const auto& sellerPhases = market.m_SellerPhases.m_Phases["stalled"];
        TRADE_CHECK(find(sellerPhases.begin(), sellerPhases.end(), TradePhase::Disputed) != sellerPhases.end());

        auto settlement = market.GetSettlement("stalled");
        TRADE_CHECK(settlement && settlement->m_BuyerAmount == 115 && settlement->m_SellerAmount == 20);
    }

    void TestTamperedFundLock()
    {
        cout << "Test tampered fund lock\n";

        Market market;
        market.m_Network.SetFilter([](const PeerID&, TradeMessage& message)
        {
            if (message.m_Type == TradeMessageType::DepositTxPublished)
            {
                auto tx = message.GetMandatoryParameter<FundLockTx>(TradeParameterID::FundLockTx);
                tx.m_EscrowAmount -= 1;
                for (auto& [id, value] : message.m_Parameters)
                {
                    if (id == TradeParameterID::FundLockTx)
                    {
                        value = toByteBuffer(tx);
                    }
                }
            }
            return true;
        });
        market.Start("tampered");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.IsPhase(*market.m_Buyer, "tampered", TradePhase::Error); }));
        auto trade = market.m_Buyer->GetTrade("tampered");
        TRADE_CHECK(trade && trade->GetFailureReason() == TradeFailureReason::SecurityIntegrityFailure);
        TRADE_CHECK(trade && !trade->IsFundLocked());
    }

    void TestForeignMessages()
    {
        cout << "Test messages from unrelated peers\n";

        Market market;
        market.m_Network.SetFilter([](const PeerID&, TradeMessage& message)
        {
            return message.m_Type != TradeMessageType::PayoutSignature;
        });
        market.Start("guarded");
        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.IsPhase(*market.m_Seller, "guarded", TradePhase::DepositConfirmed); }));

        auto before = market.m_Seller->GetPhase("guarded");

        // an outsider posing as the buyer
        TradeMessage forged("guarded", TradeRole::Buyer, TradeMessageType::PayoutSignature);
        forged.m_From = "mallory";
        forged.AddParameter(TradeParameterID::BuyerPayoutSignature, Signature{ 0x30, 0x00 });
        market.m_Seller->OnTradeMessage("mallory", forged);

        // the sender id doesn't match the channel
        forged.m_From = kBuyer;
        market.m_Seller->OnTradeMessage("mallory", forged);

        // a confirmation only comes from the own ledger subscription
        TradeMessage confirmation("guarded", TradeRole::Buyer, TradeMessageType::FundLockConfirmed);
        confirmation.m_From = kBuyer;
        market.m_Seller->OnTradeMessage(kBuyer, confirmation);

        TRADE_CHECK(market.m_Seller->GetPhase("guarded") == before);
        auto status = market.m_Seller->GetSequencerStatus("guarded");
        TRADE_CHECK(status && *status == StepSequencer::Status::Suspended);
    }

    void TestEarlyPayoutSignature()
    {
        cout << "Test payout signature ahead of the seller's confirmation\n";

        Market market;
        boost::optional<TradeMessage> confirmation;
        bool released = false;
        bool signatureFirst = false;

        // the seller's ledger lags, the buyer's signature overtakes its confirmation
        market.m_Network.SetFilter([&](const PeerID& to, TradeMessage& message)
        {
            if (to != kSeller)
            {
                return true;
            }
            if (message.m_Type == TradeMessageType::FundLockConfirmed && !released)
            {
                confirmation = message;
                return false;
            }
            if (message.m_Type == TradeMessageType::PayoutSignature && confirmation && !released)
            {
                signatureFirst = market.IsPhase(*market.m_Seller, "early", TradePhase::DepositPublished);
                released = true;
                market.m_Network.Send(kSeller, *confirmation);
            }
            return true;
        });
        market.Start("early");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.BothCompleted("early"); }));
        TRADE_CHECK(released && signatureFirst);

        auto trade = market.m_Seller->GetTrade("early");
        TRADE_CHECK(trade && !trade->GetFailureReason());

        const auto& sellerPhases = market.m_SellerPhases.m_Phases["early"];
        TRADE_CHECK(find(sellerPhases.begin(), sellerPhases.end(), TradePhase::Error) == sellerPhases.end());

        auto settlement = market.GetSettlement("early");
        TRADE_CHECK(settlement && settlement->m_BuyerAmount == 115 && settlement->m_SellerAmount == 20);
    }

    void TestOutOfProtocolMessage()
    {
        cout << "Test message outside the protocol\n";

        Market market;
        bool confirmationHeld = false;
        market.m_Network.SetFilter([&](const PeerID& to, TradeMessage& message)
        {
            if (to == kSeller && message.m_Type == TradeMessageType::FundLockConfirmed)
            {
                confirmationHeld = true;
                return false;
            }
            return message.m_Type != TradeMessageType::PayoutSignature;
        });
        market.Start("stray");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return confirmationHeld; }));
        TRADE_CHECK(market.IsPhase(*market.m_Seller, "stray", TradePhase::DepositPublished));

        // the seller publishes the payout itself, no step of its sequence takes this
        TradeMessage stray("stray", TradeRole::Buyer, TradeMessageType::PayoutTxPublished);
        stray.m_From = kBuyer;
        market.m_Seller->OnTradeMessage(kBuyer, stray);

        TRADE_CHECK(market.IsPhase(*market.m_Seller, "stray", TradePhase::Error));
        auto trade = market.m_Seller->GetTrade("stray");
        TRADE_CHECK(trade && trade->GetFailureReason() == TradeFailureReason::PeerProtocolFailure);
    }

    void TestOfferWithoutArbitratorKey()
    {
        cout << "Test offer without arbitrator key\n";

        Market market;
        auto offer = market.MakeOffer("keyless");
        offer.m_ArbitratorPubKey.clear();

        TRADE_CHECK_THROW(market.m_Seller->PublishOffer(offer));
        TRADE_CHECK_THROW(market.m_Buyer->StartTrade(offer, TradeRole::Buyer, kSeller));
        TRADE_CHECK(!market.m_Buyer->GetTrade("keyless"));
        TRADE_CHECK(market.m_DB->getTrades().empty());
    }

    void TestIndependentTrades()
    {
        cout << "Test independent trades on one reactor\n";

        Market market(Amount(60));

        // only the second trade is disputed
        market.m_Buyer->SetInterceptHook([](const IProtocolStep& step, StepContext& context) -> boost::optional<StepOutcome>
        {
            if (context.m_Trade.GetID() == "second" && string(step.GetName()) == "PayoutSigning")
            {
                return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "goods not delivered", TradePhase::Disputed);
            }
            return boost::none;
        });
        market.Start("first");
        market.Start("second");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.BothCompleted("first") && market.BothCompleted("second"); }));

        auto first = market.GetSettlement("first");
        auto second = market.GetSettlement("second");
        TRADE_CHECK(first && first->m_BuyerAmount == 115 && first->m_SellerAmount == 20);
        TRADE_CHECK(second && second->m_BuyerAmount == 60 && second->m_SellerAmount == 75);
        TRADE_CHECK(first && second && first->m_FundLockTx.m_TxID != second->m_FundLockTx.m_TxID);

        const auto& firstPhases = market.m_BuyerPhases.m_Phases["first"];
        TRADE_CHECK(find(firstPhases.begin(), firstPhases.end(), TradePhase::Disputed) == firstPhases.end());
        TRADE_CHECK(!market.m_Arbitrator->GetTrade("first"));
        TRADE_CHECK(market.IsPhase(*market.m_Arbitrator, "second", TradePhase::Completed));
    }

    void TestResumeAfterRestart()
    {
        cout << "Test resume after restart\n";

        Market market;
        vector<TradeMessage> held;
        market.m_Network.SetFilter([&held](const PeerID&, TradeMessage& message)
        {
            if (message.m_Type == TradeMessageType::PayoutSignature)
            {
                held.push_back(message);
                return false;
            }
            return true;
        });
        market.Start("restart");

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return !held.empty(); }));
        TRADE_CHECK(market.IsPhase(*market.m_Seller, "restart", TradePhase::DepositConfirmed));

        // seller goes down and comes back with the same wallet
        market.m_Seller->Unsubscribe(&market.m_SellerPhases);
        market.m_Network.Unregister(kSeller);
        market.m_Seller.reset();

        market.m_Seller = make_unique<TradeManager>(kSeller, *market.m_Reactor, market.m_DB,
                                                    make_shared<LocalKeyService>(MakeSeed("seller")), market.m_Ledger, market.m_Network);
        market.m_Seller->Subscribe(&market.m_SellerPhases);
        market.m_Network.Register(*market.m_Seller);

        TRADE_CHECK(!market.m_Seller->GetTrade("restart") || !market.m_Seller->GetSequencerStatus("restart"));
        TRADE_CHECK(market.m_Seller->ResumeAllTrades() == 1);
        TRADE_CHECK(market.m_Seller->ResumeAllTrades() == 0);

        auto status = market.m_Seller->GetSequencerStatus("restart");
        TRADE_CHECK(status && *status == StepSequencer::Status::Suspended);

        market.m_Network.SetFilter(TestNetwork::Filter());
        for (const auto& message : held)
        {
            market.m_Network.Send(kSeller, message);
        }

        TRADE_CHECK(RunUntil(*market.m_Reactor, [&] { return market.BothCompleted("restart"); }));
        auto settlement = market.GetSettlement("restart");
        TRADE_CHECK(settlement && settlement->m_BuyerAmount == 115 && settlement->m_SellerAmount == 20);
    }

    void TestLoadForAdministration()
    {
        cout << "Test load trades without running them\n";

        Market market;
        market.m_Buyer->StartTrade(market.MakeOffer("stored"), TradeRole::Buyer, kSeller);

        struct SilentGateway : ITradeGateway
        {
            void Send(const PeerID&, const TradeMessage&) override { ++m_Sent; }
            int m_Sent = 0;
        } gateway;

        TradeManager offline(kBuyer, *market.m_Reactor, market.m_DB, market.m_BuyerKeys, market.m_Ledger, gateway);
        TRADE_CHECK(offline.LoadAllTrades() == 1);
        TRADE_CHECK(!offline.GetSequencerStatus("stored"));
        TRADE_CHECK(offline.GetPhase("stored") == TradePhase::Negotiated);
        TRADE_CHECK(offline.CancelTrade("stored") == TradeManager::CancelResult::Canceled);
        TRADE_CHECK(gateway.m_Sent == 1);

        auto stored = market.m_DB->loadTrade(kBuyer, "stored", market.m_BuyerKeys, market.m_Ledger);
        TRADE_CHECK(stored && stored->GetPhase() == TradePhase::Canceled);
    }
}

int main()
{
    int logLevel = LOG_LEVEL_WARNING;
#if LOG_VERBOSE_ENABLED
    logLevel = LOG_LEVEL_VERBOSE;
#endif
    auto logger = Logger::create(logLevel, logLevel);

    TestCooperativeTrade();
    TestDisputedTrade();
    TestOpenDispute();
    TestCancel();
    TestCancelByPeer();
    TestTimeoutBeforeFundLock();
    TestTimeoutEscalates();
    TestTamperedFundLock();
    TestForeignMessages();
    TestEarlyPayoutSignature();
    TestOutOfProtocolMessage();
    TestOfferWithoutArbitratorKey();
    TestIndependentTrades();
    TestResumeAfterRestart();
    TestLoadForAdministration();

    return TRADE_CHECK_RESULT;
}
