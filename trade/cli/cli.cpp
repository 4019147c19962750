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

#include "utility/options.h"
#include "utility/helpers.h"
#include "utility/io/reactor.h"
#include "utility/io/asyncevent.h"
#include "utility/io/timer.h"
#include "core/ecc.h"
#include "keykeeper/local_key_service.h"
#include "ledger/local_ledger.h"
#include "trade/core/trade_manager.h"
#include "trade/protocol/protocols.h"
#include "trade/protocol/common_steps.h"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include <deque>
#include <iomanip>

#ifndef SETTLE_VERSION
#define SETTLE_VERSION "0.0.0"
#endif

#define APP_NAME "settle-cli"
#define LOG_FILES_PREFIX "settle_cli_"

using namespace std;
using namespace settle;
using namespace settle::trade;

namespace
{
    const char kDefaultConfigFile[] = "settle-cli.cfg";
    const char kDevelopmentSeed[] = "settle development seed";

    const char kBuyerID[] = "buyer";
    const char kSellerID[] = "seller";
    const char kArbitratorID[] = "arbitrator";

    const char kErrorCommandNotSpecified[] = "command parameter not specified.";
    const char kErrorCommandUnknown[] = "unknown command: \'%1%\'";
    const char kErrorTradeIdNotSpecified[] = "trade id is not specified, use --trade_id";
    const char kErrorTradeNotFound[] = "trade %1% not found";

    //
    // Hands messages between the managers of one process. Every message goes
    // through the wire encoding and is delivered later from the reactor
    //
    class LoopbackNetwork : public ITradeGateway
    {
    public:
        explicit LoopbackNetwork(io::Reactor& reactor)
            : m_Event(io::AsyncEvent::create(reactor, [this]() { Deliver(); }))
        {
        }

        void Register(TradeManager& manager)
        {
            m_Peers[manager.GetOwnID()] = &manager;
        }

        void Send(const PeerID& peerID, const TradeMessage& message) override
        {
            LOG_DEBUG() << message.m_From << " -> " << peerID << ": " << message.m_Type << " " << message.m_TradeID;
            m_Queue.emplace_back(peerID, toByteBuffer(message));
            m_Event->post();
        }

    private:
        void Deliver()
        {
            while (!m_Queue.empty())
            {
                auto [peerID, buffer] = std::move(m_Queue.front());
                m_Queue.pop_front();

                auto it = m_Peers.find(peerID);
                if (it == m_Peers.end())
                {
                    LOG_WARNING() << "no route to " << peerID << ", message dropped";
                    continue;
                }

                TradeMessage message;
                if (!fromByteBuffer(buffer, message))
                {
                    LOG_ERROR() << "malformed message for " << peerID << " dropped";
                    continue;
                }
                it->second->OnTradeMessage(message.m_From, message);
            }
        }

    private:
        io::AsyncEvent::Ptr m_Event;
        std::map<PeerID, TradeManager*> m_Peers;
        std::deque<std::pair<PeerID, ByteBuffer>> m_Queue;
    };

    // used by the administrative commands, nobody is listening
    class OfflineGateway : public ITradeGateway
    {
    public:
        void Send(const PeerID& peerID, const TradeMessage& message) override
        {
            LOG_INFO() << "offline, " << message.m_Type << " for " << peerID << " is not sent";
        }
    };

    class PhasePrinter : public ITradeObserver
    {
    public:
        PhasePrinter(const PeerID& ownID, std::function<void()> onChanged)
            : m_OwnID(ownID)
            , m_OnChanged(std::move(onChanged))
        {
        }

        void OnTradePhaseChanged(const TradeID& tradeID, TradePhase from, TradePhase to) override
        {
            cout << std::setw(12) << std::left << m_OwnID << tradeID << ": " << from << " -> " << to << endl;
            if (m_OnChanged)
            {
                m_OnChanged();
            }
        }

    private:
        PeerID m_OwnID;
        std::function<void()> m_OnChanged;
    };

    struct Command
    {
        using CommandFunc = int (*)(const po::variables_map&);
        std::string name;
        CommandFunc handler;
        std::string description;
    };

    // simple formating
    void PrintParagraph(std::stringstream& ss, const std::string& text, size_t start, size_t end)
    {
        for (size_t s = ss.str().size(); s < start; ++s)
        {
            ss.put(' ');
        }
        size_t linePos = start;
        std::istringstream words(text);
        std::string word;
        bool first = true;
        while (words >> word)
        {
            if (!first && linePos + word.size() + 1 > end)
            {
                ss << '\n' << std::string(start, ' ');
                linePos = start;
                first = true;
            }
            if (!first)
            {
                ss.put(' ');
                ++linePos;
            }
            ss << word;
            linePos += word.size();
            first = false;
        }
    }

    void printHelp(const Command* begin, const Command* end, const po::options_description& options)
    {
        cout << "\nUSAGE: " << APP_NAME << " <command> [options]\n\n";
        cout << "COMMANDS:\n";
        for (auto it = begin; it != end; ++it)
        {
            std::stringstream ss;
            ss << "  " << it->name;
            PrintParagraph(ss, it->description, 40, 80);
            ss << '\n';
            cout << ss.str();
        }
        cout << std::endl;
        cout << options << std::endl;
    }

    // every party of the process gets its own wallet seed derived from the common one
    ByteBuffer GetPartySeed(const po::variables_map& vm, const PeerID& party)
    {
        ByteBuffer seed;
        if (vm.count(cli::SEED))
        {
            bool isValid = false;
            seed = from_hex(vm[cli::SEED].as<string>(), &isValid);
            if (!isValid || seed.empty())
            {
                throw po::invalid_option_value(vm[cli::SEED].as<string>());
            }
        }
        else
        {
            seed.assign(kDevelopmentSeed, kDevelopmentSeed + sizeof(kDevelopmentSeed) - 1);
        }

        auto partySeed = ecc::HmacSha256(seed, ByteBuffer(party.begin(), party.end()));
        SecureErase(seed.data(), seed.size());
        return ByteBuffer(partySeed.begin(), partySeed.end());
    }

    TradeDB::Ptr OpenDatabase(const po::variables_map& vm)
    {
        auto path = vm[cli::DB_PATH].as<string>();
        LOG_DEBUG() << "trade database " << path;
        return TradeDB::open(path);
    }

    std::string FormatTime(Timestamp t)
    {
        return format_timestamp("%Y.%m.%d %H:%M:%S", t * 1000, false);
    }

    void PrintSettlement(const LocalLedger& ledger, const Trade& trade)
    {
        const auto& fundLock = trade.GetContext().GetFundLockTx();
        if (!fundLock)
        {
            cout << "no funds were locked" << endl;
            return;
        }

        cout << "fund lock " << to_string(fundLock->m_TxID) << " escrow=" << fundLock->m_EscrowAmount << endl;
        auto settlement = ledger.GetSettlement(fundLock->m_TxID);
        if (!settlement)
        {
            cout << "escrow is not spent" << endl;
            return;
        }

        cout << "payout:\n"
             << "  buyer  " << settlement->m_BuyerAmount << " -> " << settlement->m_BuyerAddress << "\n"
             << "  seller " << settlement->m_SellerAmount << " -> " << settlement->m_SellerAddress << endl;
    }

    int Simulate(const po::variables_map& vm)
    {
        auto params = getProtocolParams(vm);
        auto db = OpenDatabase(vm);

        Offer offer;
        offer.m_OfferID = vm[cli::TRADE_ID].as<string>();
        if (offer.m_OfferID.empty())
        {
            offer.m_OfferID = "T" + std::to_string(local_timestamp_msec());
        }
        offer.m_Amount = vm[cli::AMOUNT].as<Amount>();
        offer.m_BuyerDeposit = vm[cli::BUYER_DEPOSIT].as<Amount>();
        offer.m_SellerDeposit = vm[cli::SELLER_DEPOSIT].as<Amount>();
        offer.m_Maker = kSellerID;
        offer.m_Arbitrator = kArbitratorID;

        boost::optional<Amount> award;
        if (vm.count(cli::AWARD))
        {
            award = vm[cli::AWARD].as<Amount>();
        }

        auto& reactor = io::Reactor::get_Current();
        auto ledger = std::make_shared<LocalLedger>(reactor, params.confirmation_delay);
        auto buyerKeys = std::make_shared<LocalKeyService>(GetPartySeed(vm, kBuyerID));
        auto sellerKeys = std::make_shared<LocalKeyService>(GetPartySeed(vm, kSellerID));
        auto arbitratorKeys = std::make_shared<LocalKeyService>(GetPartySeed(vm, kArbitratorID));

        // the arbitrator's escrow key is announced with the offer
        offer.m_ArbitratorPubKey = arbitratorKeys->GetOrCreateAddressEntry(kArbitratorKeyID, AddressPurpose::MultiSig).m_PubKey;

        LoopbackNetwork network(reactor);
        TradeManager buyer(kBuyerID, reactor, db, buyerKeys, ledger, network, {}, params.peer_timeout);
        TradeManager seller(kSellerID, reactor, db, sellerKeys, ledger, network, {}, params.peer_timeout);
        TradeManager arbitrator(kArbitratorID, reactor, db, arbitratorKeys, ledger, network,
                                std::make_shared<FixedAwardResolver>(award), params.peer_timeout);
        network.Register(buyer);
        network.Register(seller);
        network.Register(arbitrator);

        auto isFinished = [&]()
        {
            auto buyerPhase = buyer.GetPhase(offer.m_OfferID);
            auto sellerPhase = seller.GetPhase(offer.m_OfferID);
            auto finished = [](const boost::optional<TradePhase>& phase)
            {
                return phase && (*phase == TradePhase::Completed || *phase == TradePhase::Canceled || *phase == TradePhase::Error);
            };
            if (!finished(buyerPhase) || !finished(sellerPhase))
            {
                return false;
            }
            // a dispute is over when the arbitrator has sent the ruling
            auto arbitratorPhase = arbitrator.GetPhase(offer.m_OfferID);
            return !arbitratorPhase || *arbitratorPhase == TradePhase::Completed;
        };

        auto onChanged = [&]()
        {
            if (isFinished())
            {
                reactor.stop();
            }
        };

        PhasePrinter buyerPrinter(kBuyerID, onChanged);
        PhasePrinter sellerPrinter(kSellerID, onChanged);
        PhasePrinter arbitratorPrinter(kArbitratorID, onChanged);
        buyer.Subscribe(&buyerPrinter);
        seller.Subscribe(&sellerPrinter);
        arbitrator.Subscribe(&arbitratorPrinter);

        if (award)
        {
            // the buyer refuses to sign the cooperative payout
            buyer.SetInterceptHook([](const IProtocolStep& step, StepContext& context) -> boost::optional<StepOutcome>
            {
                if (std::string(step.GetName()) == "PayoutSigning" && context.m_Trade.IsFundLocked())
                {
                    return StepOutcome::Failed(TradeFailureReason::PeerProtocolFailure, "buyer rejects the delivery", TradePhase::Disputed);
                }
                return boost::none;
            });
        }

        auto deadline = io::Timer::create(reactor);
        deadline->start(params.peer_timeout * 4 + params.confirmation_delay, false, [&]()
        {
            LOG_ERROR() << "simulation did not finish in time";
            reactor.stop();
        });

        cout << boost::format("trade %1%: amount=%2% buyer_deposit=%3% seller_deposit=%4%")
            % offer.m_OfferID % offer.m_Amount % offer.m_BuyerDeposit % offer.m_SellerDeposit << endl;

        seller.PublishOffer(offer);
        buyer.StartTrade(offer, TradeRole::Buyer, kSellerID);

        reactor.run();
        deadline->cancel();

        buyer.Unsubscribe(&buyerPrinter);
        seller.Unsubscribe(&sellerPrinter);
        arbitrator.Unsubscribe(&arbitratorPrinter);

        auto trade = buyer.GetTrade(offer.m_OfferID);
        if (!trade)
        {
            LOG_ERROR() << boost::format(kErrorTradeNotFound) % offer.m_OfferID;
            return -1;
        }
        PrintSettlement(*ledger, *trade);
        return isFinished() && trade->GetPhase() == TradePhase::Completed ? 0 : -1;
    }

    int ListTrades(const po::variables_map& vm)
    {
        auto db = OpenDatabase(vm);
        auto trades = db->getTrades();

        const array<uint8_t, 9> columnWidths{ { 12, 16, 12, 18, 10, 10, 10, 22, 32 } };
        cout << boost::format("TRADES (%1%)\n\n") % trades.size()
             << boost::format("  %1% %2% %3% %4% %5% %6% %7% %8% %9%")
                % boost::io::group(left, setw(columnWidths[0]), "owner")
                % boost::io::group(left, setw(columnWidths[1]), "id")
                % boost::io::group(left, setw(columnWidths[2]), "role")
                % boost::io::group(left, setw(columnWidths[3]), "phase")
                % boost::io::group(right, setw(columnWidths[4]), "amount")
                % boost::io::group(right, setw(columnWidths[5]), "buyer dep.")
                % boost::io::group(right, setw(columnWidths[6]), "seller dep.")
                % boost::io::group(left, setw(columnWidths[7]), " modified")
                % boost::io::group(left, setw(columnWidths[8]), "failure")
             << std::endl;

        for (const auto& record : trades)
        {
            std::string failure;
            if (record.m_FailureReason >= 0)
            {
                failure = GetFailureMessage(static_cast<TradeFailureReason>(record.m_FailureReason));
                if (!record.m_FailureMessage.empty())
                {
                    failure += ": " + record.m_FailureMessage;
                }
            }

            cout << boost::format("  %1% %2% %3% %4% %5% %6% %7% %8% %9%")
                % boost::io::group(left, setw(columnWidths[0]), record.m_Owner)
                % boost::io::group(left, setw(columnWidths[1]), record.m_ID)
                % boost::io::group(left, setw(columnWidths[2]), to_string(record.m_Role))
                % boost::io::group(left, setw(columnWidths[3]), to_string(record.m_Phase))
                % boost::io::group(right, setw(columnWidths[4]), record.m_Amount)
                % boost::io::group(right, setw(columnWidths[5]), record.m_BuyerDeposit)
                % boost::io::group(right, setw(columnWidths[6]), record.m_SellerDeposit)
                % boost::io::group(left, setw(columnWidths[7]), " " + FormatTime(record.m_ModifyTime))
                % failure
                << std::endl;
        }
        return 0;
    }

    using OfflineAction = std::function<bool(TradeManager&, const TradeID&)>;

    // runs the action for every local party of the trade, without resuming it
    int RunOffline(const po::variables_map& vm, const OfflineAction& action)
    {
        auto tradeID = vm[cli::TRADE_ID].as<string>();
        if (tradeID.empty())
        {
            LOG_ERROR() << kErrorTradeIdNotSpecified;
            return -1;
        }

        auto params = getProtocolParams(vm);
        auto db = OpenDatabase(vm);
        auto& reactor = io::Reactor::get_Current();
        auto ledger = std::make_shared<LocalLedger>(reactor, params.confirmation_delay);
        OfflineGateway gateway;

        bool found = false;
        bool succeeded = true;
        for (const auto& record : db->getTrades())
        {
            if (record.m_ID != tradeID || record.m_Role == TradeRole::Arbitrator)
            {
                continue;
            }
            found = true;

            auto keys = std::make_shared<LocalKeyService>(GetPartySeed(vm, record.m_Owner));
            TradeManager manager(record.m_Owner, reactor, db, keys, ledger, gateway, {}, params.peer_timeout);
            manager.LoadAllTrades();
            succeeded = action(manager, tradeID) && succeeded;

            auto phase = manager.GetPhase(tradeID);
            cout << record.m_Owner << " " << tradeID << ": " << (phase ? to_string(*phase) : std::string("unknown")) << endl;
        }

        if (!found)
        {
            LOG_ERROR() << boost::format(kErrorTradeNotFound) % tradeID;
            return -1;
        }
        return succeeded ? 0 : -1;
    }

    int CancelTrade(const po::variables_map& vm)
    {
        return RunOffline(vm, [](TradeManager& manager, const TradeID& tradeID)
        {
            auto result = manager.CancelTrade(tradeID);
            LOG_INFO() << manager.GetOwnID() << " cancel " << tradeID << ": " << to_string(result);
            return result == TradeManager::CancelResult::Canceled;
        });
    }

    int OpenDispute(const po::variables_map& vm)
    {
        return RunOffline(vm, [](TradeManager& manager, const TradeID& tradeID)
        {
            return manager.OpenDispute(tradeID);
        });
    }
}

int main(int argc, char* argv[])
{
    const Command commands[] =
    {
        {cli::SIMULATE,     Simulate,       "run a trade between a buyer, a seller and an arbitrator in one process, --award forces a dispute"},
        {cli::LIST,         ListTrades,     "print all stored trades"},
        {cli::CANCEL,       CancelTrade,    "cancel a stored trade that has no locked funds"},
        {cli::DISPUTE,      OpenDispute,    "escalate a stored trade with locked funds to the arbitrator"},
    };

    try
    {
        auto [options, visibleOptions] = createOptionsDescription(ALL_OPTIONS);

        po::variables_map vm;
        try
        {
            vm = getOptions(argc, argv, kDefaultConfigFile, options, true);
        }
        catch (const po::invalid_option_value& e)
        {
            cout << e.what() << std::endl;
            return 0;
        }
        catch (const po::error& e)
        {
            cout << e.what() << std::endl;
            printHelp(begin(commands), end(commands), visibleOptions);
            return 0;
        }

        if (vm.count(cli::HELP))
        {
            printHelp(begin(commands), end(commands), visibleOptions);
            return 0;
        }

        if (vm.count(cli::VERSION))
        {
            cout << SETTLE_VERSION << endl;
            return 0;
        }

        int logLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO);
        int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_LEVEL_DEBUG);

        const auto path = boost::filesystem::absolute(vm[cli::LOG_PATH].as<string>());
        auto logger = Logger::create(logLevel, logLevel, fileLogLevel, LOG_FILES_PREFIX, path.string());

        try
        {
            auto reactor = io::Reactor::create();
            io::Reactor::Scope scope(*reactor);
            io::Reactor::GracefulIntHandler gih(*reactor);

            if (vm.count(cli::COMMAND) == 0)
            {
                LOG_ERROR() << kErrorCommandNotSpecified;
                printHelp(begin(commands), end(commands), visibleOptions);
                return 0;
            }

            auto command = vm[cli::COMMAND].as<string>();

            auto cit = find_if(begin(commands), end(commands), [&command](const auto& p) { return p.name == command; });
            if (cit == end(commands))
            {
                LOG_ERROR() << boost::format(kErrorCommandUnknown) % command;
                return -1;
            }

            LOG_INFO() << APP_NAME << " " << SETTLE_VERSION;
            return cit->handler(vm);
        }
        catch (const DatabaseException& ex)
        {
            LOG_ERROR() << ex.what();
            return -1;
        }
        catch (const po::invalid_option_value& e)
        {
            cout << e.what() << std::endl;
            return 0;
        }
        catch (const po::error& e)
        {
            LOG_ERROR() << e.what();
            printHelp(begin(commands), end(commands), visibleOptions);
        }
        catch (const TradeFailedException& e)
        {
            LOG_ERROR() << e.what();
            return -1;
        }
        catch (const std::runtime_error& e)
        {
            LOG_ERROR() << e.what();
            return -1;
        }
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        return -1;
    }

    return 0;
}
