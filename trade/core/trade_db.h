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

struct sqlite3;

namespace settle::trade
{
    class DatabaseException : public std::runtime_error
    {
    public:
        explicit DatabaseException(const std::string& message)
            : std::runtime_error(message.length() ? message : "DatabaseException")
        {
        }
    };

    // flat row of the Trades table
    struct TradeRecord
    {
        PeerID m_Owner;
        TradeID m_ID;
        TradeRole m_Role = TradeRole::Buyer;
        TradePhase m_Phase = TradePhase::Negotiated;
        Amount m_Amount = 0;
        Amount m_BuyerDeposit = 0;
        Amount m_SellerDeposit = 0;
        PeerID m_BuyerID;
        PeerID m_SellerID;
        PeerID m_ArbitratorID;
        SequenceKind m_Sequence = SequenceKind::Main;
        uint32_t m_NextStep = 0;
        int m_Awaited = -1;             // TradeMessageType or -1
        int m_FailureReason = -1;       // TradeFailureReason or -1
        std::string m_FailureMessage;
        Timestamp m_CreateTime = 0;
        Timestamp m_ModifyTime = 0;
    };

    //
    // sqlite storage of trades and their shared context. Trades of several
    // local identities may live in one file, every call is scoped by the owner
    //
    class TradeDB
    {
    public:
        using Ptr = std::shared_ptr<TradeDB>;

        static Ptr open(const std::string& path);

        TradeDB(const TradeDB&) = delete;
        TradeDB& operator=(const TradeDB&) = delete;
        ~TradeDB();

        void saveTrade(const Trade& trade);
        // nullptr if there is no such trade
        Trade::Ptr loadTrade(const PeerID& owner, const TradeID& id, IKeyService::Ptr keyService, ITradeTxService::Ptr txService) const;
        // trades that still need the engine: not Completed, not Canceled, not Error without a fund lock
        std::vector<Trade::Ptr> loadActiveTrades(const PeerID& owner, IKeyService::Ptr keyService, ITradeTxService::Ptr txService) const;
        // all trades, all owners when owner is empty
        std::vector<TradeRecord> getTrades(const PeerID& owner = PeerID()) const;
        bool deleteTrade(const PeerID& owner, const TradeID& id);

    private:
        explicit TradeDB(sqlite3* db);

        void createTables();
        PackedTradeParameters loadParameters(const PeerID& owner, const TradeID& id) const;
        Trade::Ptr restoreTrade(const TradeRecord& record, IKeyService::Ptr keyService, ITradeTxService::Ptr txService) const;

    private:
        sqlite3* _db;
    };
}
