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

#include "trade_db.h"

#include <sqlite3.h>
#include <limits>
#include <sstream>

#define NOSEP
#define COMMA ", "
#define AND " AND "

#define ENUM_TRADE_ID(each, sep, obj) \
    each(owner,          Owner,          TEXT NOT NULL, obj) sep \
    each(id,             ID,             TEXT NOT NULL, obj)

#define ENUM_TRADE_FIELDS(each, sep, obj) \
    each(role,           Role,           INTEGER NOT NULL, obj) sep \
    each(phase,          Phase,          INTEGER NOT NULL, obj) sep \
    each(amount,         Amount,         INTEGER NOT NULL, obj) sep \
    each(buyerDeposit,   BuyerDeposit,   INTEGER NOT NULL, obj) sep \
    each(sellerDeposit,  SellerDeposit,  INTEGER NOT NULL, obj) sep \
    each(buyerID,        BuyerID,        TEXT, obj) sep \
    each(sellerID,       SellerID,       TEXT, obj) sep \
    each(arbitratorID,   ArbitratorID,   TEXT, obj) sep \
    each(sequence,       Sequence,       INTEGER NOT NULL, obj) sep \
    each(nextStep,       NextStep,       INTEGER NOT NULL, obj) sep \
    each(awaited,        Awaited,        INTEGER NOT NULL, obj) sep \
    each(failureReason,  FailureReason,  INTEGER NOT NULL, obj) sep \
    each(failureMessage, FailureMessage, TEXT, obj) sep \
    each(createTime,     CreateTime,     INTEGER NOT NULL, obj) sep \
    each(modifyTime,     ModifyTime,     INTEGER NOT NULL, obj)

#define ENUM_ALL_TRADE_FIELDS(each, sep, obj) \
    ENUM_TRADE_ID(each, sep, obj) sep \
    ENUM_TRADE_FIELDS(each, sep, obj)

#define ENUM_TRADE_PARAMS_FIELDS(each, sep, obj) \
    each(owner,          owner,          TEXT NOT NULL, obj) sep \
    each(tradeID,        tradeID,        TEXT NOT NULL, obj) sep \
    each(paramID,        paramID,        INTEGER NOT NULL, obj) sep \
    each(value,          value,          BLOB, obj)

#define LIST(name, member, type, obj) #name
#define LIST_WITH_TYPES(name, member, type, obj) #name " " #type

#define STM_BIND_LIST(name, member, type, obj) stm.bind(++colIdx, obj .m_ ## member);
#define STM_GET_LIST(name, member, type, obj) stm.get(colIdx++, obj .m_ ## member);

#define BIND_LIST(name, member, type, obj) "?"
#define SET_LIST(name, member, type, obj) #name "=?"

#define TRADES_NAME "Trades"
#define TRADE_PARAMS_NAME "TradeParameters"

#define TRADE_FIELDS ENUM_ALL_TRADE_FIELDS(LIST, COMMA, )
#define TRADE_PARAMS_FIELDS ENUM_TRADE_PARAMS_FIELDS(LIST, COMMA, )

namespace settle::trade
{
    using namespace std;

    namespace
    {
        void throwIfError(int res, sqlite3* db)
        {
            if (res == SQLITE_OK)
            {
                return;
            }
            stringstream ss;
            ss << "sqlite error code=" << res << ", " << sqlite3_errmsg(db);
            throw DatabaseException(ss.str());
        }

        struct Statement
        {
            Statement(sqlite3* db, const char* sql)
                : _db(db)
                , _stm(nullptr)
            {
                int ret = sqlite3_prepare_v2(_db, sql, -1, &_stm, nullptr);
                throwIfError(ret, _db);
            }

            ~Statement()
            {
                sqlite3_finalize(_stm);
            }

            void bind(int col, int val)
            {
                int ret = sqlite3_bind_int(_stm, col, val);
                throwIfError(ret, _db);
            }

            void bind(int col, uint32_t val)
            {
                int ret = sqlite3_bind_int64(_stm, col, val);
                throwIfError(ret, _db);
            }

            void bind(int col, uint64_t val)
            {
                int ret = sqlite3_bind_int64(_stm, col, static_cast<sqlite3_int64>(val));
                throwIfError(ret, _db);
            }

            template<typename EnumType, typename = std::enable_if_t<std::is_enum_v<EnumType>>>
            void bind(int col, EnumType val)
            {
                bind(col, static_cast<int>(val));
            }

            void bind(int col, const string& val) // utf-8
            {
                int ret = sqlite3_bind_text(_stm, col, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT);
                throwIfError(ret, _db);
            }

            void bind(int col, const ByteBuffer& m)
            {
                if (m.size() > static_cast<size_t>(numeric_limits<int32_t>::max()))
                {
                    throwIfError(SQLITE_TOOBIG, _db);
                }
                // empty blob is NOT NULL by convention, any non-null pointer will do
                const void* p = m.empty() ? static_cast<const void*>(this) : m.data();
                int ret = sqlite3_bind_blob(_stm, col, p, static_cast<int>(m.size()), SQLITE_TRANSIENT);
                throwIfError(ret, _db);
            }

            bool step()
            {
                int ret = sqlite3_step(_stm);
                switch (ret)
                {
                case SQLITE_ROW: return true;
                case SQLITE_DONE: return false;
                default:
                    throwIfError(ret, _db);
                    return false;
                }
            }

            void get(int col, int& val)
            {
                val = sqlite3_column_int(_stm, col);
            }

            void get(int col, uint32_t& val)
            {
                val = static_cast<uint32_t>(sqlite3_column_int64(_stm, col));
            }

            void get(int col, uint64_t& val)
            {
                val = static_cast<uint64_t>(sqlite3_column_int64(_stm, col));
            }

            template<typename EnumType, typename = std::enable_if_t<std::is_enum_v<EnumType>>>
            void get(int col, EnumType& val)
            {
                val = static_cast<EnumType>(sqlite3_column_int(_stm, col));
            }

            void get(int col, string& val)
            {
                const unsigned char* text = sqlite3_column_text(_stm, col);
                val = text ? string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(_stm, col)) : string();
            }

            void get(int col, ByteBuffer& val)
            {
                int size = sqlite3_column_bytes(_stm, col);
                const uint8_t* data = static_cast<const uint8_t*>(sqlite3_column_blob(_stm, col));
                val.clear();
                if (data && size > 0)
                {
                    val.assign(data, data + size);
                }
            }

            int changes() const
            {
                return sqlite3_changes(_db);
            }

        private:
            sqlite3* _db;
            sqlite3_stmt* _stm;
        };

        struct Transaction
        {
            explicit Transaction(sqlite3* db)
                : _db(db)
                , _commited(false)
                , _rollbacked(false)
            {
                int ret = sqlite3_exec(_db, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr);
                throwIfError(ret, _db);
            }

            ~Transaction()
            {
                if (!_commited && !_rollbacked)
                    rollback();
            }

            void commit()
            {
                int ret = sqlite3_exec(_db, "COMMIT;", nullptr, nullptr, nullptr);
                throwIfError(ret, _db);
                _commited = true;
            }

            void rollback() noexcept
            {
                int ret = sqlite3_exec(_db, "ROLLBACK;", nullptr, nullptr, nullptr);
                _rollbacked = (ret == SQLITE_OK);
            }

        private:
            sqlite3* _db;
            bool _commited;
            bool _rollbacked;
        };

        void exec(sqlite3* db, const char* sql)
        {
            int ret = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
            throwIfError(ret, db);
        }

        TradeRecord toRecord(const Trade& trade)
        {
            TradeRecord record;
            record.m_Owner = trade.GetOwnID();
            record.m_ID = trade.GetID();
            record.m_Role = trade.GetRole();
            record.m_Phase = trade.GetPhase();
            record.m_Amount = trade.GetAmount();
            record.m_BuyerDeposit = trade.GetBuyerDeposit();
            record.m_SellerDeposit = trade.GetSellerDeposit();
            record.m_BuyerID = trade.GetPeerID(TradeRole::Buyer);
            record.m_SellerID = trade.GetPeerID(TradeRole::Seller);
            record.m_ArbitratorID = trade.GetPeerID(TradeRole::Arbitrator);

            const auto& checkpoint = trade.GetCheckpoint();
            record.m_Sequence = checkpoint.m_Kind;
            record.m_NextStep = checkpoint.m_NextStep;
            record.m_Awaited = checkpoint.m_Awaited ? static_cast<int>(*checkpoint.m_Awaited) : -1;

            const auto& failure = trade.GetFailureReason();
            record.m_FailureReason = failure ? static_cast<int>(*failure) : -1;
            record.m_FailureMessage = trade.GetFailureMessage();
            record.m_CreateTime = trade.GetCreateTime();
            record.m_ModifyTime = trade.GetModifyTime();
            return record;
        }
    }

    TradeDB::Ptr TradeDB::open(const string& path)
    {
        sqlite3* db = nullptr;
        int ret = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
        if (ret != SQLITE_OK)
        {
            string message = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw DatabaseException("cannot open " + path + ": " + message);
        }

        auto tradeDB = Ptr(new TradeDB(db));
        tradeDB->createTables();
        LOG_DEBUG() << "Trade database opened: " << path;
        return tradeDB;
    }

    TradeDB::TradeDB(sqlite3* db)
        : _db(db)
    {
    }

    TradeDB::~TradeDB()
    {
        if (_db)
        {
            int ret = sqlite3_close(_db);
            if (ret != SQLITE_OK)
            {
                LOG_ERROR() << "sqlite3_close returned " << ret;
            }
            _db = nullptr;
        }
    }

    void TradeDB::createTables()
    {
        exec(_db, "CREATE TABLE IF NOT EXISTS " TRADES_NAME " (" ENUM_ALL_TRADE_FIELDS(LIST_WITH_TYPES, COMMA, ) ", PRIMARY KEY (owner, id));");
        exec(_db, "CREATE TABLE IF NOT EXISTS " TRADE_PARAMS_NAME " (" ENUM_TRADE_PARAMS_FIELDS(LIST_WITH_TYPES, COMMA, ) ", PRIMARY KEY (owner, tradeID, paramID));");
    }

    void TradeDB::saveTrade(const Trade& trade)
    {
        if (trade.GetOwnID().empty())
        {
            throw DatabaseException("trade " + trade.GetID() + " has no owner");
        }

        TradeRecord record = toRecord(trade);
        Transaction transaction(_db);
        {
            const char* req = "INSERT OR REPLACE INTO " TRADES_NAME " (" TRADE_FIELDS ") VALUES(" ENUM_ALL_TRADE_FIELDS(BIND_LIST, COMMA, ) ");";
            Statement stm(_db, req);
            int colIdx = 0;
            ENUM_ALL_TRADE_FIELDS(STM_BIND_LIST, NOSEP, record);
            stm.step();
        }
        {
            const char* req = "DELETE FROM " TRADE_PARAMS_NAME " WHERE owner=?1 AND tradeID=?2;";
            Statement stm(_db, req);
            stm.bind(1, record.m_Owner);
            stm.bind(2, record.m_ID);
            stm.step();
        }
        for (const auto& [paramID, value] : trade.GetContext().ExportParameters())
        {
            const char* req = "INSERT INTO " TRADE_PARAMS_NAME " (" TRADE_PARAMS_FIELDS ") VALUES(" ENUM_TRADE_PARAMS_FIELDS(BIND_LIST, COMMA, ) ");";
            Statement stm(_db, req);
            stm.bind(1, record.m_Owner);
            stm.bind(2, record.m_ID);
            stm.bind(3, paramID);
            stm.bind(4, value);
            stm.step();
        }
        transaction.commit();
    }

    PackedTradeParameters TradeDB::loadParameters(const PeerID& owner, const TradeID& id) const
    {
        PackedTradeParameters parameters;
        const char* req = "SELECT paramID, value FROM " TRADE_PARAMS_NAME " WHERE owner=?1 AND tradeID=?2 ORDER BY paramID;";
        Statement stm(_db, req);
        stm.bind(1, owner);
        stm.bind(2, id);
        while (stm.step())
        {
            TradeParameterID paramID;
            ByteBuffer value;
            stm.get(0, paramID);
            stm.get(1, value);
            parameters.emplace_back(paramID, std::move(value));
        }
        return parameters;
    }

    Trade::Ptr TradeDB::restoreTrade(const TradeRecord& record, IKeyService::Ptr keyService, ITradeTxService::Ptr txService) const
    {
        auto trade = std::make_shared<Trade>(record.m_ID, record.m_Role, std::move(keyService), std::move(txService));

        trade->SetPeerID(record.m_Role, record.m_Owner);
        if (!record.m_BuyerID.empty()) trade->SetPeerID(TradeRole::Buyer, record.m_BuyerID);
        if (!record.m_SellerID.empty()) trade->SetPeerID(TradeRole::Seller, record.m_SellerID);
        if (!record.m_ArbitratorID.empty()) trade->SetPeerID(TradeRole::Arbitrator, record.m_ArbitratorID);

        // terms go first, they are frozen once the fund lock is imported
        trade->SetTerms(record.m_Amount, record.m_BuyerDeposit, record.m_SellerDeposit);
        trade->GetContext().ImportParameters(loadParameters(record.m_Owner, record.m_ID));
        trade->RestorePhase(record.m_Phase);

        SequencerCheckpoint checkpoint;
        checkpoint.m_Kind = record.m_Sequence;
        checkpoint.m_NextStep = record.m_NextStep;
        if (record.m_Awaited >= 0)
        {
            checkpoint.m_Awaited = static_cast<TradeMessageType>(record.m_Awaited);
        }
        trade->SetCheckpoint(checkpoint);

        if (record.m_FailureReason >= 0)
        {
            trade->SetFailure(static_cast<TradeFailureReason>(record.m_FailureReason), record.m_FailureMessage);
        }
        trade->SetCreateTime(record.m_CreateTime);
        trade->SetModifyTime(record.m_ModifyTime);
        return trade;
    }

    Trade::Ptr TradeDB::loadTrade(const PeerID& owner, const TradeID& id, IKeyService::Ptr keyService, ITradeTxService::Ptr txService) const
    {
        const char* req = "SELECT " TRADE_FIELDS " FROM " TRADES_NAME " WHERE owner=?1 AND id=?2;";
        Statement stm(_db, req);
        stm.bind(1, owner);
        stm.bind(2, id);
        if (!stm.step())
        {
            return Trade::Ptr();
        }

        TradeRecord record;
        int colIdx = 0;
        ENUM_ALL_TRADE_FIELDS(STM_GET_LIST, NOSEP, record);
        return restoreTrade(record, std::move(keyService), std::move(txService));
    }

    vector<TradeRecord> TradeDB::getTrades(const PeerID& owner) const
    {
        vector<TradeRecord> records;
        const char* req = owner.empty()
            ? "SELECT " TRADE_FIELDS " FROM " TRADES_NAME " ORDER BY createTime, owner;"
            : "SELECT " TRADE_FIELDS " FROM " TRADES_NAME " WHERE owner=?1 ORDER BY createTime;";
        Statement stm(_db, req);
        if (!owner.empty())
        {
            stm.bind(1, owner);
        }
        while (stm.step())
        {
            auto& record = records.emplace_back();
            int colIdx = 0;
            ENUM_ALL_TRADE_FIELDS(STM_GET_LIST, NOSEP, record);
        }
        return records;
    }

    vector<Trade::Ptr> TradeDB::loadActiveTrades(const PeerID& owner, IKeyService::Ptr keyService, ITradeTxService::Ptr txService) const
    {
        vector<Trade::Ptr> trades;
        for (const auto& record : getTrades(owner))
        {
            if (record.m_Phase == TradePhase::Completed || record.m_Phase == TradePhase::Canceled)
            {
                continue;
            }
            auto trade = restoreTrade(record, keyService, txService);
            if (!trade->IsTerminal())
            {
                trades.push_back(trade);
            }
        }
        return trades;
    }

    bool TradeDB::deleteTrade(const PeerID& owner, const TradeID& id)
    {
        Transaction transaction(_db);
        int deleted = 0;
        {
            const char* req = "DELETE FROM " TRADES_NAME " WHERE owner=?1 AND id=?2;";
            Statement stm(_db, req);
            stm.bind(1, owner);
            stm.bind(2, id);
            stm.step();
            deleted = stm.changes();
        }
        {
            const char* req = "DELETE FROM " TRADE_PARAMS_NAME " WHERE owner=?1 AND tradeID=?2;";
            Statement stm(_db, req);
            stm.bind(1, owner);
            stm.bind(2, id);
            stm.step();
        }
        transaction.commit();
        return deleted > 0;
    }
}
