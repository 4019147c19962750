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

#include "common.h"

namespace settle::trade
{
    enum class TradeMessageType : uint8_t
    {
        TakeOffer,
        DepositTxPublished,
        FundLockConfirmed,
        PayoutSignature,
        PayoutTxPublished,
        CancelTrade,
        DisputeOpened,
        DisputeResult
    };

    std::string to_string(TradeMessageType type);
    std::ostream& operator<<(std::ostream& os, TradeMessageType type);

    struct TradeMessage
    {
        TradeID m_TradeID;
        PeerID m_From;
        TradeRole m_SenderRole = TradeRole::Buyer;
        TradeMessageType m_Type = TradeMessageType::TakeOffer;
        PackedTradeParameters m_Parameters;

        TradeMessage() = default;
        TradeMessage(const TradeID& tradeID, TradeRole senderRole, TradeMessageType type)
            : m_TradeID(tradeID)
            , m_SenderRole(senderRole)
            , m_Type(type)
        {
        }

        template <typename T>
        TradeMessage& AddParameter(TradeParameterID paramID, const T& value)
        {
            m_Parameters.emplace_back(paramID, toByteBuffer(value));
            return *this;
        }

        template <typename T>
        bool GetParameter(TradeParameterID paramID, T& value) const
        {
            auto pit = std::find_if(m_Parameters.begin(), m_Parameters.end(), [paramID](const auto& p) { return p.first == paramID; });
            if (pit == m_Parameters.end())
            {
                return false;
            }
            return fromByteBuffer(pit->second, value);
        }

        template <typename T>
        T GetMandatoryParameter(TradeParameterID paramID) const
        {
            T value;
            if (!GetParameter(paramID, value))
            {
                throw TradeFailedException(TradeFailureReason::PeerProtocolFailure,
                    "missing or malformed parameter " + to_string(paramID) + " in " + to_string(m_Type));
            }
            return value;
        }

        SERIALIZE(m_TradeID, m_From, m_SenderRole, m_Type, m_Parameters);
    };
}
