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

#include "messages.h"

namespace settle::trade
{
    std::string to_string(TradeMessageType type)
    {
        switch (type)
        {
        case TradeMessageType::TakeOffer: return "TakeOffer";
        case TradeMessageType::DepositTxPublished: return "DepositTxPublished";
        case TradeMessageType::FundLockConfirmed: return "FundLockConfirmed";
        case TradeMessageType::PayoutSignature: return "PayoutSignature";
        case TradeMessageType::PayoutTxPublished: return "PayoutTxPublished";
        case TradeMessageType::CancelTrade: return "CancelTrade";
        case TradeMessageType::DisputeOpened: return "DisputeOpened";
        case TradeMessageType::DisputeResult: return "DisputeResult";
        }
        return "Unknown";
    }

    std::ostream& operator<<(std::ostream& os, TradeMessageType type)
    {
        return os << to_string(type);
    }
}
