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

#include "common.h"
#include "utility/helpers.h"

using namespace std;

namespace settle::trade
{
    string to_string(TradeRole role)
    {
        switch (role)
        {
        case TradeRole::Buyer: return "Buyer";
        case TradeRole::Seller: return "Seller";
        case TradeRole::Arbitrator: return "Arbitrator";
        }
        return "Unknown";
    }

    string to_string(TradePhase phase)
    {
        switch (phase)
        {
        case TradePhase::Negotiated: return "Negotiated";
        case TradePhase::DepositPublished: return "DepositPublished";
        case TradePhase::DepositConfirmed: return "DepositConfirmed";
        case TradePhase::PayoutSigned: return "PayoutSigned";
        case TradePhase::PayoutPublished: return "PayoutPublished";
        case TradePhase::Completed: return "Completed";
        case TradePhase::Error: return "Error";
        case TradePhase::Disputed: return "Disputed";
        case TradePhase::Canceled: return "Canceled";
        }
        return "Unknown";
    }

    string to_string(AddressPurpose purpose)
    {
        switch (purpose)
        {
        case AddressPurpose::MultiSig: return "MultiSig";
        case AddressPurpose::Payout: return "Payout";
        }
        return "Unknown";
    }

    string to_string(const TxID& id)
    {
        return to_hex(id.data(), id.size());
    }

    string to_string(TradeParameterID id)
    {
        switch (id)
        {
#define MACRO(name, index, type) case TradeParameterID::name: return #name;
            SETTLE_TRADE_PARAMETERS_MAP(MACRO)
#undef MACRO
        }
        return "Unknown";
    }

    ostream& operator<<(ostream& os, TradeRole role)
    {
        return os << to_string(role);
    }

    ostream& operator<<(ostream& os, TradePhase phase)
    {
        return os << to_string(phase);
    }

    ostream& operator<<(ostream& os, AddressPurpose purpose)
    {
        return os << to_string(purpose);
    }

    boost::optional<TradeRole> RoleFromString(const string& s)
    {
        for (auto role : { TradeRole::Buyer, TradeRole::Seller, TradeRole::Arbitrator })
        {
            if (to_string(role) == s)
            {
                return role;
            }
        }
        return boost::none;
    }

    boost::optional<TradeRole> GetCounterpartRole(TradeRole role)
    {
        switch (role)
        {
        case TradeRole::Buyer: return TradeRole::Seller;
        case TradeRole::Seller: return TradeRole::Buyer;
        default: return boost::none;
        }
    }

    string GetFailureMessage(TradeFailureReason reason)
    {
        switch (reason)
        {
#define MACRO(name, code, message) case name: return message;
            SETTLE_TRADE_FAILURE_REASON_MAP(MACRO)
#undef MACRO
        }
        return "Unknown reason";
    }

    TradeFailedException::TradeFailedException(TradeFailureReason reason, const std::string& message)
        : runtime_error(message.empty() ? GetFailureMessage(reason) : message)
        , m_Reason(reason)
    {
    }

    TradeFailureReason TradeFailedException::GetReason() const
    {
        return m_Reason;
    }

    KeyPair::~KeyPair()
    {
        if (!m_Secret.empty())
        {
            SecureErase(m_Secret.data(), m_Secret.size());
        }
    }

    const PubKey& MultiSigKeySet::Get(TradeRole role) const
    {
        switch (role)
        {
        case TradeRole::Buyer: return m_Buyer;
        case TradeRole::Seller: return m_Seller;
        default: return m_Arbitrator;
        }
    }

    bool MultiSigKeySet::Contains(const PubKey& key) const
    {
        return !key.empty() && (key == m_Buyer || key == m_Seller || key == m_Arbitrator);
    }

    Amount GetEscrowAmount(Amount amount, Amount buyerDeposit, Amount sellerDeposit)
    {
        Amount deposits = 0;
        Amount total = 0;
        if (!AddAmounts(buyerDeposit, sellerDeposit, deposits) || !AddAmounts(amount, deposits, total))
        {
            throw TradeFailedException(TradeFailureReason::TransactionConstructionFailure, "escrow amount overflow");
        }
        return total;
    }

    TradeParameterID GetMultiSigKeyParameter(TradeRole role)
    {
        switch (role)
        {
        case TradeRole::Buyer: return TradeParameterID::BuyerMultiSigKey;
        case TradeRole::Seller: return TradeParameterID::SellerMultiSigKey;
        default: return TradeParameterID::ArbitratorMultiSigKey;
        }
    }

    TradeParameterID GetPayoutAddressParameter(TradeRole role)
    {
        if (role == TradeRole::Arbitrator)
        {
            throw TradeFailedException(TradeFailureReason::ProgrammingInvariantViolation, "arbitrator has no payout address");
        }
        return role == TradeRole::Buyer ? TradeParameterID::BuyerPayoutAddress : TradeParameterID::SellerPayoutAddress;
    }

    TradeParameterID GetPayoutSignatureParameter(TradeRole role)
    {
        switch (role)
        {
        case TradeRole::Buyer: return TradeParameterID::BuyerPayoutSignature;
        case TradeRole::Seller: return TradeParameterID::SellerPayoutSignature;
        default: return TradeParameterID::ArbitratorPayoutSignature;
        }
    }
}
