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

#include "trade/core/sequencer.h"

namespace settle::trade
{
    StepSequencer::Steps CreateBuyerSteps();
    StepSequencer::Steps CreateSellerSteps();
    // run by a buyer or seller once the trade is Disputed
    StepSequencer::Steps CreateDisputeSteps();
    StepSequencer::Steps CreateArbitratorSteps(IDisputeResolver::Ptr resolver);

    // index of ProcessDisputeResult in the dispute sequence, entry point for a ruling nobody asked for
    constexpr uint32_t kDisputeResultStep = 1;

    StepSequencer::Steps CreateSteps(TradeRole role, SequenceKind kind, const IDisputeResolver::Ptr& resolver);

    //
    // Awards a fixed amount to the buyer and the remainder to the seller.
    // Without an amount the cooperative split is awarded
    //
    class FixedAwardResolver : public IDisputeResolver
    {
    public:
        explicit FixedAwardResolver(boost::optional<Amount> buyerAward = boost::none);
        Award Resolve(const Trade& trade, const TradeContext& context) override;
    private:
        boost::optional<Amount> m_BuyerAward;
    };
}
