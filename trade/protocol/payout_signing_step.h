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

#include "common_steps.h"

namespace settle::trade
{
    //
    // Signs the cooperative payout of the escrow after the fund lock is confirmed.
    // Runs for buyer and seller, the signature stays in the context until a later step exchanges it
    //
    class PayoutSigningStep : public IProtocolStep
    {
    public:
        const char* GetName() const override { return "PayoutSigning"; }
        StepOutcome Run(StepContext& context) override;
    };
}
