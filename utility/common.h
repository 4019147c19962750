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

#include <vector>
#include <array>
#include <map>
#include <utility>
#include <cstdint>
#include <memory>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

// wipes memory in a way the optimizer can't elide, for secrets
void SecureErase(void* p, size_t n);

namespace settle
{
	typedef uint64_t Timestamp;
	typedef uint64_t Amount;
	typedef std::vector<uint8_t> ByteBuffer;

	Timestamp getTimestamp(); // seconds

	// overflow-checked sum, returns false on overflow
	inline bool AddAmounts(Amount a, Amount b, Amount& res)
	{
		res = a + b;
		return res >= a;
	}
}
