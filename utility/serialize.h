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
#include "serialize_fwd.h"
#include "serialize_streams.h"

#include <yas/binary_iarchive.hpp>
#include <yas/binary_oarchive.hpp>
#include <yas/std_types.hpp>

namespace settle {

constexpr int SERIALIZE_OPTIONS = yas::binary | yas::no_header | yas::elittle | yas::compacted;

/// Serializer to growing buffer
class Serializer {
public:
    Serializer() : _oa(_os) {}

    void reset() {
        _os.clear();
    }

    template <typename T> Serializer& operator&(const T& object) {
        _oa & object;
        return *this;
    }

    const std::vector<uint8_t>& buffer() const { return _os.m_vec; }
    void swap_buf(std::vector<uint8_t>& v) { _os.m_vec.swap(v); }

private:
    using Ostream = detail::SerializeOstream;

    Ostream _os;
    yas::binary_oarchive<Ostream, SERIALIZE_OPTIONS> _oa;
};

/// Deserializer from a buffer the caller keeps alive, throws on underflow
class Deserializer {
public:
    Deserializer() : _ia(_is) {}

    void reset(const void* buf, size_t size) {
        _is.reset(buf, size);
    }

    void reset(const std::vector<uint8_t>& bb) {
        reset(bb.empty() ? nullptr : &bb.front(), bb.size());
    }

    size_t bytes_left() const {
        return _is.bytes_left();
    }

    template <typename T> Deserializer& operator&(T& object) {
        _ia & object;
        return *this;
    }

private:
    using Istream = detail::SerializeIstream;

    Istream _is;
    yas::binary_iarchive<Istream, SERIALIZE_OPTIONS> _ia;
};

} // namespace
