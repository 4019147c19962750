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

#include <boost/program_options.hpp>
#include "logger.h"

namespace settle
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_PATH;
        extern const char* DB_PATH;
        extern const char* SEED;
        extern const char* COMMAND;
        extern const char* TRADE_ID;
        extern const char* AMOUNT;
        extern const char* AMOUNT_FULL;
        extern const char* BUYER_DEPOSIT;
        extern const char* SELLER_DEPOSIT;
        extern const char* AWARD;
        extern const char* PEER_TIMEOUT;
        extern const char* CONFIRMATION_DELAY;
        // commands
        extern const char* SIMULATE;
        extern const char* LIST;
        extern const char* CANCEL;
        extern const char* DISPUTE;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS  = 1 << 0,
        NODE_OPTIONS     = 1 << 1,
        TRADE_OPTIONS    = 1 << 2,

        ALL_OPTIONS      = GENERAL_OPTIONS | NODE_OPTIONS | TRADE_OPTIONS
    };

    // protocol timing, overridable from the command line and the config file
#define SETTLE_PROTOCOL_PARAMS(macro) \
    macro(uint32_t, peer_timeout, 30000, "peer response timeout [msec]") \
    macro(uint32_t, confirmation_delay, 1000, "simulated fund lock confirmation delay [msec]")

    struct ProtocolParams
    {
#define THE_MACRO(type, name, def, comment) type name = def;
        SETTLE_PROTOCOL_PARAMS(THE_MACRO)
#undef THE_MACRO
    };

    // returns {all options, options visible in help}
    std::pair<po::options_description, po::options_description> createOptionsDescription(int flags = ALL_OPTIONS);

    // command line takes priority over the config file, a missing config file is not an error
    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options, bool positionalCommand = true);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_DEBUG);

    ProtocolParams getProtocolParams(const po::variables_map& vm);
}
