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

#include "options.h"
#include "utility/common.h"
#include <fstream>

using namespace std;

namespace settle
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_PATH = "log_path";
        const char* DB_PATH = "db_path";
        const char* SEED = "seed";
        const char* COMMAND = "command";
        const char* TRADE_ID = "trade_id";
        const char* AMOUNT = "amount";
        const char* AMOUNT_FULL = "amount,a";
        const char* BUYER_DEPOSIT = "buyer_deposit";
        const char* SELLER_DEPOSIT = "seller_deposit";
        const char* AWARD = "award";
        const char* PEER_TIMEOUT = "peer_timeout";
        const char* CONFIRMATION_DELAY = "confirmation_delay";
        const char* SIMULATE = "simulate";
        const char* LIST = "list";
        const char* CANCEL = "cancel";
        const char* DISPUTE = "dispute";
    }

    pair<po::options_description, po::options_description> createOptionsDescription(int flags)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list of all options")
            (cli::LOG_LEVEL, po::value<string>(), "log level [error|warning|info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "file log level [error|warning|info|debug|verbose]")
            (cli::LOG_PATH, po::value<string>()->default_value("./logs"), "directory for log files")
            (cli::VERSION_FULL, "return project version");

        po::options_description node_options("Node options");
        node_options.add_options()
            (cli::DB_PATH, po::value<string>()->default_value("trades.db"), "path to trade database")
            (cli::SEED, po::value<string>(), "hex encoded key service seed")
            (cli::COMMAND, po::value<string>(), "command to execute [simulate|list|cancel|dispute]")
            (cli::TRADE_ID, po::value<string>()->default_value(""), "trade id for cancel and dispute commands");

        po::options_description trade_options("Trade options");
        trade_options.add_options()
            (cli::AMOUNT_FULL, po::value<Amount>()->default_value(100), "trade amount")
            (cli::BUYER_DEPOSIT, po::value<Amount>()->default_value(15), "buyer security deposit")
            (cli::SELLER_DEPOSIT, po::value<Amount>()->default_value(15), "seller security deposit")
            (cli::AWARD, po::value<Amount>(), "force a dispute, the arbitrator awards this amount to the buyer");

#define THE_MACRO(type, name, def, comment) (#name, po::value<type>()->default_value(def), comment)

        po::options_description protocol_options("Protocol configuration");
        protocol_options.add_options() SETTLE_PROTOCOL_PARAMS(THE_MACRO);

#undef THE_MACRO

        po::options_description options{ "Allowed options" };
        po::options_description visible_options{ "Allowed options" };
        if (flags & GENERAL_OPTIONS)
        {
            options.add(general_options);
            visible_options.add(general_options);
        }
        if (flags & NODE_OPTIONS)
        {
            options.add(node_options);
            visible_options.add(node_options);
        }
        if (flags & TRADE_OPTIONS)
        {
            options.add(trade_options);
            visible_options.add(trade_options);
        }

        options.add(protocol_options);
        visible_options.add(protocol_options);
        return { options, visible_options };
    }

    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options, bool positionalCommand)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        po::command_line_parser parser(argc, argv);
        parser.options(options);
        if (positionalCommand)
        {
            positional.add(cli::COMMAND, 1);
            parser.positional(positional);
        }
        po::store(parser.run(), vm); // value stored first is preferred

        {
            std::ifstream cfg(configFile);

            if (cfg)
            {
                po::store(po::parse_config_file(cfg, options), vm);
            }
        }

        po::notify(vm);
        return vm;
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        if (vm.count(dstLog))
        {
            return loglevel_from_string(vm[dstLog].as<string>(), defaultValue);
        }

        return defaultValue;
    }

    ProtocolParams getProtocolParams(const po::variables_map& vm)
    {
        ProtocolParams params;

#define THE_MACRO(type, name, def, comment) if (vm.count(#name)) params.name = vm[#name].as<type>();
        SETTLE_PROTOCOL_PARAMS(THE_MACRO)
#undef THE_MACRO

        return params;
    }
}
