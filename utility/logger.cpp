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

#include "logger.h"
#include "helpers.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <stdexcept>
#include <string.h>
#include <mutex>
#include <algorithm>
#include <map>

namespace settle {

using namespace std;

Logger* Logger::g_logger = 0;

int loglevel_from_string(const std::string& level, int defValue) {
    static const map<string, int> logLevels {
        { "verbose", LOG_LEVEL_VERBOSE },
        { "debug", LOG_LEVEL_DEBUG },
        { "info", LOG_LEVEL_INFO },
        { "warning", LOG_LEVEL_WARNING },
        { "error", LOG_LEVEL_ERROR }
    };
    auto it = logLevels.find(level);
    return it == logLevels.end() ? defValue : it->second;
}

namespace {

// One output stream with its own threshold
class Sink {
public:
    Sink(FILE* f, int minLevel, bool owned) :
        _file(f), _minLevel(minLevel), _owned(owned)
    {}

    Sink(const Sink&) = delete;
    Sink& operator=(const Sink&) = delete;

    ~Sink() {
        if (_owned && _file) fclose(_file);
    }

    bool accepts(int level) const {
        return _file && _minLevel != LOG_SINK_DISABLED && level >= _minLevel;
    }

    void write(int level, int flushLevel, const char* header, size_t headerSize, const char* msg, size_t size) {
        fwrite(header, 1, headerSize, _file);
        fwrite(msg, 1, size, _file);
        if (level >= flushLevel) fflush(_file);
    }

private:
    FILE* _file;
    int _minLevel;
    bool _owned;
};

std::string open_log_file(const string& fileNamePrefix, const string& dstPath, FILE*& file) {
    string fileName(fileNamePrefix);
    fileName += format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false);
    fileName += ".log";

    boost::filesystem::path path{ fileName };
    if (!dstPath.empty()) {
        boost::filesystem::path dir{ dstPath };
        if (!boost::filesystem::exists(dir)) {
            boost::filesystem::create_directories(dir);
        }
        path = dir / fileName;
    }

    file = fopen(path.string().c_str(), "ab");
    if (!file) throw runtime_error(string("cannot open file ") + path.string());
    return path.string();
}

class LoggerImpl : public Logger {
public:
    LoggerImpl(int flushLevel, int consoleLevel, int fileLevel, const string& fileNamePrefix, const string& dstPath) :
        _flushLevel(flushLevel),
        _headerFormatter(def_header_formatter),
        _timeFormat("%Y-%m-%d.%T"),
        _printMilliseconds(true)
    {
        if (consoleLevel > 0) {
            _console = make_unique<Sink>(stdout, consoleLevel, false);
        }
        if (fileLevel > 0) {
            FILE* f = nullptr;
            _fileName = open_log_file(fileNamePrefix, dstPath, f);
            _file = make_unique<Sink>(f, fileLevel, true);
        }
        if (!_console && !_file) {
            throw runtime_error("no logger sink configured");
        }
    }

    ~LoggerImpl() override {
        if (this == g_logger) {
            g_logger = 0;
        }
    }

    void set_header_formatter(LogMessageHeaderFormatter formatter) override {
        if (formatter) _headerFormatter = formatter;
    }

    void set_time_format(const char* format, bool printMilliseconds) override {
        if (format) {
            _timeFormat = format;
            _printMilliseconds = printMilliseconds;
        } else {
            _timeFormat.clear();
            _printMilliseconds = false;
        }
    }

    const std::string& get_current_file_name() const override {
        return _fileName;
    }

protected:
    bool level_accepted(int level) const override {
        return (_console && _console->accepts(level)) || (_file && _file->accepts(level));
    }

    void write_message(const LogMessageHeader& header, const char* buf, size_t size) override {
        static const size_t MAX_HEADER_SIZE = 256;
        static const size_t MAX_TIMESTAMP_SIZE = 80;

        char timestampFormatted[MAX_TIMESTAMP_SIZE];
        char headerFormatted[MAX_HEADER_SIZE];
        if (!_timeFormat.empty()) {
            format_timestamp(timestampFormatted, MAX_TIMESTAMP_SIZE, _timeFormat.c_str(), header.timestamp, _printMilliseconds);
        } else {
            timestampFormatted[0] = 0;
        }
        size_t headerSize = std::min(MAX_HEADER_SIZE - 1, _headerFormatter(headerFormatted, MAX_HEADER_SIZE, timestampFormatted, header));

        lock_guard<mutex> lock(_mutex);
        if (_console && _console->accepts(header.level)) {
            _console->write(header.level, _flushLevel, headerFormatted, headerSize, buf, size);
        }
        if (_file && _file->accepts(header.level)) {
            _file->write(header.level, _flushLevel, headerFormatted, headerSize, buf, size);
        }
    }

private:
    mutex _mutex;
    int _flushLevel;
    LogMessageHeaderFormatter _headerFormatter;
    std::string _timeFormat;
    bool _printMilliseconds;
    std::unique_ptr<Sink> _console;
    std::unique_ptr<Sink> _file;
    std::string _fileName;
};

static constexpr size_t MAX_MSG_SIZE = 10000;

struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;
    bool in_use = false;

    LogThreadContext() :
        formatter(std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer)))
    {}

    void reset() {
        msgBuffer = std::string();
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext* get_context() {
    static thread_local LogThreadContext ctx;
    return &ctx;
}

} //namespace

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& fileNamePrefix,
    const std::string& dstPath
) {
    if (g_logger) {
        throw runtime_error("logger already initialized");
    }

    auto logger = std::make_shared<LoggerImpl>(flushLevel, consoleLevel, fileLevel, fileNamePrefix, dstPath);
    g_logger = logger.get();
    return logger;
}

LogMessageHeader::LogMessageHeader(int _level, const char* _file, int _line, const char* _func) :
    timestamp(local_timestamp_msec()),
    func(_func),
    file(_file),
    line(_line),
    level(_level)
{
    if (!func) func = "";
    if (!file) {
        file = "";
    } else {
#ifdef PROJECT_SOURCE_DIR
        static const size_t offset = strlen(PROJECT_SOURCE_DIR)+1;
#else
        static const size_t offset = 0;
#endif
        if (strlen(file) > offset) file += offset;
    }
}

LogMessage::LogMessage(int _level, const char* _file, int _line, const char* _func) :
    header(_level, _file, _line, _func)
{
    init_formatter();
}

void LogMessage::init_formatter() {
    LogThreadContext* ctx = get_context();
    assert(!ctx->in_use);

    ctx->in_use = true;

    if (ctx->msgBuffer.capacity() < MAX_MSG_SIZE) {
        ctx->msgBuffer.reserve(MAX_MSG_SIZE);
    }

    _formatter = ctx->formatter.get();
}

LogMessage::~LogMessage() {
    LogThreadContext* ctx = get_context();
    if (Logger::g_logger && _formatter) {
        *_formatter << '\n';
        _formatter->flush();
        Logger::g_logger->write_message(header, ctx->msgBuffer.data(), ctx->msgBuffer.size());
    }
    if (ctx->msgBuffer.size() > MAX_MSG_SIZE) {
        ctx->reset();
    }
    else {
        ctx->msgBuffer.clear();
    }
    ctx->in_use = false;
}

} //namespace
