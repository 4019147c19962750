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
#include <uv.h>
#include <stdexcept>
#include <string>

namespace settle { namespace io {

enum ErrorCode {
    EC_OK = 0,
    EC_HANDLE_CLOSED = UV_ERRNO_MAX - 1,
#define XX(code, _) EC_ ## code = UV_ ## code,
    UV_ERRNO_MAP(XX)
#undef XX
};

const char* error_str(ErrorCode errorCode);

const char* error_descr(ErrorCode errorCode);

std::string format_io_error(const char* _function, const char* _file, int _line, ErrorCode _code);

struct Exception : public std::runtime_error {
#ifdef SHOW_CODE_LOCATION
    std::string function;
    std::string file;
    int line;
#endif
    ErrorCode errorCode;

    Exception(const char* _function, const char* _file, int _line, ErrorCode _code) :
        std::runtime_error(format_io_error(_function,_file,_line,_code)),
#ifdef SHOW_CODE_LOCATION
        function(_function),
        file(_file),
        line(_line),
#endif
        errorCode(_code)
    {}
};

#define IO_EXCEPTION(Code) throw settle::io::Exception(__FUNCTION__, __FILE__, __LINE__, Code)
#define IO_EXCEPTION_IF(Code) if (Code != 0) throw settle::io::Exception(__FUNCTION__, __FILE__, __LINE__, Code)

}} //namespaces
