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
#include "errorhandling.h"
#include <memory>
#include <functional>

namespace settle { namespace io {

class Reactor : public std::enable_shared_from_this<Reactor> {
public:
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    using Ptr = std::shared_ptr<Reactor>;

    /// Creates a new reactor. Throws on errors
    static Ptr create();

    /// Performs shutdown and cleanup.
    virtual ~Reactor();

    /// Runs the reactor. This function blocks.
    using StopCallback = std::function<void()>;
    void run_ex(StopCallback&& scb);
    void run();

    /// Stops the running reactor.
    /// NOTE: Called from another thread.
    void stop();

    class Scope
    {
        Reactor* m_pPrev;
    public:
        Scope(Reactor&);
        ~Scope();
    };

    static Reactor& get_Current();
    uv_loop_t& get_UvLoop() { return _loop; }

    /// Stops the reactor on SIGINT, SIGTERM and SIGHUP
    class GracefulIntHandler
    {
        static Reactor* s_pAppReactor;

        void SetHandler(bool);
        static void Handler(int sig);

    public:
        GracefulIntHandler(Reactor&);
        ~GracefulIntHandler();
    };

private:
    /// Ctor. private and called by create()
    Reactor();

    /// Pollable objects' base
    struct Object {
        Object() = default;
        Object(const Object&) = delete;
        Object& operator=(const Object&) = delete;

        virtual ~Object() {
            async_close();
        }

        void async_close() {
            if (_handle) {
                _handle->data = 0;
                if (_reactor) {
                    _reactor->async_close(_handle);
                    _reactor.reset();
                }
            }
        }

        Reactor::Ptr _reactor;
        uv_handle_t* _handle = nullptr;
    };

    ErrorCode init_asyncevent(Object* o, uv_async_cb cb);

    ErrorCode init_timer(Object* o);
    ErrorCode start_timer(Object* o, unsigned intervalMsec, bool isPeriodic, uv_timer_cb cb);
    void cancel_timer(Object* o);

    ErrorCode init_object(ErrorCode errorCode, Object* o, uv_handle_t* h);
    void async_close(uv_handle_t*& handle);

    union Handles {
        uv_timer_t timer;
        uv_async_t async;
    };

    uv_loop_t _loop;
    uv_async_t _stopEvent;
    StopCallback _stopCB;

    friend class AsyncEvent;
    friend class Timer;
};

}} //namespaces
