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

#include "reactor.h"
#include "utility/helpers.h"
#include <assert.h>
#include <string.h>
#include <signal.h>

#ifndef LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE_ENABLED 0
#endif
#include "utility/logger.h"

namespace settle { namespace io {

Reactor::Ptr Reactor::create() {
    struct make_shared_enabler : public Reactor {};
    return std::make_shared<make_shared_enabler>();
}

Reactor::Reactor() {
    memset(&_loop,0,sizeof(uv_loop_t));
    memset(&_stopEvent, 0, sizeof(uv_async_t));

    auto errorCode = (ErrorCode)uv_loop_init(&_loop);
    if (errorCode != 0) {
        LOG_ERROR() << "cannot initialize uv loop, error=" << errorCode;
        IO_EXCEPTION(errorCode);
    }

    _loop.data = this;

    errorCode = (ErrorCode)uv_async_init(&_loop, &_stopEvent, [](uv_async_t* handle) {
        auto reactor = reinterpret_cast<Reactor*>(handle->data);
        assert(reactor);
        if (reactor && reactor->_stopCB) {
            reactor->_stopCB();
        }
        uv_stop(handle->loop);
    });

    if (errorCode != 0) {
        uv_loop_close(&_loop);
        LOG_ERROR() << "cannot initialize loop stop event, error=" << errorCode;
        IO_EXCEPTION(errorCode);
    }

    _stopEvent.data = this;
}

Reactor::~Reactor() {
    LOG_VERBOSE() << __FUNCTION__;

    if (!_loop.data) {
        return;
    }

    if (_stopEvent.data)
        uv_close((uv_handle_t*)&_stopEvent, 0);

    // run one cycle to release all closing handles
    uv_run(&_loop, UV_RUN_NOWAIT);

    if (uv_loop_close(&_loop) == UV_EBUSY) {
        LOG_DEBUG() << "closing unclosed handles";
        uv_walk(
            &_loop,
            [](uv_handle_t* handle, void*) {
                if (!uv_is_closing(handle)) {
                    handle->data = 0;
                    uv_close(handle, 0);
                }
            },
            0
        );

        // once more
        uv_run(&_loop, UV_RUN_NOWAIT);
        uv_loop_close(&_loop);
    }
}

void Reactor::run_ex(StopCallback&& scb) {
    _stopCB = std::move(scb);
    run();
}

void Reactor::run() {
    if (!_loop.data) {
        LOG_DEBUG() << "loop wasn't initialized";
        return;
    }
    block_sigpipe();
    // NOTE: blocks
    uv_run(&_loop, UV_RUN_DEFAULT);
}

void Reactor::stop() {
    int errorCode = uv_async_send(&_stopEvent);
    if (errorCode != 0) {
        LOG_DEBUG() << "cannot post stop signal to event loop";
    }
}

ErrorCode Reactor::init_object(ErrorCode errorCode, Reactor::Object* o, uv_handle_t* h) {
    if (errorCode != 0) {
        delete reinterpret_cast<Handles*>(h);
        return errorCode;
    }
    h->data = o;
    o->_reactor = shared_from_this();
    o->_handle = h;
    return EC_OK;
}

ErrorCode Reactor::init_asyncevent(Reactor::Object* o, uv_async_cb cb) {
    assert(o);
    assert(cb);

    uv_handle_t* h = reinterpret_cast<uv_handle_t*>(new Handles);
    ErrorCode errorCode = (ErrorCode)uv_async_init(
        &_loop,
        (uv_async_t*)h,
        cb
    );
    return init_object(errorCode, o, h);
}

ErrorCode Reactor::init_timer(Reactor::Object* o) {
    assert(o);

    uv_handle_t* h = reinterpret_cast<uv_handle_t*>(new Handles);
    ErrorCode errorCode = (ErrorCode)uv_timer_init(&_loop, (uv_timer_t*)h);
    return init_object(errorCode, o, h);
}

ErrorCode Reactor::start_timer(Reactor::Object* o, unsigned intervalMsec, bool isPeriodic, uv_timer_cb cb) {
    assert(o);
    assert(cb);
    assert(o->_handle && o->_handle->type == UV_TIMER);

    return (ErrorCode)uv_timer_start(
        (uv_timer_t*)o->_handle,
        cb,
        intervalMsec,
        isPeriodic ? intervalMsec : 0
    );
}

void Reactor::cancel_timer(Object* o) {
    assert(o);

    uv_handle_t* h = o->_handle;
    if (h) {
        assert(h->type == UV_TIMER);
        if (uv_is_active(h)) {
            if (uv_timer_stop((uv_timer_t*)h) != 0) {
                LOG_DEBUG() << "cannot stop timer";
            }
        }
    }
}

void Reactor::async_close(uv_handle_t*& handle) {
    LOG_VERBOSE() << "async_close " << TRACE(handle);

    if (!handle) return;
    handle->data = 0;

    if (!uv_is_closing(handle)) {
        uv_close(
            handle,
            [](uv_handle_s* handle) {
                delete reinterpret_cast<Handles*>(handle);
            }
        );
    }

    handle = 0;
}

static thread_local Reactor* s_pReactor = NULL;

Reactor::Scope::Scope(Reactor& r)
{
    m_pPrev = s_pReactor;
    s_pReactor = &r;
}

Reactor::Scope::~Scope()
{
    s_pReactor = m_pPrev;
}

Reactor& Reactor::get_Current()
{
    if (!s_pReactor) {
        IO_EXCEPTION(EC_HANDLE_CLOSED);
    }
    return *s_pReactor;
}

Reactor* Reactor::GracefulIntHandler::s_pAppReactor = NULL;

Reactor::GracefulIntHandler::GracefulIntHandler(Reactor& r)
{
    assert(!s_pAppReactor);
    s_pAppReactor = &r;
    SetHandler(true);
}

Reactor::GracefulIntHandler::~GracefulIntHandler()
{
    SetHandler(false);
    s_pAppReactor = NULL;
}

void Reactor::GracefulIntHandler::SetHandler(bool bSet)
{
    struct sigaction sa;

    sa.sa_handler = bSet ? Handler : SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);
    sigaction(SIGHUP, &sa, NULL);
}

void Reactor::GracefulIntHandler::Handler(int sig)
{
    if (s_pAppReactor) {
        s_pAppReactor->stop();
    }
}

}} //namespaces
