// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "context.hpp"

#include <sstream>
#include <utility>

#include <cocoon/infra/common/log.hpp>

namespace cocoon::concurrency {

std::ostream& operator<<(std::ostream& out, const Context& c) {
    out << c.to_string();
    return out;
}

std::string Context::to_string() const {
    const auto& c = *this;
    std::stringstream out;

    out << "io_context: " << c.ioc() << " id: " << c.id();
    return out.str();
}

Context::Context(size_t context_id)
    : context_id_{context_id},
      ioc_{std::make_shared<boost::asio::io_context>()},
      work_{boost::asio::make_work_guard(*ioc_)} {}

void Context::execute_loop() {
    COCOON_DEBUG << "Context execution loop start [" << std::this_thread::get_id() << "]";
    ioc_->run();
    COCOON_DEBUG << "Context execution loop end [" << std::this_thread::get_id() << "]";
}

void Context::stop() {
    ioc_->stop();
}

SingleThreadContext::SingleThreadContext(size_t context_id, std::string thread_name)
    : Context{context_id}, thread_name_{std::move(thread_name)} {}

SingleThreadContext::~SingleThreadContext() {
    COCOON_TRACE << "SingleThreadContext::~SingleThreadContext START " << this;
    stop_and_join();
    COCOON_TRACE << "SingleThreadContext::~SingleThreadContext END " << this;
}

void SingleThreadContext::start() {
    thread_ = std::thread{[this]() {
        log::set_thread_name(thread_name_.c_str());
        COCOON_TRACE << "Thread start " << *this;
        try {
            execute_loop();
        } catch (const std::exception& ex) {
            COCOON_CRIT << "SingleThreadContext execute_loop exception: " << ex.what();
            exception_handler_(std::make_exception_ptr(ex));
        } catch (...) {
            COCOON_CRIT << "SingleThreadContext execute_loop unexpected exception";
            exception_handler_(std::current_exception());
        }
        COCOON_TRACE << "Thread end " << *this;
    }};
}

void SingleThreadContext::stop_and_join() {
    stop();
    if (!thread_.joinable()) return;
    if (is_running_in_this_thread()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

}  // namespace cocoon::concurrency
