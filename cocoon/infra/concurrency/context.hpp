// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace cocoon::concurrency {

//! Asynchronous scheduler running an execution loop.
class Context {
  public:
    explicit Context(size_t context_id);
    virtual ~Context() = default;

    boost::asio::io_context* ioc() const noexcept { return ioc_.get(); }
    size_t id() const noexcept { return context_id_; }

    //! Execute the scheduler loop until stopped.
    virtual void execute_loop();

    //! Stop the execution loop.
    void stop();

    std::string to_string() const;

  protected:
    //! The unique scheduler identifier.
    size_t context_id_;

    //! The asio asynchronous event loop scheduler.
    std::shared_ptr<boost::asio::io_context> ioc_;

    //! The work-tracking executor that keep the asio scheduler running.
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
};

std::ostream& operator<<(std::ostream& out, const Context& c);

//! A \ref Context running its loop on one dedicated named thread.
//! Handlers posted to the context are executed one at a time, in posting order.
class SingleThreadContext : public Context {
    using ExceptionHandler = std::function<void(std::exception_ptr)>;

  public:
    SingleThreadContext(size_t context_id, std::string thread_name);
    ~SingleThreadContext() override;

    SingleThreadContext(const SingleThreadContext&) = delete;
    SingleThreadContext& operator=(const SingleThreadContext&) = delete;

    //! Start the execution thread.
    void start();

    //! Stop the loop and wait for termination of the execution thread.
    void stop_and_join();

    bool is_running_in_this_thread() const noexcept { return std::this_thread::get_id() == thread_.get_id(); }

    void set_exception_handler(ExceptionHandler exception_handler) {
        exception_handler_ = std::move(exception_handler);
    }

  private:
    static void termination_handler(std::exception_ptr) {
        std::terminate();
    }

    std::string thread_name_;
    std::thread thread_;

    //! Exception handler invoked on execution loop abnormal termination
    ExceptionHandler exception_handler_{termination_handler};
};

}  // namespace cocoon::concurrency
