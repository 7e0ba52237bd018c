// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/thread/thread_name.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <exception>
#include <functional>
#include <optional>
#include <string>

namespace hybrid::thread {

/// \brief runs an io_context on a pool of named threads
///
/// Threads are named `<prefix>-<n>` so they can be told apart in logs and tools like htop.
/// An exception escaping a handler is passed to \p on_except and ends the thread that ran it.
class named_thread_pool {
public:
  using on_except_t = std::function<void(const std::exception&)>;

  named_thread_pool(std::string name_prefix, size_t num_threads, on_except_t on_except = {})
    : thread_pool_(num_threads), ioc_(num_threads) {
    ioc_work_.emplace(boost::asio::make_work_guard(ioc_));
    for (size_t i = 0; i < num_threads; ++i) {
      boost::asio::post(thread_pool_, [&ioc = ioc_, name_prefix, i, on_except]() {
        set_thread_name(name_prefix + "-" + std::to_string(i));
        try {
          ioc.run();
        } catch (const std::exception& e) {
          if (!on_except)
            throw;
          on_except(e);
        }
      });
    }
  }

  ~named_thread_pool() {
    stop();
  }

  boost::asio::io_context& get_executor() {
    return ioc_;
  }

  /// \brief releases work guard, stops io_context and joins all threads
  void stop() {
    ioc_work_.reset();
    ioc_.stop();
    thread_pool_.join();
  }

private:
  using ioc_work_t = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::thread_pool thread_pool_;
  boost::asio::io_context ioc_;
  std::optional<ioc_work_t> ioc_work_;
};

} // namespace hybrid::thread
