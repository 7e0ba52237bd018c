// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/types.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace hybrid::consensus {

struct timeout_info {
  std::chrono::system_clock::duration duration_;
  int64_t height;
  int32_t round;
  round_step_type step;
};

using timeout_info_ptr = std::shared_ptr<timeout_info>;

/**
 * Schedules a single pending timeout at a time.
 * A timeout for an older height/round/step than the last scheduled one is ignored,
 * and scheduling a newer timeout cancels the pending one.
 * Fired timeouts are delivered to the handler, which must not block.
 * Once stopped, a ticker ignores every timeout scheduled afterwards.
 */
class timeout_ticker {
public:
  using handler_type = std::function<void(timeout_info_ptr)>;

  virtual ~timeout_ticker() = default;

  void set_handler(handler_type h) {
    std::scoped_lock g(mtx);
    handler = std::move(h);
  }

  void schedule_timeout(timeout_info_ptr ti);

  void stop() {
    std::scoped_lock g(mtx);
    stopped = true;
    cancel_timer();
  }

protected:
  /// \brief arms the underlying timer; called with mtx held
  virtual void reset_timer(timeout_info_ptr ti) = 0;

  /// \brief drops the pending timeout; called with mtx held
  virtual void cancel_timer() = 0;

  std::mutex mtx;
  handler_type handler;
  timeout_info_ptr old_ti;
  bool stopped{false};
};

/// \brief ticker driven by a steady_timer
class asio_timeout_ticker : public timeout_ticker {
public:
  explicit asio_timeout_ticker(boost::asio::any_io_executor ex): timer(std::move(ex)) {}

protected:
  void reset_timer(timeout_info_ptr ti) override;
  void cancel_timer() override;

private:
  boost::asio::steady_timer timer;
};

/// \brief simulated time shared by manual tickers
struct manual_clock {
  std::chrono::system_clock::duration now{};
};

/// \brief ticker which fires only when told to, against a manual clock
class manual_timeout_ticker : public timeout_ticker {
public:
  explicit manual_timeout_ticker(std::shared_ptr<manual_clock> clock = std::make_shared<manual_clock>())
    : clock(std::move(clock)) {}

  /// \brief time at which the pending timeout is due
  std::optional<std::chrono::system_clock::duration> deadline();

  /// \brief pending timeout, if any
  timeout_info_ptr pending();

  /// \brief moves the clock to the pending deadline and fires it
  /// \return false if nothing was pending
  bool fire_next();

  /// \brief moves the clock forward, firing the pending timeout if it becomes due
  void advance(std::chrono::system_clock::duration d);

protected:
  void reset_timer(timeout_info_ptr ti) override;
  void cancel_timer() override;

private:
  void fire(std::unique_lock<std::mutex>& g);

  std::shared_ptr<manual_clock> clock;
  timeout_info_ptr pending_;
  std::chrono::system_clock::duration deadline_{};
};

} // namespace hybrid::consensus
