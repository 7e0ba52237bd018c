// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/consensus/timeout_ticker.h>
#include <hybrid/log/log.h>

namespace hybrid::consensus {

void timeout_ticker::schedule_timeout(timeout_info_ptr ti) {
  std::scoped_lock g(mtx);
  if (stopped) {
    return;
  }
  if (old_ti) {
    dlog("received tick: old_ti=[{}/{}/{}], new_ti=[duration={} {}/{}/{}]", old_ti->height, old_ti->round,
      round_step_to_str(old_ti->step), std::chrono::duration_cast<std::chrono::microseconds>(ti->duration_).count(),
      ti->height, ti->round, round_step_to_str(ti->step));

    // ignore tickers for old height/round/step
    if (ti->height < old_ti->height) {
      return;
    } else if (ti->height == old_ti->height) {
      if (ti->round < old_ti->round) {
        return;
      } else if (ti->round == old_ti->round && ti->step <= old_ti->step) {
        return;
      }
    }
  }

  // update timeout_info and reset timer
  old_ti = ti;
  reset_timer(std::move(ti));
}

void asio_timeout_ticker::reset_timer(timeout_info_ptr ti) {
  timer.cancel();
  timer.expires_after(ti->duration_);
  timer.async_wait([h = handler, ti](boost::system::error_code ec) {
    if (ec) {
      // canceled by a newer timeout or by stop()
      return;
    }
    if (h)
      h(ti);
  });
}

void asio_timeout_ticker::cancel_timer() {
  timer.cancel();
}

void manual_timeout_ticker::reset_timer(timeout_info_ptr ti) {
  deadline_ = clock->now + ti->duration_;
  pending_ = std::move(ti);
}

void manual_timeout_ticker::cancel_timer() {
  pending_.reset();
}

std::optional<std::chrono::system_clock::duration> manual_timeout_ticker::deadline() {
  std::scoped_lock g(mtx);
  if (!pending_)
    return {};
  return deadline_;
}

timeout_info_ptr manual_timeout_ticker::pending() {
  std::scoped_lock g(mtx);
  return pending_;
}

bool manual_timeout_ticker::fire_next() {
  std::unique_lock g(mtx);
  if (!pending_)
    return false;
  if (clock->now < deadline_)
    clock->now = deadline_;
  fire(g);
  return true;
}

void manual_timeout_ticker::advance(std::chrono::system_clock::duration d) {
  std::unique_lock g(mtx);
  clock->now += d;
  if (pending_ && deadline_ <= clock->now)
    fire(g);
}

void manual_timeout_ticker::fire(std::unique_lock<std::mutex>& g) {
  auto ti = std::move(pending_);
  pending_.reset();
  auto h = handler;
  g.unlock();
  if (h)
    h(ti);
}

} // namespace hybrid::consensus
