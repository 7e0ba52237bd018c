// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/hex.h>
#include <hybrid/log/log.h>
#include <hybrid/node/tx_queue_application.h>
#include <algorithm>
#include <set>

namespace hybrid::node {

Result<void> tx_queue_application::check_tx(const Bytes& tx) const {
  if (tx.empty()) {
    return Error("empty transaction");
  }
  if (tx.size() > max_tx_bytes) {
    return Error::format("transaction too large: size={} max={}", tx.size(), max_tx_bytes);
  }
  return success();
}

Result<void> tx_queue_application::submit(Bytes tx) {
  if (auto ok = check_tx(tx); !ok) {
    return ok.error();
  }
  std::scoped_lock g(mtx);
  queue.push_back(std::move(tx));
  return success();
}

size_t tx_queue_application::pending() const {
  std::scoped_lock g(mtx);
  return queue.size();
}

std::vector<Bytes> tx_queue_application::create_txs(int64_t height, int64_t max_bytes) {
  std::scoped_lock g(mtx);
  std::vector<Bytes> txs;
  auto bytes = block_overhead_bytes;
  for (const auto& tx : queue) {
    if (txs.size() >= txs_per_block)
      break;
    auto size = static_cast<int64_t>(tx.size()) + tx_overhead_bytes;
    if (bytes + size > max_bytes)
      break;
    bytes += size;
    txs.push_back(tx);
  }
  dlog("created txs: height={} txs={} pending={}", height, txs.size(), queue.size());
  return txs;
}

Result<void> tx_queue_application::validate_block(const consensus::block& b) {
  if (b.txs.size() > txs_per_block) {
    return Error::format("too many transactions: {} > {}", b.txs.size(), txs_per_block);
  }
  for (const auto& tx : b.txs) {
    if (auto ok = check_tx(tx); !ok) {
      return ok.error();
    }
  }
  return success();
}

Result<std::vector<consensus::validator_update>> tx_queue_application::on_commit(
  int64_t height, const Bytes& block_id, const consensus::block& b) {
  committed_block committed_;
  commit_handler handler;
  {
    std::scoped_lock g(mtx);
    if (!blocks.empty() && height == blocks.back().height && block_id == blocks.back().block_id) {
      dlog("block already committed: height={}", height);
      return std::vector<consensus::validator_update>{};
    }
    if (!blocks.empty() && height != blocks.back().height + 1) {
      return Error::format("unexpected commit height: expected {}, got {}", blocks.back().height + 1, height);
    }

    std::set<Bytes> included(b.txs.begin(), b.txs.end());
    std::erase_if(queue, [&](const Bytes& tx) { return included.contains(tx); });

    committed_ = committed_block{height, block_id, b.txs.size()};
    blocks.push_back(committed_);
    while (blocks.size() > max_history)
      blocks.pop_front();
    handler = on_committed;
  }
  ilog("application committed block: height={} hash={} txs={}", height, to_hex(block_id), b.txs.size());
  if (handler)
    handler(committed_);
  return std::vector<consensus::validator_update>{};
}

int64_t tx_queue_application::last_height() const {
  std::scoped_lock g(mtx);
  return blocks.empty() ? 0 : blocks.back().height;
}

std::vector<committed_block> tx_queue_application::committed() const {
  std::scoped_lock g(mtx);
  return {blocks.begin(), blocks.end()};
}

void tx_queue_application::set_commit_handler(commit_handler handler) {
  std::scoped_lock g(mtx);
  on_committed = std::move(handler);
}

} // namespace hybrid::node
