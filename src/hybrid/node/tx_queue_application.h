// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <hybrid/consensus/application.h>
#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>

namespace hybrid::node {

/// bytes reserved in a block for everything but the transactions
constexpr int64_t block_overhead_bytes{128};

/// per-transaction encoding overhead (field tag and length prefix)
constexpr int64_t tx_overhead_bytes{6};

struct committed_block {
  int64_t height;
  Bytes block_id;
  size_t num_txs;
};

/**
 * Application which batches submitted transactions into blocks in arrival order.
 * Transactions stay queued until a block containing them is committed,
 * so transactions of a block that failed to commit are proposed again.
 * Only the most recent committed blocks are remembered.
 */
class tx_queue_application : public consensus::application {
public:
  using commit_handler = std::function<void(const committed_block&)>;

  explicit tx_queue_application(
    size_t txs_per_block = 100, size_t max_tx_bytes = 64 * 1024, size_t max_history = 1000)
    : txs_per_block(txs_per_block), max_tx_bytes(max_tx_bytes), max_history(std::max<size_t>(max_history, 1)) {}

  /// \brief queues a transaction for a later block
  Result<void> submit(Bytes tx);

  size_t pending() const;

  std::vector<Bytes> create_txs(int64_t height, int64_t max_bytes) override;
  Result<void> validate_block(const consensus::block& b) override;
  Result<std::vector<consensus::validator_update>> on_commit(
    int64_t height, const Bytes& block_id, const consensus::block& b) override;

  /// \brief height of the last block handed to on_commit; 0 if none
  int64_t last_height() const;

  /// \brief recently committed blocks, oldest first
  std::vector<committed_block> committed() const;

  /// \brief called after each commit, outside of the application lock
  void set_commit_handler(commit_handler handler);

private:
  Result<void> check_tx(const Bytes& tx) const;

  const size_t txs_per_block;
  const size_t max_tx_bytes;
  const size_t max_history;

  mutable std::mutex mtx;
  std::deque<Bytes> queue;
  std::deque<committed_block> blocks;
  commit_handler on_committed;
};

} // namespace hybrid::node
