// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/check.h>
#include <hybrid/common/defer.h>
#include <hybrid/common/hex.h>
#include <hybrid/consensus/canonical.h>
#include <hybrid/consensus/consensus_state.h>
#include <hybrid/log/log.h>
#include <boost/asio/post.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <utility>

namespace hybrid::consensus {

struct message_handler {
  consensus_state& cs;
  const std::string& peer_id;

  void operator()(const proposal& msg) {
    // will not cause transition unless the proposal completes a step
    cs.set_proposal(msg);
  }

  void operator()(const vote& msg) {
    // if the vote gives us a 2/3-any or 2/3-one, we transition
    cs.add_vote(msg, peer_id);
  }

  void operator()(const commit_request& msg) {
    cs.send_commit(msg.height, peer_id);
  }
};

std::shared_ptr<consensus_state> consensus_state::new_state(const consensus_config& cs_config_, const state& state_,
  boost::asio::any_io_executor ex, std::shared_ptr<signer> priv_validator, std::shared_ptr<application> app_,
  std::shared_ptr<transport> bus, std::shared_ptr<timeout_ticker> ticker_, std::shared_ptr<state_store> store_) {
  check(!state_.is_empty(), "consensus state requires a validator set");
  check(priv_validator && app_ && ticker_, "consensus state requires a signer, an application and a ticker");

  auto cs = std::make_shared<consensus_state>(std::move(ex));
  cs->cs_config = cs_config_;
  cs->signer_ = std::move(priv_validator);
  cs->app = std::move(app_);
  cs->transport_ = std::move(bus);
  cs->ticker = std::move(ticker_);
  cs->store = std::move(store_);
  cs->votes = std::make_unique<vote_store>(state_.chain_id, cs->signer_, cs_config_.max_future_rounds);

  cs->ticker->set_handler([weak = std::weak_ptr<consensus_state>(cs)](timeout_info_ptr ti) {
    if (auto self = weak.lock()) {
      boost::asio::post(self->strand, [self, ti]() { self->tock(ti); });
    }
  });

  cs->update_to_state(state_);

  if (cs->store) {
    auto decided = cs->store->load_decided();
    if (!decided) {
      throw std::runtime_error(fmt::format("unable to load decided block: {}", decided.error().message()));
    }
    if (decided.value() && decided.value()->height == cs->rs.height)
      cs->pending_decided = std::move(decided.value());
  }
  return cs;
}

state consensus_state::get_state() {
  std::scoped_lock g(mtx);
  return local_state;
}

int64_t consensus_state::get_last_height() {
  std::scoped_lock g(mtx);
  return rs.height - 1;
}

round_state consensus_state::get_round_state() {
  std::scoped_lock g(mtx);
  return rs;
}

void consensus_state::set_error_reporter(error_reporter reporter_) {
  std::scoped_lock g(mtx);
  reporter = std::move(reporter_);
}

void consensus_state::on_start() {
  boost::asio::post(strand, [self = shared_from_this()]() {
    std::scoped_lock g(self->mtx);
    ilog("starting consensus: height={} validators={}", self->rs.height, self->rs.validators->size());
    if (self->pending_decided) {
      self->replay_decided_block();
      return;
    }
    self->enter_new_round(self->rs.height, self->rs.round);
  });
}

void consensus_state::on_stop() {
  ticker->stop();
}

void consensus_state::send(msg_info_ptr mi) {
  boost::asio::post(strand, [self = shared_from_this(), mi = std::move(mi)]() { self->receive_routine(mi); });
}

void consensus_state::receive_proposal(const proposal& p, std::string peer_id) {
  send(std::make_shared<msg_info>(msg_info{p, std::move(peer_id)}));
}

void consensus_state::receive_vote(const vote& v, std::string peer_id) {
  send(std::make_shared<msg_info>(msg_info{v, std::move(peer_id)}));
}

void consensus_state::update_round_step(int32_t round, round_step_type step) {
  rs.round = round;
  rs.step = step;
}

/**
 * enter new_round(height, 0) at rs.start_time
 */
void consensus_state::schedule_round_0(round_state& rs_) {
  std::chrono::system_clock::duration sleep_duration{};
  if (!cs_config.skip_timeout_commit) {
    sleep_duration = std::chrono::microseconds(std::max<tstamp>(rs_.start_time - get_time(), 0));
  }
  dlog("scheduling round 0: height={} sleep={}us", rs_.height,
    std::chrono::duration_cast<std::chrono::microseconds>(sleep_duration).count());
  schedule_timeout(sleep_duration, rs_.height, 0, round_step_type::NewHeight);
}

/**
 * Updates consensus_state and increments height to match that of state.
 * The round becomes 0 and rs.step becomes round_step_type::NewHeight.
 */
void consensus_state::update_to_state(const state& state_) {
  if (rs.commit_round > -1 && 0 < rs.height && rs.height != state_.last_block_height) {
    throw std::runtime_error(
      fmt::format("update_to_state() unexpected state height of {} but found {}", rs.height, state_.last_block_height));
  }

  if (!local_state.is_empty()) {
    if (local_state.last_block_height > 0 && local_state.last_block_height + 1 != rs.height) {
      throw std::runtime_error(fmt::format("inconsistent local_state.last_block_height+1={} vs rs.height={}",
        local_state.last_block_height + 1, rs.height));
    }

    // If state_ isn't further out than local_state, just ignore.
    if (state_.last_block_height <= local_state.last_block_height) {
      dlog("ignoring update_to_state(): new_height={} old_height={}", state_.last_block_height + 1,
        local_state.last_block_height + 1);
      return;
    }
  }

  // Next desired block height
  auto height = state_.next_height();

  rs.height = height;
  update_round_step(0, round_step_type::NewHeight);

  if (rs.commit_time == 0)
    rs.start_time = cs_config.commit(get_time());
  else
    rs.start_time = cs_config.commit(rs.commit_time);

  rs.validators = state_.validators;
  rs.last_validators = state_.last_validators;
  rs.proposal_msg = {};
  rs.proposal_block = {};
  rs.locked_round = -1;
  rs.locked_block = {};
  rs.valid_round = -1;
  rs.valid_block = {};
  rs.commit_round = -1;
  catchup_mark = {};

  if (rs.last_validators)
    signer_->register_validators(*rs.last_validators);
  signer_->register_validators(*rs.validators);
  votes->reset(height, rs.validators, rs.last_validators);

  local_state = state_;
}

void consensus_state::receive_routine(msg_info_ptr mi) {
  std::scoped_lock g(mtx);
  std::visit(message_handler{*this, mi->peer_id}, mi->msg);
}

void consensus_state::schedule_timeout(
  std::chrono::system_clock::duration duration_, int64_t height, int32_t round, round_step_type step) {
  ticker->schedule_timeout(std::make_shared<timeout_info>(timeout_info{duration_, height, round, step}));
}

void consensus_state::tock(timeout_info_ptr ti) {
  ilog("timed out: hrs={}/{}/{} timeout={}ms", ti->height, ti->round, round_step_to_str(ti->step),
    std::chrono::duration_cast<std::chrono::milliseconds>(ti->duration_).count());
  handle_timeout(ti);
}

void consensus_state::handle_timeout(timeout_info_ptr ti) {
  std::scoped_lock g(mtx);

  // timeouts must be for current height, round, step
  if (ti->height != rs.height || ti->round < rs.round || (ti->round == rs.round && ti->step < rs.step)) {
    dlog("ignoring tock because we are ahead: hrs={}/{}/{}", ti->height, ti->round, round_step_to_str(ti->step));
    return;
  }

  switch (ti->step) {
  case round_step_type::NewHeight:
    enter_new_round(ti->height, 0);
    break;
  case round_step_type::Propose:
    if (auto commit = votes->find_commit(ti->height); commit) {
      // a commit of this height is known but was not applied yet
      enter_commit(ti->height, commit->first);
      break;
    }
    enter_prevote(ti->height, ti->round);
    break;
  case round_step_type::Prevote:
    enter_precommit(ti->height, ti->round);
    break;
  case round_step_type::Precommit:
    enter_precommit(ti->height, ti->round);
    enter_new_round(ti->height, ti->round + 1);
    break;
  case round_step_type::Commit:
    if (rs.step == round_step_type::Commit && !rs.proposal_block) {
      ilog("commit block did not arrive: height={} commit_round={}", rs.height, rs.commit_round);
      request_commit(rs.height);
    }
    break;
  default:
    elog("invalid timeout step: {}", round_step_to_str(ti->step));
    break;
  }
}

void consensus_state::enter_new_round(int64_t height, int32_t round) {
  if (rs.height != height || round < rs.round || (rs.round == round && rs.step != round_step_type::NewHeight)) {
    dlog("entering new round with invalid args: hrs={}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));
    return;
  }
  dlog("entering new round: current={}/{}/{} target={}", rs.height, rs.round, round_step_to_str(rs.step), round);

  update_round_step(round, round_step_type::NewRound);
  if (round != 0) {
    // round 0 keeps a proposal received while waiting in NewHeight
    dlog("resetting proposal info");
    rs.proposal_msg = {};
    rs.proposal_block = {};
  }
  votes->set_round(round);

  enter_propose(height, round);
}

void consensus_state::enter_propose(int64_t height, int32_t round) {
  if (rs.height != height || round < rs.round || (rs.round == round && round_step_type::Propose <= rs.step)) {
    dlog("entering propose step with invalid args: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));
    return;
  }
  dlog("entering propose step: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));

  hybrid_defer([this, height, round]() {
    update_round_step(round, round_step_type::Propose);
    if (is_proposal_complete())
      enter_prevote(height, rs.round);
  });

  // If we don't get the proposal quick enough, enter_prevote
  schedule_timeout(cs_config.propose(round), height, round, round_step_type::Propose);

  // Nothing more to do if we are not a validator
  auto address = signer_->address();
  if (address.empty()) {
    dlog("node is not a validator");
    return;
  }
  if (!rs.validators->has_address(address)) {
    dlog("node is not a validator: address={}", to_hex(address));
    return;
  }

  if (votes->find_commit(height)) {
    dlog("propose step; commit of this height is pending");
    return;
  }

  if (is_proposer(address)) {
    dlog("propose step; our turn to propose");
    decide_proposal(height, round);
  } else {
    dlog("propose step; not our turn to propose");
  }
}

/**
 * returns true if the proposal block is present, and if pol_round was proposed, we have 2/3+ prevotes for it
 */
bool consensus_state::is_proposal_complete() {
  if (!rs.proposal_msg || !rs.proposal_block)
    return false;
  if (rs.proposal_msg->pol_round < 0)
    return true;
  // if this is false the proposer is lying or we haven't received the POL yet
  auto block_id_ = votes->two_thirds_majority(rs.height, rs.proposal_msg->pol_round, signed_msg_type::Prevote);
  return block_id_ && *block_id_ == rs.proposal_msg->block_id;
}

bool consensus_state::is_proposer(const Bytes& address) {
  return rs.validators->get_proposer(rs.height, rs.round).address == address;
}

void consensus_state::decide_proposal(int64_t height, int32_t round) {
  std::shared_ptr<const block> block_;
  int32_t pol_round = -1;

  if (rs.valid_block) {
    // If there is valid block, choose that.
    block_ = rs.valid_block;
    pol_round = rs.valid_round;
  } else {
    auto txs = app->create_txs(height, cs_config.max_block_bytes);
    block_ =
      std::make_shared<const block>(local_state.make_block(height, std::move(txs), signer_->address(), get_time()));
  }

  if (static_cast<int64_t>(block_->byte_size()) > cs_config.max_block_bytes) {
    elog("proposal block exceeds max_block_bytes: height={} size={} max={}", height, block_->byte_size(),
      cs_config.max_block_bytes);
    return;
  }

  auto proposal_ = proposal::new_proposal(height, round, pol_round, block_, signer_->address());
  if (auto ok = signer_->sign_proposal(local_state.chain_id, proposal_); !ok) {
    elog("propose step; failed signing proposal: height={} round={} err={}", height, round, ok.error().message());
    return;
  }

  if (transport_)
    transport_->broadcast_proposal(proposal_);
  send(std::make_shared<msg_info>(msg_info{proposal_, ""}));
  dlog("signed proposal: height={} round={} pol_round={} block={}", height, round, pol_round,
    to_hex(proposal_.block_id));
}

void consensus_state::enter_prevote(int64_t height, int32_t round) {
  if (rs.height != height || round < rs.round || (rs.round == round && round_step_type::Prevote <= rs.step)) {
    dlog("entering prevote step with invalid args: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));
    return;
  }
  dlog("entering prevote step: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));

  hybrid_defer([this, round]() { update_round_step(round, round_step_type::Prevote); });

  schedule_timeout(cs_config.prevote(round), height, round, round_step_type::Prevote);

  do_prevote(height, round);
}

void consensus_state::do_prevote(int64_t height, int32_t round) {
  if (!rs.proposal_block) {
    dlog("prevote step; proposal_block is nil");
    sign_add_vote(signed_msg_type::Prevote, {});
    return;
  }

  auto block_id_ = rs.proposal_block->get_hash();
  if (rs.locked_block && !rs.locked_block->hashes_to(block_id_)) {
    dlog("prevote step; locked on a different block; prevoting nil");
    sign_add_vote(signed_msg_type::Prevote, {});
    return;
  }

  // Proposal block was validated when the proposal was accepted
  dlog("prevote step; proposal_block is valid");
  sign_add_vote(signed_msg_type::Prevote, block_id_);
}

void consensus_state::enter_precommit(int64_t height, int32_t round) {
  if (rs.height != height || round < rs.round || (rs.round == round && round_step_type::Precommit <= rs.step)) {
    dlog("entering precommit step with invalid args: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));
    return;
  }
  dlog("entering precommit step: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));

  hybrid_defer([this, round]() { update_round_step(round, round_step_type::Precommit); });

  schedule_timeout(cs_config.precommit(round), height, round, round_step_type::Precommit);

  auto block_id_ = votes->two_thirds_majority(height, round, signed_msg_type::Prevote);

  // If we don't have a polka, we must precommit nil.
  if (!block_id_) {
    if (rs.locked_block)
      dlog("precommit step; no +2/3 prevotes while we are locked; precommitting nil");
    else
      dlog("precommit step; no +2/3 prevotes; precommitting nil");
    sign_add_vote(signed_msg_type::Precommit, {});
    return;
  }

  // +2/3 prevoted nil. Precommit nil and keep the lock.
  if (block_id_->empty()) {
    dlog("precommit step; +2/3 prevoted for nil");
    sign_add_vote(signed_msg_type::Precommit, {});
    return;
  }

  // If we're already locked on that block, precommit it, and update the locked_round
  if (rs.locked_block && rs.locked_block->hashes_to(*block_id_)) {
    dlog("precommit step; +2/3 prevoted locked block; relocking");
    rs.locked_round = round;
    rs.valid_round = round;
    rs.valid_block = rs.locked_block;
    sign_add_vote(signed_msg_type::Precommit, *block_id_);
    return;
  }

  // If +2/3 prevoted for proposal block, lock and precommit it
  if (rs.proposal_block && rs.proposal_block->hashes_to(*block_id_)) {
    dlog("precommit step; +2/3 prevoted proposal block; locking: hash={}", to_hex(*block_id_));
    rs.locked_round = round;
    rs.locked_block = rs.proposal_block;
    rs.valid_round = round;
    rs.valid_block = rs.proposal_block;
    sign_add_vote(signed_msg_type::Precommit, *block_id_);
    return;
  }

  // There was a polka in this round for a block we don't have.
  dlog("precommit step; +2/3 prevotes for a block we do not have; voting nil");
  rs.locked_round = -1;
  rs.locked_block = {};
  sign_add_vote(signed_msg_type::Precommit, {});
}

void consensus_state::enter_commit(int64_t height, int32_t commit_round) {
  if (rs.height != height || round_step_type::Commit <= rs.step) {
    dlog("entering commit step with invalid args: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));
    return;
  }
  dlog("entering commit step: {}/{}/{} commit_round={}", rs.height, rs.round, round_step_to_str(rs.step),
    commit_round);

  auto block_id_ = votes->two_thirds_majority(height, commit_round, signed_msg_type::Precommit);
  check(block_id_ && !block_id_->empty(), "enter_commit() expects +2/3 precommits for a block");

  // The locked block or the valid block may be the one we commit
  if (rs.locked_block && rs.locked_block->hashes_to(*block_id_)) {
    dlog("commit is for a locked block; set proposal_block=locked_block");
    rs.proposal_block = rs.locked_block;
  } else if (rs.valid_block && rs.valid_block->hashes_to(*block_id_)) {
    dlog("commit is for a valid block; set proposal_block=valid_block");
    rs.proposal_block = rs.valid_block;
  }

  // If we don't have the block being committed, wait for a proposal carrying it
  if (!rs.proposal_block || !rs.proposal_block->hashes_to(*block_id_)) {
    ilog("commit is for a block we do not know about; set proposal_block=nil");
    rs.proposal_block = {};
  }

  update_round_step(rs.round, round_step_type::Commit);
  rs.commit_round = commit_round;
  rs.commit_time = get_time();

  // may throw; keep it out of scope guards
  try_finalize_commit(height);

  // peers which decided the block may have moved on; ask them for it if it does not show up
  if (rs.height == height && rs.step == round_step_type::Commit && !rs.proposal_block)
    schedule_timeout(cs_config.timeout_commit, height, rs.round, round_step_type::Commit);
}

void consensus_state::try_finalize_commit(int64_t height) {
  check(rs.height == height, "try_finalize_commit() rs.height={} vs height={}", rs.height, height);

  auto block_id_ = votes->two_thirds_majority(height, rs.commit_round, signed_msg_type::Precommit);
  if (!block_id_ || block_id_->empty()) {
    elog("failed attempt to finalize commit; there was no +2/3 majority or +2/3 was for nil");
    return;
  }

  if (!rs.proposal_block || !rs.proposal_block->hashes_to(*block_id_)) {
    dlog("failed attempt to finalize commit; we do not have the commit block: hash={}", to_hex(*block_id_));
    return;
  }

  finalize_commit(height);
}

void consensus_state::finalize_commit(int64_t height) {
  if (rs.height != height || rs.step != round_step_type::Commit) {
    dlog("finalize_commit() invalid args: {}/{}/{}", rs.height, rs.round, round_step_to_str(rs.step));
    return;
  }

  auto block_id_ = votes->two_thirds_majority(height, rs.commit_round, signed_msg_type::Precommit);
  auto block_ = rs.proposal_block;
  check(block_id_ && block_ && block_->hashes_to(*block_id_),
    "cannot finalize commit; proposal block does not hash to commit hash");
  if (auto ok = local_state.validate_block(*block_); !ok) {
    throw std::runtime_error(fmt::format("+2/3 committed an invalid block: {}", ok.error().message()));
  }

  ilog("finalizing commit of block: height={} round={} hash={} txs={}", height, rs.commit_round, to_hex(*block_id_),
    block_->txs.size());

  // the decision is saved before the application sees it, so a restart replays the same block
  if (store) {
    if (auto ok = store->save(local_state, decided_block{height, rs.commit_round, *block_id_, *block_}); !ok) {
      report_error(ok.error());
      throw std::runtime_error(
        fmt::format("failed to persist decided block at height {}: {}", height, ok.error().message()));
    }
  }

  if (!apply_decided_block(height, *block_id_, block_))
    retry_commit(height, block_);
}

/**
 * hands a decided block to the application and moves to the next height
 * returns false if the application failed to commit the block
 */
bool consensus_state::apply_decided_block(int64_t height, const Bytes& block_id, std::shared_ptr<const block> block_) {
  auto updates = app->on_commit(height, block_id, *block_);
  if (!updates) {
    elog("application failed to commit block: height={} err={}", height, updates.error().message());
    report_error(updates.error());
    return false;
  }

  auto next_state = local_state.apply_block(block_id, *block_, updates.value());
  if (!next_state) {
    report_error(next_state.error());
    throw std::runtime_error(
      fmt::format("failed to apply block at height {}: {}", height, next_state.error().message()));
  }

  record_commit(height, block_id, block_);

  if (store) {
    if (auto ok = store->save(next_state.value()); !ok) {
      report_error(ok.error());
      throw std::runtime_error(fmt::format("failed to persist state at height {}: {}", height, ok.error().message()));
    }
  }

  ilog("committed block: height={} hash={} validators={}", height, to_hex(block_id),
    next_state.value().validators->size());

  update_to_state(next_state.value());

  // By here, rs.height has been incremented
  schedule_round_0(rs);

  if (rs.height < max_peer_height)
    request_commit(rs.height);
  return true;
}

void consensus_state::retry_commit(int64_t height, std::shared_ptr<const block> block_) {
  // Retry on a later round. 2/3+ precommitted the block, so it stays locked for the retry.
  rs.locked_round = rs.round;
  rs.locked_block = std::move(block_);
  if (!rs.valid_block)
    rs.valid_block = rs.locked_block;
  rs.commit_round = -1;
  update_round_step(rs.round, round_step_type::Precommit);
  enter_new_round(height, rs.round + 1);
}

/**
 * applies the block decided before a restart instead of running consensus for its height again
 */
void consensus_state::replay_decided_block() {
  auto decided = std::move(*pending_decided);
  pending_decided.reset();

  auto block_ = std::make_shared<const block>(std::move(decided.block_));
  if (auto ok = local_state.validate_block(*block_); !ok) {
    throw std::runtime_error(fmt::format("saved decided block is invalid: {}", ok.error().message()));
  }
  ilog("replaying decided block: height={} round={} hash={}", decided.height, decided.round,
    to_hex(decided.block_id));

  update_round_step(rs.round, round_step_type::Commit);
  rs.proposal_block = block_;
  rs.commit_round = decided.round;
  rs.commit_time = get_time();
  if (!apply_decided_block(decided.height, decided.block_id, block_))
    retry_commit(decided.height, block_);
}

void consensus_state::record_commit(int64_t height, const Bytes& block_id, std::shared_ptr<const block> block_) {
  auto proposal_ = rs.proposal_msg;
  if (!proposal_ || proposal_->height != height || proposal_->block_id != block_id || !proposal_->block_) {
    // the block was locked in another round; peers accept it by its hash while committing
    proposal_ = std::make_shared<const proposal>(
      proposal::new_proposal(height, rs.commit_round, -1, std::move(block_), signer_->address()));
  }
  commit_history.push_back(commit_record{proposal_, votes->get_votes(height, rs.commit_round, Precommit)});
  while (commit_history.size() > cs_config.commit_history)
    commit_history.pop_front();
}

/**
 * answers a commit request of a lagging peer with the precommits and the block it misses
 */
void consensus_state::send_commit(int64_t height, const std::string& peer_id) {
  auto it = std::find_if(commit_history.begin(), commit_history.end(),
    [&](const commit_record& c) { return c.proposal_msg->height == height; });
  if (it == commit_history.end()) {
    dlog("no commit to send: height={} peer_id={}", height, peer_id);
    return;
  }
  if (!transport_)
    return;
  dlog("sending commit: height={} precommits={} peer_id={}", height, it->precommits.size(), peer_id);
  // precommits go first so the block is taken as the commit block when it arrives
  for (const auto& v : it->precommits)
    transport_->broadcast_vote(v);
  transport_->broadcast_proposal(*it->proposal_msg);
}

void consensus_state::request_commit(int64_t height) {
  if (!transport_)
    return;
  dlog("requesting commit: height={}", height);
  transport_->broadcast_commit_request(commit_request{height});
}

/**
 * a message from a later height means peers already decided our height
 */
void consensus_state::catch_up(int64_t height, int32_t round) {
  max_peer_height = std::max(max_peer_height, height);
  auto mark = std::make_pair(height, round);
  if (mark <= catchup_mark)
    return;
  catchup_mark = mark;
  dlog("peer is ahead: height={} round={} current={}", height, round, rs.height);
  request_commit(rs.height);
}

void consensus_state::set_proposal(const proposal& msg) {
  if (rs.height < msg.height) {
    catch_up(msg.height, msg.round);
    return;
  }

  // While committing, a proposal from any round is enough to deliver the committed block
  if (rs.step == round_step_type::Commit) {
    if (msg.height != rs.height || rs.proposal_block || !msg.block_) {
      dlog("set_proposal; does not apply while committing");
      return;
    }
    auto block_id_ = votes->two_thirds_majority(rs.height, rs.commit_round, signed_msg_type::Precommit);
    if (!block_id_ || msg.block_id != *block_id_ || !msg.block_->hashes_to(*block_id_)) {
      dlog("set_proposal; block is not the one being committed");
      return;
    }
    ilog("received commit block: height={} round={} hash={}", msg.height, msg.round, to_hex(msg.block_id));
    rs.proposal_block = msg.block_;
    try_finalize_commit(rs.height);
    return;
  }

  // Already have one
  if (rs.proposal_msg) {
    dlog("set_proposal; already have one");
    return;
  }

  // Does not apply
  if (msg.height != rs.height || msg.round != rs.round) {
    dlog("set_proposal; does not apply: hr={}/{} current={}/{}", msg.height, msg.round, rs.height, rs.round);
    return;
  }

  // Verify pol_round, which must be -1 or in range [0, proposal.round).
  if (msg.pol_round < -1 || (0 <= msg.pol_round && msg.round <= msg.pol_round)) {
    dlog("set_proposal; error invalid proposal POL round: pol_round={}", msg.pol_round);
    return;
  }

  const auto& proposer = rs.validators->get_proposer(rs.height, rs.round);
  if (msg.proposer_address != proposer.address) {
    dlog("set_proposal; wrong proposer: got={} expected={}", to_hex(msg.proposer_address), to_hex(proposer.address));
    return;
  }

  auto sign_bytes = canonical::proposal_sign_bytes(local_state.chain_id, msg);
  if (!signer_->verify(msg.proposer_address, sign_bytes, msg.signature)) {
    dlog("set_proposal; error invalid proposal signature");
    return;
  }

  if (!msg.block_ || !msg.block_->hashes_to(msg.block_id)) {
    dlog("set_proposal; block does not match block_id");
    return;
  }

  if (static_cast<int64_t>(msg.block_->byte_size()) > cs_config.max_block_bytes) {
    dlog("set_proposal; block exceeds max_block_bytes: size={}", msg.block_->byte_size());
    return;
  }

  if (auto ok = local_state.validate_block(*msg.block_); !ok) {
    dlog("set_proposal; invalid block: {}", ok.error().message());
    return;
  }

  if (auto ok = app->validate_block(*msg.block_); !ok) {
    dlog("set_proposal; block rejected by application: {}", ok.error().message());
    return;
  }

  rs.proposal_msg = std::make_shared<const proposal>(msg);
  rs.proposal_block = msg.block_;
  ilog("received proposal: height={} round={} pol_round={} hash={}", msg.height, msg.round, msg.pol_round,
    to_hex(msg.block_id));

  auto height = rs.height;
  auto round = rs.round;

  // Update valid block if there is a polka for it in the current round
  auto block_id_ = votes->two_thirds_majority(height, round, signed_msg_type::Prevote);
  if (block_id_ && !block_id_->empty() && rs.valid_round < round && rs.proposal_block->hashes_to(*block_id_)) {
    dlog("updating valid block to new proposal block");
    rs.valid_round = round;
    rs.valid_block = rs.proposal_block;
  }

  if (rs.step <= round_step_type::Propose && is_proposal_complete()) {
    // Move to the next step
    enter_prevote(height, round);
    if (block_id_)
      enter_precommit(height, round);
  } else if (rs.step == round_step_type::Prevote && block_id_ && rs.proposal_block->hashes_to(*block_id_)) {
    enter_precommit(height, round);
  }
}

bool consensus_state::add_vote(const vote& vote_, const std::string& peer_id) {
  dlog("adding vote: height={} round={} type={} cs_height={}", vote_.height, vote_.round,
    signed_msg_type_to_str(vote_.type), rs.height);

  if (rs.height < vote_.height)
    catch_up(vote_.height, vote_.round);

  auto added = votes->add_vote(vote_);
  if (!added) {
    dlog("vote ignored and not added: height={} round={} type={} peer_id={} err={}", vote_.height, vote_.round,
      signed_msg_type_to_str(vote_.type), peer_id, added.error().message());
    return false;
  }
  if (added.value() == add_vote_result::replaced) {
    dlog("vote replaced an earlier one: validator={}", to_hex(vote_.validator_address));
  }

  // A precommit for the previous height only completes the last commit
  if (vote_.height != rs.height) {
    dlog("added vote to last precommits: height={}", vote_.height);
    return true;
  }

  auto height = rs.height;

  switch (vote_.type) {
  case signed_msg_type::Prevote: {
    auto block_id_ = votes->two_thirds_majority(height, vote_.round, signed_msg_type::Prevote);

    // If +2/3 prevotes for a block for *any* round:
    if (block_id_ && !block_id_->empty()) {
      // There was a polka!
      // Unlock if `locked_round < vote.round <= rs.round` and the polka is for another block
      // NOTE: If vote.round > rs.round, we'll deal with it when we get to vote.round
      if (rs.locked_block && rs.locked_round < vote_.round && vote_.round <= rs.round &&
        !rs.locked_block->hashes_to(*block_id_)) {
        dlog("unlocking because of POL: locked_round={} pol_round={}", rs.locked_round, vote_.round);
        rs.locked_round = -1;
        rs.locked_block = {};
      }

      // Update valid block if we can.
      // NOTE: our proposal block may be nil or not what received a polka
      if (rs.valid_round < vote_.round && vote_.round == rs.round && rs.proposal_block &&
        rs.proposal_block->hashes_to(*block_id_)) {
        dlog("updating valid block because of POL: valid_round={} pol_round={}", rs.valid_round, vote_.round);
        rs.valid_round = vote_.round;
        rs.valid_block = rs.proposal_block;
      }
    }

    // If +2/3 prevotes for *anything* for future round:
    if (rs.round < vote_.round && votes->has_two_thirds_any(height, vote_.round, signed_msg_type::Prevote)) {
      // Round-skip if there is any 2/3+ of votes ahead of us
      enter_new_round(height, vote_.round);
    } else if (rs.round == vote_.round && round_step_type::Prevote <= rs.step) {
      if (block_id_ && (block_id_->empty() || is_proposal_complete()))
        enter_precommit(height, vote_.round);
    } else if (rs.proposal_msg && 0 <= rs.proposal_msg->pol_round && rs.proposal_msg->pol_round == vote_.round) {
      // If the proposal is now complete, enter prevote of rs.round.
      if (is_proposal_complete())
        enter_prevote(height, rs.round);
    }
    break;
  }
  case signed_msg_type::Precommit: {
    auto block_id_ = votes->two_thirds_majority(height, vote_.round, signed_msg_type::Precommit);
    if (block_id_) {
      // Executed as two_thirds_majority could be from a higher round
      enter_new_round(height, vote_.round);
      enter_precommit(height, vote_.round);

      if (!block_id_->empty()) {
        enter_commit(height, vote_.round);
      } else {
        enter_new_round(height, vote_.round + 1);
      }
    } else if (rs.round < vote_.round && votes->has_two_thirds_any(height, vote_.round, signed_msg_type::Precommit)) {
      enter_new_round(height, vote_.round);
    }
    break;
  }
  default:
    dlog("unexpected vote type: {}", signed_msg_type_to_str(vote_.type));
    return false;
  }

  return true;
}

std::optional<vote> consensus_state::sign_vote(signed_msg_type msg_type, const Bytes& hash) {
  auto addr = signer_->address();
  auto vote_ = vote{msg_type, rs.height, rs.round, hash, vote_time(), addr, {}};

  if (auto ok = signer_->sign_vote(local_state.chain_id, vote_); !ok) {
    elog("failed signing vote: height={} round={} type={} err={}", vote_.height, vote_.round,
      signed_msg_type_to_str(msg_type), ok.error().message());
    return {};
  }
  return vote_;
}

/**
 * Vote time is ensured to be at least 1ms later than the time of the block being voted on
 */
tstamp consensus_state::vote_time() {
  auto now = get_time();
  auto min_vote_time = now;
  std::chrono::microseconds time_iota(1000);
  if (rs.locked_block) {
    min_vote_time = rs.locked_block->time + time_iota.count();
  } else if (rs.proposal_block) {
    min_vote_time = rs.proposal_block->time + time_iota.count();
  }
  return std::max(now, min_vote_time);
}

/**
 * signs the vote and publishes it to the peers and to ourselves
 */
std::optional<vote> consensus_state::sign_add_vote(signed_msg_type msg_type, const Bytes& hash) {
  auto addr = signer_->address();
  if (addr.empty() || !rs.validators->has_address(addr))
    return {};

  auto vote_ = sign_vote(msg_type, hash);
  if (!vote_) {
    dlog("failed signing vote: height={} round={}", rs.height, rs.round);
    return {};
  }

  if (transport_)
    transport_->broadcast_vote(*vote_);
  send(std::make_shared<msg_info>(msg_info{*vote_, ""}));
  dlog("signed and pushed vote: height={} round={} type={} hash={}", rs.height, rs.round,
    signed_msg_type_to_str(msg_type), to_hex(hash));
  return vote_;
}

void consensus_state::report_error(const Error& err) {
  if (reporter)
    reporter(err);
}

} // namespace hybrid::consensus
