/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/scan/ScanIterator.h"

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/executors/InlineExecutor.h>
#include <folly/executors/thread_factory/NamedThreadFactory.h>

#include "clients/storage/GFlags.h"
#include "common/concurrent/Latch.h"

namespace graphscan {
namespace storage {

std::ostream& operator<<(std::ostream& os, ScanStatus status) {
  switch (status) {
    case ScanStatus::ALL_SUCCESS:
      return os << "ALL_SUCCESS";
    case ScanStatus::PART_SUCCESS:
      return os << "PART_SUCCESS";
  }
  return os << "UNKNOWN(" << static_cast<int>(status) << ")";
}

Status ScanIteratorConfig::validate() const {
  if (metaProvider == nullptr) {
    return Status::InvalidArgument("No meta provider");
  }
  if (connProvider == nullptr) {
    return Status::InvalidArgument("No connection provider");
  }
  if (spaceName.empty()) {
    return Status::InvalidArgument("Empty space name");
  }
  if (labelName.empty()) {
    return Status::InvalidArgument("Empty label name");
  }
  if (partsPerHost <= 0) {
    return Status::InvalidArgument("partsPerHost should be positive, got %d", partsPerHost);
  }
  for (const auto& info : parts) {
    if (info.getPart() <= 0) {
      return Status::InvalidArgument("Invalid part id %d", info.getPart());
    }
    if (!info.getLeader().isValid()) {
      return Status::InvalidArgument("Part %d has no valid leader", info.getPart());
    }
  }
  for (const auto& host : addresses) {
    if (!host.isValid()) {
      return Status::InvalidArgument("Invalid address %s", host.toString().c_str());
    }
  }
  return Status::OK();
}

struct ScanIterator::ScanContext {
  ScanContext(const ScanIteratorConfig& config, RemoteFunc func)
      : meta(config.metaProvider),
        conns(config.connProvider),
        queue(config.parts),
        spaceId(config.spaceId),
        remoteFunc(std::move(func)) {}

  std::shared_ptr<meta::MetaProvider> meta;
  std::shared_ptr<ConnectionProvider> conns;
  PartScanQueue queue;
  GraphSpaceID spaceId;
  RemoteFunc remoteFunc;
};

struct ScanIterator::RoundState {
  // Counted down once, when all host tasks of the round have finished
  concurrent::Latch done{1};
  std::vector<folly::Try<HostOutcome>> outcomes;
};

ScanIterator::ScanIterator(ScanIteratorConfig config, RemoteFunc remoteFunc)
    : config_(std::move(config)) {
  ctx_ = std::make_shared<ScanContext>(config_, std::move(remoteFunc));
  addresses_.insert(config_.addresses.begin(), config_.addresses.end());
  for (auto& host : ctx_->queue.hosts()) {
    addresses_.insert(std::move(host));
  }

  if (config_.executor != nullptr) {
    executor_ = config_.executor;
  } else {
    size_t numThreads = std::max<size_t>(1, addresses_.size() * config_.partsPerHost);
    if (FLAGS_scan_max_worker_threads > 0) {
      numThreads = std::min<size_t>(numThreads, FLAGS_scan_max_worker_threads);
    }
    executor_ = std::make_shared<folly::CPUThreadPoolExecutor>(
        numThreads, std::make_shared<folly::NamedThreadFactory>("scan-worker"));
  }
  hasNext_ = ctx_->queue.size() > 0;
  VLOG(1) << "Scan " << config_.labelName << " of space " << config_.spaceName << " over "
          << ctx_->queue.size() << " parts on " << addresses_.size() << " hosts";
}

ScanIterator::~ScanIterator() {
  // An owned pool joins its threads here. Tasks still waiting on storage
  // hold only the context and no pool, so they may finish after us.
  executor_.reset();
}

size_t ScanIterator::pendingParts() const {
  return ctx_->queue.size();
}

const PartScanQueue& ScanIterator::partQueue() const {
  return ctx_->queue;
}

void ScanIterator::interrupt() {
  std::lock_guard<std::mutex> g(interruptLock_);
  if (currentRound_ != nullptr) {
    FLOG_INFO("Interrupt the scan round of %s", config_.labelName.c_str());
    currentRound_->done.interrupt();
  } else {
    interruptPending_ = true;
  }
}

StatusOr<ScanIterator::RoundOutput> ScanIterator::nextRound() {
  if (!hasNext()) {
    return Status::IteratorExhausted("Scan of %s has no more data", config_.labelName.c_str());
  }

  // Hosts that took over a partition join the rounds from now on
  for (auto& host : ctx_->queue.hosts()) {
    addresses_.insert(std::move(host));
  }
  ctx_->queue.startRound();

  std::vector<folly::Future<HostOutcome>> futures;
  futures.reserve(addresses_.size() * config_.partsPerHost);
  for (const auto& host : addresses_) {
    for (int32_t i = 0; i < config_.partsPerHost; ++i) {
      // Leave the pool once the task has started, a stuck storage call
      // must not keep the pool alive
      auto task = folly::via(executor_.get()).thenValue([ctx = ctx_, host](auto&&) {
        return scanHost(ctx, host);
      });
      futures.emplace_back(std::move(task).via(&folly::InlineExecutor::instance()));
    }
  }
  const auto numTasks = futures.size();

  auto round = std::make_shared<RoundState>();
  folly::collectAll(std::move(futures))
      .via(&folly::InlineExecutor::instance())
      .thenValue([round](std::vector<folly::Try<HostOutcome>>&& tries) {
        round->outcomes = std::move(tries);
        round->done.down();
      });

  {
    std::lock_guard<std::mutex> g(interruptLock_);
    currentRound_ = round;
    if (interruptPending_) {
      interruptPending_ = false;
      round->done.interrupt();
    }
  }
  auto waited = round->done.wait();
  {
    std::lock_guard<std::mutex> g(interruptLock_);
    currentRound_.reset();
  }
  if (!waited.ok()) {
    LOG(ERROR) << "Scan of " << config_.labelName << " is interrupted: " << waited;
    return waited;
  }

  std::vector<DataSet> payloads;
  std::vector<Status> errors;
  size_t succeeded = 0;
  for (auto& t : round->outcomes) {
    if (t.hasException()) {
      // Host tasks turn their own failures into outcomes
      LOG(DFATAL) << "Unexpected exception in a scan task: " << t.exception().what();
      errors.emplace_back(Status::Error(t.exception().what().toStdString()));
      continue;
    }
    auto& outcome = t.value();
    if (outcome.succeeded()) {
      ++succeeded;
      if (outcome.kind == HostOutcome::Kind::kSucceeded) {
        payloads.emplace_back(std::move(outcome.data));
      }
    }
    for (auto& err : outcome.errors) {
      errors.emplace_back(std::move(err));
    }
  }
  roundErrors_ = errors;

  const auto remaining = ctx_->queue.size();
  VLOG(1) << "Scan round of " << config_.labelName << " done, " << numTasks << " tasks, "
          << succeeded << " succeeded, " << errors.size() << " errors, " << remaining
          << " parts left";

  if (config_.partialSuccessAllowed) {
    hasNext_ = remaining > 0;
    if (succeeded == 0) {
      return aggregatedFailure(errors);
    }
    auto status = errors.empty() ? ScanStatus::ALL_SUCCESS : ScanStatus::PART_SUCCESS;
    return RoundOutput{std::move(payloads), status};
  }

  hasNext_ = remaining > 0 && errors.empty();
  if (!errors.empty()) {
    return aggregatedFailure(errors);
  }
  if (succeeded != numTasks) {
    // The data of an incomplete round is discarded, though the cursors of
    // the answering partitions have moved on
    VLOG(1) << "Only " << succeeded << " of " << numTasks << " tasks succeeded, "
            << "the round of " << config_.labelName << " carries no data";
    payloads.clear();
  }
  return RoundOutput{std::move(payloads), ScanStatus::ALL_SUCCESS};
}

Status ScanIterator::aggregatedFailure(const std::vector<Status>& errors) const {
  if (errors.empty()) {
    return Status::ScanFailed("No host succeeded in the round of %s", config_.labelName.c_str());
  }
  std::vector<std::string> msgs;
  msgs.reserve(errors.size());
  for (const auto& err : errors) {
    msgs.emplace_back(err.toString());
  }
  return Status::ScanFailed(folly::join("; ", msgs));
}

// static
folly::Future<HostOutcome> ScanIterator::scanHost(std::shared_ptr<ScanContext> ctx,
                                                  const HostAddr& host) {
  auto info = ctx->queue.takeAssigned(host);
  if (!info.has_value()) {
    VLOG(3) << "No part to scan on " << host;
    return folly::makeFuture(HostOutcome(host, HostOutcome::Kind::kIdle));
  }
  const auto part = info->getPart();

  auto conn = acquireConnection(*ctx, host);
  if (!conn.ok()) {
    LOG(ERROR) << "Get connection to " << host << " for part " << part
               << " failed: " << conn.status();
    ctx->queue.restore(part);
    HostOutcome outcome(host, HostOutcome::Kind::kFailed, part);
    outcome.fail(conn.status());
    return folly::makeFuture(std::move(outcome));
  }
  auto client = std::move(conn).value();

  VLOG(2) << "Scan " << *info << " on " << host;
  return folly::makeFutureWith([&ctx, &client, &info]() {
           return ctx->remoteFunc(client.get(), *info);
         })
      .thenValue([ctx, host, part](ScanResponse&& resp) {
        return handleResponse(*ctx, host, part, std::move(resp));
      })
      .thenError([ctx, host, part](folly::exception_wrapper&& ew) {
        LOG(ERROR) << "Scan part " << part << " on " << host << " failed: " << ew.what();
        ctx->queue.drop(part);
        HostOutcome outcome(host, HostOutcome::Kind::kFailed, part);
        outcome.fail(Status::RpcFailure("Scan part %d on %s failed: %s",
                                        part,
                                        host.toString().c_str(),
                                        ew.what().c_str()));
        return outcome;
      })
      .ensure([ctx, host, client]() { ctx->conns->release(host, client); });
}

// static
HostOutcome ScanIterator::handleResponse(ScanContext& ctx,
                                         const HostAddr& host,
                                         PartitionID part,
                                         ScanResponse&& resp) {
  if (!resp.result.has_value()) {
    LOG(ERROR) << "Response of part " << part << " from " << host << " has no result";
    ctx.queue.drop(part);
    HostOutcome outcome(host, HostOutcome::Kind::kFailed, part);
    outcome.fail(
        Status::PartFailed("Part %d on %s answered no result", part, host.toString().c_str()));
    return outcome;
  }

  const auto& failedParts = resp.result->failedParts;
  if (failedParts.empty()) {
    if (resp.hasMore) {
      ctx.queue.advanceCursor(part, std::move(resp.nextCursor));
    } else {
      VLOG(1) << "Part " << part << " on " << host << " is exhausted";
      ctx.queue.drop(part);
    }
    HostOutcome outcome(host, HostOutcome::Kind::kSucceeded, part);
    outcome.data = std::move(resp.data);
    return outcome;
  }

  HostOutcome outcome(host, HostOutcome::Kind::kRedirected, part);
  for (const auto& failed : failedParts) {
    if (failed.partId != part) {
      LOG(WARNING) << host << " reported part " << failed.partId << " while scanning part "
                   << part;
    }
    if (failed.code == ErrorCode::E_LEADER_CHANGED) {
      auto leader = freshLeader(ctx, part, failed.leader);
      if (leader.ok()) {
        VLOG(1) << "Leader of part " << part << " moved from " << host << " to "
                << leader.value();
        ctx.queue.reassign(part, leader.value());
      } else {
        LOG(ERROR) << "Refresh the leader of part " << part << " failed: " << leader.status();
        ctx.queue.restore(part);
        outcome.fail(leader.status());
      }
    } else {
      LOG(ERROR) << "Scan part " << part << " on " << host << " failed, code " << failed.code;
      ctx.queue.drop(part);
      outcome.fail(Status::PartFailed("Part %d on %s failed with %s",
                                      part,
                                      host.toString().c_str(),
                                      errorCodeName(failed.code)));
    }
  }
  return outcome;
}

// static
StatusOr<HostAddr> ScanIterator::freshLeader(ScanContext& ctx,
                                             PartitionID part,
                                             const std::optional<HostAddr>& hint) {
  if (hint.has_value() && hint->isValid()) {
    ctx.meta->updateLeader(ctx.spaceId, part, *hint);
  } else {
    ctx.meta->invalidLeader(ctx.spaceId, part);
  }
  auto leader = ctx.meta->getLeader(ctx.spaceId, part);
  if (!leader.ok()) {
    return leader.status();
  }
  if (!leader.value().isValid()) {
    return Status::LeaderChanged("No valid leader for part %d", part);
  }
  return leader;
}

// static
StatusOr<std::shared_ptr<StorageConnection>> ScanIterator::acquireConnection(
    ScanContext& ctx, const HostAddr& host) {
  try {
    auto conn = ctx.conns->getConnection(host);
    if (conn.ok() && conn.value() == nullptr) {
      return Status::NoConnection("No connection to %s", host.toString().c_str());
    }
    return conn;
  } catch (const std::exception& e) {
    return Status::NoConnection("Connect to %s failed: %s", host.toString().c_str(), e.what());
  }
}

}  // namespace storage
}  // namespace graphscan
