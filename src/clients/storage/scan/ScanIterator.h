/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_SCANITERATOR_H_
#define CLIENTS_STORAGE_SCAN_SCANITERATOR_H_

#include <folly/Executor.h>
#include <folly/futures/Future.h>

#include "clients/meta/MetaProvider.h"
#include "clients/storage/StorageConnection.h"
#include "clients/storage/scan/PartScanQueue.h"
#include "clients/storage/scan/ScanResult.h"
#include "common/base/Base.h"
#include "common/base/StatusOr.h"

namespace graphscan {
namespace storage {

struct ScanIteratorConfig {
  std::shared_ptr<meta::MetaProvider> metaProvider;
  std::shared_ptr<ConnectionProvider> connProvider;
  // Runs the host tasks. When null the iterator starts a pool of its own,
  // bounded by --scan_max_worker_threads
  std::shared_ptr<folly::Executor> executor;
  // Initial assignment of the partitions to their leaders
  std::vector<PartScanInfo> parts;
  // Hosts of the scan, the leaders in `parts' are added if missing
  std::vector<HostAddr> addresses;
  GraphSpaceID spaceId{0};
  std::string spaceName;
  std::string labelName;
  // When true a round fails only if no host succeeded in it
  bool partialSuccessAllowed{false};
  // Partitions of one host scanned concurrently within a round
  int32_t partsPerHost{1};

  Status validate() const;
};

// What one host task brought back from a round
struct HostOutcome {
  enum class Kind {
    // Nothing was assigned to the host
    kIdle,
    kSucceeded,
    // The partition moved to another leader, it is retried next round
    kRedirected,
    kFailed,
  };

  HostOutcome(HostAddr h, Kind k, std::optional<PartitionID> p = std::nullopt)
      : host(std::move(h)), kind(k), part(p) {}

  bool succeeded() const {
    return kind == Kind::kIdle || kind == Kind::kSucceeded;
  }

  void fail(Status status) {
    kind = Kind::kFailed;
    errors.emplace_back(std::move(status));
  }

  HostAddr host;
  Kind kind;
  std::optional<PartitionID> part;
  DataSet data;
  std::vector<Status> errors;
};

/**
 * Drives a scan over all partitions of one label, one round per call.
 *
 * A round runs one task per host (or `partsPerHost' tasks), every task
 * scans one partition assigned to the host, so a round fetches at most
 * one batch per partition. The calling thread waits for all tasks of
 * the round before it decides the round's verdict, rounds never overlap.
 *
 * The wait has no timeout, a stuck storage call stalls the round until
 * interrupt() is called. Tasks in flight are not cancelled by an
 * interruption, their effects on the partitions still land.
 *
 * Apart from interrupt() the iterator is not thread safe.
 */
class ScanIterator {
 public:
  using RemoteFunc =
      std::function<folly::Future<ScanResponse>(StorageConnection*, const PartScanInfo&)>;

  virtual ~ScanIterator();

  ScanIterator(const ScanIterator&) = delete;
  ScanIterator& operator=(const ScanIterator&) = delete;

  /**
   * False once every partition is exhausted or dropped. Without partial
   * success it also turns false after the first failed round.
   */
  bool hasNext() const {
    return hasNext_.load();
  }

  // Abort the current wait of next(), or the next one if none is waiting
  void interrupt();

  // Errors of the last completed round
  const std::vector<Status>& roundErrors() const {
    return roundErrors_;
  }

  // Partitions still to be scanned
  size_t pendingParts() const;

  const PartScanQueue& partQueue() const;

  std::vector<HostAddr> addresses() const {
    return std::vector<HostAddr>(addresses_.begin(), addresses_.end());
  }

  const std::string& spaceName() const {
    return config_.spaceName;
  }

  const std::string& labelName() const {
    return config_.labelName;
  }

 protected:
  struct RoundOutput {
    std::vector<DataSet> payloads;
    ScanStatus status;
  };

  ScanIterator(ScanIteratorConfig config, RemoteFunc remoteFunc);

  StatusOr<RoundOutput> nextRound();

 private:
  struct ScanContext;
  struct RoundState;

  static folly::Future<HostOutcome> scanHost(std::shared_ptr<ScanContext> ctx,
                                             const HostAddr& host);

  static HostOutcome handleResponse(ScanContext& ctx,
                                    const HostAddr& host,
                                    PartitionID part,
                                    ScanResponse&& resp);

  static StatusOr<HostAddr> freshLeader(ScanContext& ctx,
                                        PartitionID part,
                                        const std::optional<HostAddr>& hint);

  static StatusOr<std::shared_ptr<StorageConnection>> acquireConnection(ScanContext& ctx,
                                                                        const HostAddr& host);

  Status aggregatedFailure(const std::vector<Status>& errors) const;

 private:
  const ScanIteratorConfig config_;
  // Shared with the host tasks, which may outlive an interrupted round
  std::shared_ptr<ScanContext> ctx_;
  std::shared_ptr<folly::Executor> executor_;
  std::set<HostAddr> addresses_;

  std::atomic<bool> hasNext_{false};
  std::vector<Status> roundErrors_;

  std::mutex interruptLock_;
  std::shared_ptr<RoundState> currentRound_;
  bool interruptPending_{false};
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_SCANITERATOR_H_
