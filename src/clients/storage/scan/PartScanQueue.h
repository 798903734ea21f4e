/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_PARTSCANQUEUE_H_
#define CLIENTS_STORAGE_SCAN_PARTSCANQUEUE_H_

#include "common/base/Base.h"
#include "common/base/Types.h"
#include "common/datatypes/HostAddr.h"

namespace graphscan {
namespace storage {

// Scan progress of one partition
class PartScanInfo final {
 public:
  PartScanInfo(PartitionID part, HostAddr leader, Cursor cursor = "")
      : part_(part), leader_(std::move(leader)), cursor_(std::move(cursor)) {}

  PartitionID getPart() const {
    return part_;
  }

  const HostAddr& getLeader() const {
    return leader_;
  }

  void setLeader(HostAddr leader) {
    leader_ = std::move(leader);
  }

  const Cursor& getCursor() const {
    return cursor_;
  }

  void setCursor(Cursor cursor) {
    cursor_ = std::move(cursor);
  }

  std::string toString() const;

 private:
  PartitionID part_;
  HostAddr leader_;
  Cursor cursor_;
};

inline std::ostream& operator<<(std::ostream& os, const PartScanInfo& info) {
  return os << info.toString();
}

/**
 * The partitions of one scan which are neither exhausted nor failed,
 * grouped by the host they are assigned to.
 *
 * A worker takes a partition with takeAssigned(), which leases it until
 * the worker settles it through advanceCursor(), reassign(), drop() or
 * restore(). A leased partition is never handed out again, so two
 * concurrent workers can't scan the same partition. Within one round,
 * opened by startRound(), a partition is handed out at most once.
 *
 * All methods are thread safe and linearizable. The number of partitions
 * only ever shrinks, moving a partition between hosts keeps the count.
 */
class PartScanQueue final {
 public:
  explicit PartScanQueue(std::vector<PartScanInfo> parts);

  PartScanQueue(const PartScanQueue&) = delete;
  PartScanQueue& operator=(const PartScanQueue&) = delete;

  // Partitions not dropped yet, leased ones included
  size_t size() const;

  // Every partition can be taken once more, leased ones excepted
  void startRound();

  // Lease the lowest partition assigned to `host' not taken this round
  std::optional<PartScanInfo> takeAssigned(const HostAddr& host);

  // Remove the partition for good, returns false if it was gone already
  bool drop(PartitionID part);

  // Assign the partition to `newHost' for the following rounds
  bool reassign(PartitionID part, const HostAddr& newHost);

  // Keep the partition on its host, resuming from `cursor' next time
  bool advanceCursor(PartitionID part, Cursor cursor);

  // End the lease without any change
  bool restore(PartitionID part);

  // Hosts owning at least one partition
  std::vector<HostAddr> hosts() const;

  std::optional<PartScanInfo> get(PartitionID part) const;

  bool isLeased(PartitionID part) const;

 private:
  mutable std::mutex lock_;
  std::unordered_map<PartitionID, PartScanInfo> parts_;
  std::unordered_map<HostAddr, std::set<PartitionID>> hostParts_;
  std::unordered_set<PartitionID> leased_;
  // Taken since the last startRound()
  std::unordered_set<PartitionID> taken_;
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_PARTSCANQUEUE_H_
