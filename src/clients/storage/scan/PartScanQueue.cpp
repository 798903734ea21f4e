/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/scan/PartScanQueue.h"

namespace graphscan {
namespace storage {

std::string PartScanInfo::toString() const {
  return folly::stringPrintf("{part: %d, leader: %s, cursor: %s}",
                             part_,
                             leader_.toString().c_str(),
                             folly::hexlify(cursor_).c_str());
}

PartScanQueue::PartScanQueue(std::vector<PartScanInfo> parts) {
  for (auto& info : parts) {
    auto part = info.getPart();
    if (parts_.count(part) > 0) {
      FLOG_WARN("Part %d is listed more than once, keep the first one", part);
      continue;
    }
    hostParts_[info.getLeader()].emplace(part);
    parts_.emplace(part, std::move(info));
  }
}

size_t PartScanQueue::size() const {
  std::lock_guard<std::mutex> g(lock_);
  return parts_.size();
}

void PartScanQueue::startRound() {
  std::lock_guard<std::mutex> g(lock_);
  taken_.clear();
}

std::optional<PartScanInfo> PartScanQueue::takeAssigned(const HostAddr& host) {
  std::lock_guard<std::mutex> g(lock_);
  auto it = hostParts_.find(host);
  if (it == hostParts_.end()) {
    return std::nullopt;
  }
  for (auto part : it->second) {
    if (leased_.count(part) == 0 && taken_.count(part) == 0) {
      leased_.emplace(part);
      taken_.emplace(part);
      return parts_.at(part);
    }
  }
  return std::nullopt;
}

bool PartScanQueue::drop(PartitionID part) {
  std::lock_guard<std::mutex> g(lock_);
  auto it = parts_.find(part);
  if (it == parts_.end()) {
    return false;
  }
  auto hostIt = hostParts_.find(it->second.getLeader());
  if (hostIt != hostParts_.end()) {
    hostIt->second.erase(part);
    if (hostIt->second.empty()) {
      hostParts_.erase(hostIt);
    }
  }
  leased_.erase(part);
  taken_.erase(part);
  parts_.erase(it);
  return true;
}

bool PartScanQueue::reassign(PartitionID part, const HostAddr& newHost) {
  std::lock_guard<std::mutex> g(lock_);
  auto it = parts_.find(part);
  if (it == parts_.end()) {
    return false;
  }
  auto& info = it->second;
  if (info.getLeader() != newHost) {
    auto hostIt = hostParts_.find(info.getLeader());
    if (hostIt != hostParts_.end()) {
      hostIt->second.erase(part);
      if (hostIt->second.empty()) {
        hostParts_.erase(hostIt);
      }
    }
    hostParts_[newHost].emplace(part);
    info.setLeader(newHost);
  }
  leased_.erase(part);
  return true;
}

bool PartScanQueue::advanceCursor(PartitionID part, Cursor cursor) {
  std::lock_guard<std::mutex> g(lock_);
  auto it = parts_.find(part);
  if (it == parts_.end()) {
    return false;
  }
  it->second.setCursor(std::move(cursor));
  leased_.erase(part);
  return true;
}

bool PartScanQueue::restore(PartitionID part) {
  std::lock_guard<std::mutex> g(lock_);
  if (parts_.count(part) == 0) {
    return false;
  }
  leased_.erase(part);
  return true;
}

std::vector<HostAddr> PartScanQueue::hosts() const {
  std::lock_guard<std::mutex> g(lock_);
  std::vector<HostAddr> hosts;
  hosts.reserve(hostParts_.size());
  for (const auto& entry : hostParts_) {
    hosts.emplace_back(entry.first);
  }
  std::sort(hosts.begin(), hosts.end());
  return hosts;
}

std::optional<PartScanInfo> PartScanQueue::get(PartitionID part) const {
  std::lock_guard<std::mutex> g(lock_);
  auto it = parts_.find(part);
  if (it == parts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PartScanQueue::isLeased(PartitionID part) const {
  std::lock_guard<std::mutex> g(lock_);
  return leased_.count(part) > 0;
}

}  // namespace storage
}  // namespace graphscan
