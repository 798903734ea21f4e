/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_META_METACACHE_H_
#define CLIENTS_META_METACACHE_H_

#include <folly/SharedMutex.h>

#include <shared_mutex>

#include "clients/meta/MetaProvider.h"

namespace graphscan {
namespace meta {

// partition => peers, the first peer is the preferred leader
using PartsAlloc = std::unordered_map<PartitionID, std::vector<HostAddr>>;

struct SpaceDesc {
  GraphSpaceID id{0};
  std::string name;
  PartsAlloc parts;
  std::unordered_map<std::string, EdgeType> edges;
  std::unordered_map<std::string, TagID> tags;
};

/**
 * An in-process MetaProvider serving a snapshot of the cluster layout.
 *
 * Leaders learnt from the storage hosts are cached on top of the
 * snapshot. When a partition has no known leader one of its peers is
 * picked in round-robin.
 */
class MetaCache final : public MetaProvider {
 public:
  MetaCache() = default;
  explicit MetaCache(std::vector<SpaceDesc> spaces);

  // Add a space, or replace the one with the same id. The parts must be
  // numbered from 1 without gaps.
  Status addSpace(SpaceDesc space);

  Status removeSpace(const std::string& name);

  StatusOr<GraphSpaceID> getSpaceIdByName(const std::string& name) override;

  StatusOr<EdgeType> getEdgeTypeByName(GraphSpaceID space, const std::string& name) override;

  StatusOr<TagID> getTagIdByName(GraphSpaceID space, const std::string& name) override;

  StatusOr<int32_t> partsNum(GraphSpaceID space) override;

  StatusOr<HostAddr> getLeader(GraphSpaceID space, PartitionID part) override;

  void updateLeader(GraphSpaceID space, PartitionID part, const HostAddr& leader) override;

  void invalidLeader(GraphSpaceID space, PartitionID part) override;

  StatusOr<std::vector<HostAddr>> getPartPeers(GraphSpaceID space, PartitionID part);

 private:
  using PartKey = std::pair<GraphSpaceID, PartitionID>;

  struct PartKeyHash {
    std::size_t operator()(const PartKey& key) const noexcept {
      return (static_cast<std::size_t>(key.first) << 32) ^ static_cast<std::size_t>(key.second);
    }
  };

  folly::SharedMutex spacesLock_;
  std::unordered_map<GraphSpaceID, SpaceDesc> spaces_;
  std::unordered_map<std::string, GraphSpaceID> spaceIndex_;

  folly::SharedMutex leadersLock_;
  std::unordered_map<PartKey, HostAddr, PartKeyHash> leaders_;
  std::unordered_map<PartKey, std::size_t, PartKeyHash> pickedIndex_;
};

}  // namespace meta
}  // namespace graphscan

#endif  // CLIENTS_META_METACACHE_H_
