/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/meta/MetaCache.h"

namespace graphscan {
namespace meta {

MetaCache::MetaCache(std::vector<SpaceDesc> spaces) {
  for (auto& space : spaces) {
    auto status = addSpace(std::move(space));
    CHECK(status.ok()) << status;
  }
}

Status MetaCache::addSpace(SpaceDesc space) {
  auto numParts = static_cast<int64_t>(space.parts.size());
  for (const auto& part : space.parts) {
    if (part.first <= 0 || part.first > numParts) {
      return Status::InvalidArgument("Space %s has %ld parts, part %d is out of [1, %ld]",
                                     space.name.c_str(),
                                     numParts,
                                     part.first,
                                     numParts);
    }
  }
  std::unique_lock<folly::SharedMutex> holder(spacesLock_);
  VLOG(1) << "Load space " << space.name << ", id " << space.id << ", " << space.parts.size()
          << " parts";
  auto it = spaces_.find(space.id);
  if (it != spaces_.end()) {
    spaceIndex_.erase(it->second.name);
  }
  spaceIndex_[space.name] = space.id;
  spaces_[space.id] = std::move(space);
  return Status::OK();
}

Status MetaCache::removeSpace(const std::string& name) {
  GraphSpaceID spaceId;
  {
    std::unique_lock<folly::SharedMutex> holder(spacesLock_);
    auto it = spaceIndex_.find(name);
    if (it == spaceIndex_.end()) {
      return Status::SpaceNotFound("Space `%s' not found", name.c_str());
    }
    spaceId = it->second;
    spaces_.erase(spaceId);
    spaceIndex_.erase(it);
  }
  std::unique_lock<folly::SharedMutex> holder(leadersLock_);
  for (auto it = leaders_.begin(); it != leaders_.end();) {
    if (it->first.first == spaceId) {
      it = leaders_.erase(it);
    } else {
      ++it;
    }
  }
  return Status::OK();
}

StatusOr<GraphSpaceID> MetaCache::getSpaceIdByName(const std::string& name) {
  std::shared_lock<folly::SharedMutex> holder(spacesLock_);
  auto it = spaceIndex_.find(name);
  if (it == spaceIndex_.end()) {
    return Status::SpaceNotFound("Space `%s' not found", name.c_str());
  }
  return it->second;
}

StatusOr<EdgeType> MetaCache::getEdgeTypeByName(GraphSpaceID space, const std::string& name) {
  std::shared_lock<folly::SharedMutex> holder(spacesLock_);
  auto it = spaces_.find(space);
  if (it == spaces_.end()) {
    return Status::SpaceNotFound("Space %d not found", space);
  }
  auto edgeIt = it->second.edges.find(name);
  if (edgeIt == it->second.edges.end()) {
    return Status::EdgeNotFound("Edge `%s' not found in space %d", name.c_str(), space);
  }
  return edgeIt->second;
}

StatusOr<TagID> MetaCache::getTagIdByName(GraphSpaceID space, const std::string& name) {
  std::shared_lock<folly::SharedMutex> holder(spacesLock_);
  auto it = spaces_.find(space);
  if (it == spaces_.end()) {
    return Status::SpaceNotFound("Space %d not found", space);
  }
  auto tagIt = it->second.tags.find(name);
  if (tagIt == it->second.tags.end()) {
    return Status::TagNotFound("Tag `%s' not found in space %d", name.c_str(), space);
  }
  return tagIt->second;
}

StatusOr<int32_t> MetaCache::partsNum(GraphSpaceID space) {
  std::shared_lock<folly::SharedMutex> holder(spacesLock_);
  auto it = spaces_.find(space);
  if (it == spaces_.end()) {
    return Status::SpaceNotFound("Space %d not found", space);
  }
  return static_cast<int32_t>(it->second.parts.size());
}

StatusOr<std::vector<HostAddr>> MetaCache::getPartPeers(GraphSpaceID space, PartitionID part) {
  std::shared_lock<folly::SharedMutex> holder(spacesLock_);
  auto it = spaces_.find(space);
  if (it == spaces_.end()) {
    return Status::SpaceNotFound("Space %d not found", space);
  }
  auto partIt = it->second.parts.find(part);
  if (partIt == it->second.parts.end() || partIt->second.empty()) {
    return Status::PartNotFound("Part %d not found in space %d", part, space);
  }
  return partIt->second;
}

StatusOr<HostAddr> MetaCache::getLeader(GraphSpaceID space, PartitionID part) {
  {
    std::shared_lock<folly::SharedMutex> holder(leadersLock_);
    auto iter = leaders_.find({space, part});
    if (iter != leaders_.end()) {
      return iter->second;
    }
  }
  auto peers = getPartPeers(space, part);
  if (!peers.ok()) {
    return peers.status();
  }
  const auto& hosts = peers.value();
  std::unique_lock<folly::SharedMutex> holder(leadersLock_);
  auto iter = leaders_.find({space, part});
  if (iter != leaders_.end()) {
    return iter->second;
  }
  // no leader known, pick one in round-robin
  auto& next = pickedIndex_[{space, part}];
  auto picked = hosts[next % hosts.size()];
  next = (next + 1) % hosts.size();
  VLOG(1) << "No leader known for [" << space << ", " << part << "], pick " << picked;
  leaders_[{space, part}] = picked;
  return picked;
}

void MetaCache::updateLeader(GraphSpaceID space, PartitionID part, const HostAddr& leader) {
  VLOG(1) << "Update the leader for [" << space << ", " << part << "] to " << leader;
  std::unique_lock<folly::SharedMutex> holder(leadersLock_);
  leaders_[{space, part}] = leader;
}

void MetaCache::invalidLeader(GraphSpaceID space, PartitionID part) {
  FVLOG1("Invalidate the leader for [%d, %d]", space, part);
  std::unique_lock<folly::SharedMutex> holder(leadersLock_);
  leaders_.erase({space, part});
}

}  // namespace meta
}  // namespace graphscan
