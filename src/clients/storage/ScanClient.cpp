/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/ScanClient.h"

#include "clients/storage/GFlags.h"

namespace graphscan {
namespace storage {

ScanOptions::ScanOptions()
    : limit(FLAGS_scan_default_limit),
      enableReadFromFollower(FLAGS_scan_enable_read_from_follower),
      partsPerHost(FLAGS_scan_parts_per_host) {}

ScanClient::ScanClient(std::shared_ptr<meta::MetaProvider> metaProvider,
                       std::shared_ptr<ConnectionProvider> connProvider,
                       std::shared_ptr<folly::Executor> executor)
    : metaProvider_(std::move(metaProvider)),
      connProvider_(std::move(connProvider)),
      executor_(std::move(executor)) {
  CHECK(metaProvider_ != nullptr);
  CHECK(connProvider_ != nullptr);
}

StatusOr<std::unique_ptr<ScanEdgeResultIterator>> ScanClient::scanEdge(
    const std::string& spaceName,
    const std::string& edgeName,
    const std::vector<std::string>& returnCols,
    const ScanOptions& options) {
  auto spaceRet = metaProvider_->getSpaceIdByName(spaceName);
  if (!spaceRet.ok()) {
    LOG(ERROR) << "Space " << spaceName << " not found: " << spaceRet.status();
    return spaceRet.status();
  }
  auto spaceId = spaceRet.value();
  auto edgeRet = metaProvider_->getEdgeTypeByName(spaceId, edgeName);
  if (!edgeRet.ok()) {
    LOG(ERROR) << "Edge " << edgeName << " not found in " << spaceName << ": "
               << edgeRet.status();
    return edgeRet.status();
  }

  auto config = prepare(spaceId, spaceName, edgeName, options);
  if (!config.ok()) {
    return config.status();
  }

  ScanEdgeRequest req;
  fillRequest(req, spaceId, options);
  req.returnColumns.type = edgeRet.value();
  req.returnColumns.props = {kSrc, kType, kRank, kDst};
  auto& props = req.returnColumns.props;
  props.insert(props.end(), returnCols.begin(), returnCols.end());
  return ScanEdgeResultIterator::create(std::move(config).value(), std::move(req));
}

StatusOr<std::unique_ptr<ScanVertexResultIterator>> ScanClient::scanVertex(
    const std::string& spaceName,
    const std::string& tagName,
    const std::vector<std::string>& returnCols,
    const ScanOptions& options) {
  auto spaceRet = metaProvider_->getSpaceIdByName(spaceName);
  if (!spaceRet.ok()) {
    LOG(ERROR) << "Space " << spaceName << " not found: " << spaceRet.status();
    return spaceRet.status();
  }
  auto spaceId = spaceRet.value();
  auto tagRet = metaProvider_->getTagIdByName(spaceId, tagName);
  if (!tagRet.ok()) {
    LOG(ERROR) << "Tag " << tagName << " not found in " << spaceName << ": " << tagRet.status();
    return tagRet.status();
  }

  auto config = prepare(spaceId, spaceName, tagName, options);
  if (!config.ok()) {
    return config.status();
  }

  ScanVertexRequest req;
  fillRequest(req, spaceId, options);
  req.returnColumns.tag = tagRet.value();
  req.returnColumns.props = {kVid};
  auto& props = req.returnColumns.props;
  props.insert(props.end(), returnCols.begin(), returnCols.end());
  return ScanVertexResultIterator::create(std::move(config).value(), std::move(req));
}

StatusOr<ScanIteratorConfig> ScanClient::prepare(GraphSpaceID spaceId,
                                                 const std::string& spaceName,
                                                 const std::string& labelName,
                                                 const ScanOptions& options) {
  auto numRet = metaProvider_->partsNum(spaceId);
  if (!numRet.ok()) {
    return numRet.status();
  }
  auto partsNum = numRet.value();

  std::vector<PartitionID> parts = options.parts;
  if (parts.empty()) {
    for (PartitionID part = 1; part <= partsNum; ++part) {
      parts.emplace_back(part);
    }
  }

  ScanIteratorConfig config;
  std::set<HostAddr> hosts;
  for (auto part : parts) {
    if (part <= 0 || part > partsNum) {
      return Status::PartNotFound(
          "Part %d not in space %s, which has %d parts", part, spaceName.c_str(), partsNum);
    }
    auto leader = metaProvider_->getLeader(spaceId, part);
    if (!leader.ok()) {
      LOG(ERROR) << "No leader for part " << part << " of " << spaceName << ": "
                 << leader.status();
      return leader.status();
    }
    hosts.emplace(leader.value());
    config.parts.emplace_back(part, std::move(leader).value());
  }

  config.metaProvider = metaProvider_;
  config.connProvider = connProvider_;
  config.executor = executor_;
  config.addresses.assign(hosts.begin(), hosts.end());
  config.spaceId = spaceId;
  config.spaceName = spaceName;
  config.labelName = labelName;
  config.partialSuccessAllowed = options.partialSuccessAllowed;
  config.partsPerHost = options.partsPerHost;
  return config;
}

}  // namespace storage
}  // namespace graphscan
