/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_META_METAPROVIDER_H_
#define CLIENTS_META_METAPROVIDER_H_

#include "common/base/Base.h"
#include "common/base/StatusOr.h"
#include "common/base/Types.h"
#include "common/datatypes/HostAddr.h"

namespace graphscan {
namespace meta {

/**
 * The slice of the meta service a scan needs: name resolution, the
 * number of partitions, and who currently leads each partition.
 *
 * Implementations must be thread safe, leaders are refreshed from the
 * scan worker threads.
 */
class MetaProvider {
 public:
  virtual ~MetaProvider() = default;

  virtual StatusOr<GraphSpaceID> getSpaceIdByName(const std::string& name) = 0;

  virtual StatusOr<EdgeType> getEdgeTypeByName(GraphSpaceID space, const std::string& name) = 0;

  virtual StatusOr<TagID> getTagIdByName(GraphSpaceID space, const std::string& name) = 0;

  // Partitions are numbered [1, partsNum]
  virtual StatusOr<int32_t> partsNum(GraphSpaceID space) = 0;

  virtual StatusOr<HostAddr> getLeader(GraphSpaceID space, PartitionID part) = 0;

  // Called with the hint carried by E_LEADER_CHANGED
  virtual void updateLeader(GraphSpaceID space, PartitionID part, const HostAddr& leader) = 0;

  virtual void invalidLeader(GraphSpaceID space, PartitionID part) = 0;
};

}  // namespace meta
}  // namespace graphscan

#endif  // CLIENTS_META_METAPROVIDER_H_
