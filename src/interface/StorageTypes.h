/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef INTERFACE_STORAGETYPES_H_
#define INTERFACE_STORAGETYPES_H_

#include "common/base/Base.h"
#include "common/base/ErrorCode.h"
#include "common/base/Types.h"
#include "common/datatypes/DataSet.h"
#include "common/datatypes/HostAddr.h"

/**
 * Requests and responses of the storage scan interface.
 *
 * Encoding them onto the wire is the job of the StorageConnection
 * implementation, the scan engine only deals with these structs.
 */

namespace graphscan {
namespace storage {

struct PartitionResult {
  PartitionID partId{0};
  ErrorCode code{ErrorCode::SUCCEEDED};
  // Only set with E_LEADER_CHANGED, when the host knows who leads now
  std::optional<HostAddr> leader;
};

struct ResponseCommon {
  std::vector<PartitionResult> failedParts;
  int32_t latencyInUs{0};
};

struct EdgeProp {
  EdgeType type{0};
  std::vector<std::string> props;
};

struct VertexProp {
  TagID tag{0};
  std::vector<std::string> props;
};

struct ScanEdgeRequest {
  GraphSpaceID spaceId{0};
  PartitionID partId{0};
  Cursor cursor;
  EdgeProp returnColumns;
  int64_t limit{0};
  Timestamp startTime{0};
  Timestamp endTime{std::numeric_limits<Timestamp>::max()};
  // Encoded predicate, evaluated on the storage side
  std::string filter;
  bool onlyLatestVersion{false};
  bool enableReadFromFollower{true};
};

struct ScanVertexRequest {
  GraphSpaceID spaceId{0};
  PartitionID partId{0};
  Cursor cursor;
  VertexProp returnColumns;
  int64_t limit{0};
  Timestamp startTime{0};
  Timestamp endTime{std::numeric_limits<Timestamp>::max()};
  std::string filter;
  bool onlyLatestVersion{false};
  bool enableReadFromFollower{true};
};

struct ScanResponse {
  std::optional<ResponseCommon> result;
  DataSet data;
  bool hasMore{false};
  Cursor nextCursor;
};

}  // namespace storage
}  // namespace graphscan

#endif  // INTERFACE_STORAGETYPES_H_
