/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_BASE_TYPES_H_
#define COMMON_BASE_TYPES_H_

#include <cstdint>
#include <string>

namespace graphscan {

using GraphSpaceID = int32_t;
using PartitionID = int32_t;
using Port = int32_t;

using TagID = int32_t;
using EdgeType = int32_t;
using EdgeRanking = int64_t;
using Timestamp = int64_t;

// Opaque resume token handed out by a storage host, empty means "from the beginning"
using Cursor = std::string;

}  // namespace graphscan

#endif  // COMMON_BASE_TYPES_H_
