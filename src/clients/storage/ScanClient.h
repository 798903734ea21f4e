/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCANCLIENT_H_
#define CLIENTS_STORAGE_SCANCLIENT_H_

#include "clients/meta/MetaProvider.h"
#include "clients/storage/StorageConnection.h"
#include "clients/storage/scan/ScanEdgeResultIterator.h"
#include "clients/storage/scan/ScanVertexResultIterator.h"
#include "common/base/Base.h"
#include "common/base/StatusOr.h"

namespace graphscan {
namespace storage {

struct ScanOptions {
  // Defaults come from the command line flags
  ScanOptions();

  // Rows fetched per partition in one round
  int64_t limit;
  Timestamp startTime{0};
  Timestamp endTime{std::numeric_limits<Timestamp>::max()};
  std::string filter;
  bool onlyLatestVersion{false};
  bool enableReadFromFollower;
  bool partialSuccessAllowed{false};
  int32_t partsPerHost;
  // Partitions to scan, all partitions of the space when empty
  std::vector<PartitionID> parts;
};

/**
 * Entry point of the scans, resolves the names through the meta provider
 * and sets up an iterator starting from the current partition leaders.
 */
class ScanClient final {
 public:
  ScanClient(std::shared_ptr<meta::MetaProvider> metaProvider,
             std::shared_ptr<ConnectionProvider> connProvider,
             std::shared_ptr<folly::Executor> executor = nullptr);

  // Scan edges of `edgeName', the key columns always come first
  StatusOr<std::unique_ptr<ScanEdgeResultIterator>> scanEdge(
      const std::string& spaceName,
      const std::string& edgeName,
      const std::vector<std::string>& returnCols,
      const ScanOptions& options = ScanOptions());

  StatusOr<std::unique_ptr<ScanVertexResultIterator>> scanVertex(
      const std::string& spaceName,
      const std::string& tagName,
      const std::vector<std::string>& returnCols,
      const ScanOptions& options = ScanOptions());

 private:
  StatusOr<ScanIteratorConfig> prepare(GraphSpaceID spaceId,
                                       const std::string& spaceName,
                                       const std::string& labelName,
                                       const ScanOptions& options);

  template <typename Request>
  void fillRequest(Request& req, GraphSpaceID spaceId, const ScanOptions& options) const {
    req.spaceId = spaceId;
    req.limit = options.limit;
    req.startTime = options.startTime;
    req.endTime = options.endTime;
    req.filter = options.filter;
    req.onlyLatestVersion = options.onlyLatestVersion;
    req.enableReadFromFollower = options.enableReadFromFollower;
  }

 private:
  std::shared_ptr<meta::MetaProvider> metaProvider_;
  std::shared_ptr<ConnectionProvider> connProvider_;
  std::shared_ptr<folly::Executor> executor_;
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCANCLIENT_H_
