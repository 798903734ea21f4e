/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_SCANEDGERESULTITERATOR_H_
#define CLIENTS_STORAGE_SCAN_SCANEDGERESULTITERATOR_H_

#include "clients/storage/scan/ScanIterator.h"

namespace graphscan {
namespace storage {

/**
 * Iterates the edges of one edge type, one round per next().
 *
 * Each partition sends a copy of the request with its own part id and
 * cursor, the rest of the request is shared by all partitions.
 */
class ScanEdgeResultIterator final : public ScanIterator {
 public:
  static StatusOr<std::unique_ptr<ScanEdgeResultIterator>> create(ScanIteratorConfig config,
                                                                  ScanEdgeRequest request);

  StatusOr<ScanEdgeResult> next();

  const ScanEdgeRequest& request() const {
    return request_;
  }

 private:
  ScanEdgeResultIterator(ScanIteratorConfig config, ScanEdgeRequest request);

  ScanEdgeRequest request_;
  std::shared_ptr<const EdgeProcessor> processor_;
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_SCANEDGERESULTITERATOR_H_
