/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_SCAN_SCANVERTEXRESULTITERATOR_H_
#define CLIENTS_STORAGE_SCAN_SCANVERTEXRESULTITERATOR_H_

#include "clients/storage/scan/ScanIterator.h"

namespace graphscan {
namespace storage {

/**
 * Iterates the vertices of one tag, one round per next().
 *
 * Each partition sends a copy of the request with its own part id and
 * cursor, the rest of the request is shared by all partitions.
 */
class ScanVertexResultIterator final : public ScanIterator {
 public:
  static StatusOr<std::unique_ptr<ScanVertexResultIterator>> create(ScanIteratorConfig config,
                                                                  ScanVertexRequest request);

  StatusOr<ScanVertexResult> next();

  const ScanVertexRequest& request() const {
    return request_;
  }

 private:
  ScanVertexResultIterator(ScanIteratorConfig config, ScanVertexRequest request);

  ScanVertexRequest request_;
  std::shared_ptr<const VertexProcessor> processor_;
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_SCAN_SCANVERTEXRESULTITERATOR_H_
