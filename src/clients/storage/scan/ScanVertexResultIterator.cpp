/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/scan/ScanVertexResultIterator.h"

namespace graphscan {
namespace storage {

// static
StatusOr<std::unique_ptr<ScanVertexResultIterator>> ScanVertexResultIterator::create(
    ScanIteratorConfig config, ScanVertexRequest request) {
  GS_RETURN_IF_ERROR(config.validate());
  if (request.spaceId != config.spaceId) {
    return Status::InvalidArgument(
        "Request is for space %d, the scan is for %d", request.spaceId, config.spaceId);
  }
  if (request.limit <= 0) {
    return Status::InvalidArgument("Limit should be positive, got %ld", request.limit);
  }
  return std::unique_ptr<ScanVertexResultIterator>(
      new ScanVertexResultIterator(std::move(config), std::move(request)));
}

ScanVertexResultIterator::ScanVertexResultIterator(ScanIteratorConfig config,
                                                   ScanVertexRequest request)
    : ScanIterator(std::move(config),
                   [tmpl = request](StorageConnection* conn, const PartScanInfo& info) {
                     auto req = tmpl;
                     req.partId = info.getPart();
                     req.cursor = info.getCursor();
                     return conn->future_scanVertex(req);
                   }),
      request_(std::move(request)) {
  processor_ = std::make_shared<VertexProcessor>(labelName());
}

StatusOr<ScanVertexResult> ScanVertexResultIterator::next() {
  auto round = nextRound();
  if (!round.ok()) {
    return round.status();
  }
  auto output = std::move(round).value();
  return ScanVertexResult(std::move(output.payloads),
                        request_.returnColumns.props,
                        output.status,
                        labelName(),
                        processor_);
}

}  // namespace storage
}  // namespace graphscan
