/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/scan/RecordProcessor.h"

namespace graphscan {
namespace storage {

namespace {

bool isVid(const Value& v) {
  return v.isStr() || v.isInt();
}

std::string rowToString(const Row& row) {
  std::vector<std::string> cells;
  cells.reserve(row.size());
  for (const auto& v : row.values) {
    cells.emplace_back(v.toString());
  }
  return folly::join("|", cells);
}

}  // namespace

StatusOr<std::vector<EdgeRow>> EdgeProcessor::decode(const DataSet& data) const {
  auto srcIdx = keyIndex(data, kSrc);
  auto typeIdx = keyIndex(data, kType);
  auto rankIdx = keyIndex(data, kRank);
  auto dstIdx = keyIndex(data, kDst);
  if (srcIdx < 0 || typeIdx < 0 || rankIdx < 0 || dstIdx < 0) {
    return Status::Error("Edge `%s' dataset misses key columns, got [%s]",
                         label().c_str(),
                         folly::join(", ", data.colNames).c_str());
  }

  std::vector<std::pair<size_t, std::string>> propCols;
  for (size_t i = 0; i < data.colNames.size(); ++i) {
    auto idx = static_cast<int64_t>(i);
    if (idx == srcIdx || idx == typeIdx || idx == rankIdx || idx == dstIdx) {
      continue;
    }
    propCols.emplace_back(i, propName(data.colNames[i]));
  }

  std::vector<EdgeRow> edges;
  edges.reserve(data.rowSize());
  for (size_t r = 0; r < data.rows.size(); ++r) {
    const auto& row = data.rows[r];
    if (row.size() != data.colSize()) {
      return Status::Error("Row %zu of edge `%s' has %zu values, expect %zu",
                           r,
                           label().c_str(),
                           row.size(),
                           data.colSize());
    }
    const auto& src = row[srcIdx];
    const auto& dst = row[dstIdx];
    const auto& type = row[typeIdx];
    const auto& rank = row[rankIdx];
    if (!isVid(src) || !isVid(dst) || !type.isInt() || !rank.isInt()) {
      return Status::Error("Row %zu of edge `%s' has bad key values: %s",
                           r,
                           label().c_str(),
                           rowToString(row).c_str());
    }
    EdgeRow edge;
    edge.srcId = src;
    edge.dstId = dst;
    edge.type = static_cast<EdgeType>(type.getInt());
    edge.rank = rank.getInt();
    edge.props.reserve(propCols.size());
    for (const auto& col : propCols) {
      edge.props.emplace_back(col.second, row[col.first]);
    }
    edges.emplace_back(std::move(edge));
  }
  return edges;
}

StatusOr<std::vector<VertexRow>> VertexProcessor::decode(const DataSet& data) const {
  auto vidIdx = keyIndex(data, kVid);
  if (vidIdx < 0) {
    return Status::Error("Tag `%s' dataset misses the vid column, got [%s]",
                         label().c_str(),
                         folly::join(", ", data.colNames).c_str());
  }

  std::vector<std::pair<size_t, std::string>> propCols;
  for (size_t i = 0; i < data.colNames.size(); ++i) {
    if (static_cast<int64_t>(i) != vidIdx) {
      propCols.emplace_back(i, propName(data.colNames[i]));
    }
  }

  std::vector<VertexRow> vertices;
  vertices.reserve(data.rowSize());
  for (size_t r = 0; r < data.rows.size(); ++r) {
    const auto& row = data.rows[r];
    if (row.size() != data.colSize()) {
      return Status::Error("Row %zu of tag `%s' has %zu values, expect %zu",
                           r,
                           label().c_str(),
                           row.size(),
                           data.colSize());
    }
    if (!isVid(row[vidIdx])) {
      return Status::Error("Row %zu of tag `%s' has a bad vid: %s",
                           r,
                           label().c_str(),
                           row[vidIdx].toString().c_str());
    }
    VertexRow vertex;
    vertex.vid = row[vidIdx];
    vertex.props.reserve(propCols.size());
    for (const auto& col : propCols) {
      vertex.props.emplace_back(col.second, row[col.first]);
    }
    vertices.emplace_back(std::move(vertex));
  }
  return vertices;
}

}  // namespace storage
}  // namespace graphscan
