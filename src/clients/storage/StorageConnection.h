/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef CLIENTS_STORAGE_STORAGECONNECTION_H_
#define CLIENTS_STORAGE_STORAGECONNECTION_H_

#include <folly/futures/Future.h>

#include "common/base/Base.h"
#include "common/base/StatusOr.h"
#include "common/datatypes/HostAddr.h"
#include "interface/StorageTypes.h"

namespace graphscan {
namespace storage {

/**
 * An open channel to one storage host.
 *
 * A transport level failure (connection reset, timeout, undecodable
 * frame) completes the returned future with an exception. Errors the
 * host reports for a partition come back inside the response.
 */
class StorageConnection {
 public:
  virtual ~StorageConnection() = default;

  virtual const HostAddr& address() const = 0;

  // Whether the channel can still be reused
  virtual bool isOpen() const = 0;

  virtual folly::Future<ScanResponse> future_scanEdge(const ScanEdgeRequest& req) = 0;

  virtual folly::Future<ScanResponse> future_scanVertex(const ScanVertexRequest& req) = 0;
};

/**
 * Lends out connections per host. Every connection handed out by
 * getConnection() is given back through release() exactly once.
 */
class ConnectionProvider {
 public:
  virtual ~ConnectionProvider() = default;

  virtual StatusOr<std::shared_ptr<StorageConnection>> getConnection(const HostAddr& host) = 0;

  virtual void release(const HostAddr& host, std::shared_ptr<StorageConnection> conn) = 0;
};

}  // namespace storage
}  // namespace graphscan

#endif  // CLIENTS_STORAGE_STORAGECONNECTION_H_
