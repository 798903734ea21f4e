/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "clients/storage/StorageConnPool.h"

#include <folly/ScopeGuard.h>

#include "clients/storage/GFlags.h"

namespace graphscan {
namespace storage {

StorageConnPool::StorageConnPool(ConnectionFactory factory)
    : StorageConnPool(std::move(factory), FLAGS_storage_conn_max_per_host) {}

StorageConnPool::StorageConnPool(ConnectionFactory factory, int32_t maxConnsPerHost)
    : factory_(std::move(factory)), maxConnsPerHost_(maxConnsPerHost) {
  CHECK(!!factory_);
  CHECK_GT(maxConnsPerHost_, 0);
}

StorageConnPool::~StorageConnPool() {
  VLOG(3) << "~StorageConnPool";
  close();
}

StatusOr<std::shared_ptr<StorageConnection>> StorageConnPool::getConnection(
    const HostAddr& host) {
  {
    std::lock_guard<std::mutex> g(lock_);
    if (closed_) {
      return Status::NoConnection("Connection pool is closed");
    }
    auto& slot = slots_[host];
    while (!slot.idle.empty()) {
      auto conn = std::move(slot.idle.back());
      slot.idle.pop_back();
      if (conn->isOpen()) {
        ++slot.active;
        return conn;
      }
      FVLOG2("Discard a closed idle connection to %s", host.toString().c_str());
    }
    if (slot.active >= maxConnsPerHost_) {
      return Status::NoConnection(
          "Too many connections to %s, limit %d", host.toString().c_str(), maxConnsPerHost_);
    }
    // Reserve the slot, the connection is opened outside the lock
    ++slot.active;
  }

  // Give the slot back unless a connection leaves the pool, the factory
  // may also throw
  auto unreserve = folly::makeGuard([this, &host]() {
    std::lock_guard<std::mutex> g(lock_);
    --slots_[host].active;
  });
  auto conn = factory_(host);
  if (!conn.ok()) {
    LOG(ERROR) << "Failed to connect to " << host << ": " << conn.status();
    return Status::NoConnection(conn.status().toString());
  }
  if (conn.value() == nullptr) {
    LOG(ERROR) << "Got no connection to " << host;
    return Status::NoConnection("No connection to %s", host.toString().c_str());
  }
  unreserve.dismiss();
  VLOG(2) << "Opened a new connection to " << host;
  return conn;
}

void StorageConnPool::release(const HostAddr& host, std::shared_ptr<StorageConnection> conn) {
  std::lock_guard<std::mutex> g(lock_);
  auto it = slots_.find(host);
  if (it == slots_.end() || it->second.active <= 0) {
    LOG(ERROR) << "Release a connection to " << host << " which is not borrowed";
    return;
  }
  auto& slot = it->second;
  --slot.active;
  if (closed_ || conn == nullptr || !conn->isOpen()) {
    return;
  }
  if (static_cast<int32_t>(slot.idle.size()) < maxConnsPerHost_) {
    slot.idle.emplace_back(std::move(conn));
  }
}

void StorageConnPool::close() {
  std::lock_guard<std::mutex> g(lock_);
  closed_ = true;
  for (auto& slot : slots_) {
    slot.second.idle.clear();
  }
}

int32_t StorageConnPool::numActive(const HostAddr& host) const {
  std::lock_guard<std::mutex> g(lock_);
  auto it = slots_.find(host);
  return it == slots_.end() ? 0 : it->second.active;
}

int32_t StorageConnPool::numIdle(const HostAddr& host) const {
  std::lock_guard<std::mutex> g(lock_);
  auto it = slots_.find(host);
  return it == slots_.end() ? 0 : static_cast<int32_t>(it->second.idle.size());
}

}  // namespace storage
}  // namespace graphscan
