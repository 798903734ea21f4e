/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "common/datatypes/HostAddr.h"

#include <folly/hash/Hash.h>

namespace graphscan {

// static
StatusOr<HostAddr> HostAddr::fromString(folly::StringPiece str) {
  auto trimmed = folly::trimWhitespace(str);
  auto pos = trimmed.rfind(':');
  if (pos == folly::StringPiece::npos || pos == 0 || pos + 1 == trimmed.size()) {
    return Status::InvalidArgument("Bad host address `%s'", str.str().c_str());
  }
  auto port = folly::tryTo<Port>(trimmed.subpiece(pos + 1));
  if (port.hasError() || port.value() <= 0 || port.value() > 65535) {
    return Status::InvalidArgument("Bad port in host address `%s'", str.str().c_str());
  }
  return HostAddr(trimmed.subpiece(0, pos).str(), port.value());
}

bool HostAddr::operator==(const HostAddr& rhs) const {
  return host == rhs.host && port == rhs.port;
}

bool HostAddr::operator!=(const HostAddr& rhs) const {
  return !(*this == rhs);
}

bool HostAddr::operator<(const HostAddr& rhs) const {
  if (host == rhs.host) {
    return port < rhs.port;
  }
  return host < rhs.host;
}

}  // namespace graphscan

namespace std {

// Inject a customized hash function
std::size_t hash<graphscan::HostAddr>::operator()(const graphscan::HostAddr& h) const noexcept {
  uint64_t code = folly::hash::fnv32_buf(h.host.data(), h.host.size());
  code <<= 32;
  code |= folly::hash::fnv32_buf(&(h.port), sizeof(graphscan::Port));
  return code;
}

}  // namespace std
