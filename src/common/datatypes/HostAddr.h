/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_DATATYPES_HOSTADDR_H_
#define COMMON_DATATYPES_HOSTADDR_H_

#include <sstream>

#include "common/base/StatusOr.h"
#include "common/base/Types.h"

namespace graphscan {

// Host address type and utility functions
struct HostAddr {
  std::string host;
  Port port;

  HostAddr() : host(), port(0) {}
  /*
   * some one may ctor HostAddr this way : HostAddr host(0, 0)
   * C++ will compile this successfully even we don't support an (int, int) ctor
   * so, add an explicit delete ctor
   * */
  HostAddr(int h, int p) = delete;
  HostAddr(std::string h, Port p) : host(std::move(h)), port(p) {}

  // Parse "host:port"
  static StatusOr<HostAddr> fromString(folly::StringPiece str);

  bool isValid() const {
    return !host.empty() && port != 0;
  }

  void clear() {
    host.clear();
    port = 0;
  }

  std::string toString() const {
    std::stringstream os;
    os << "\"" << host << "\""
       << ":" << port;
    return os.str();
  }

  bool operator==(const HostAddr& rhs) const;

  bool operator!=(const HostAddr& rhs) const;

  bool operator<(const HostAddr& rhs) const;
};

inline std::ostream& operator<<(std::ostream& os, const HostAddr& addr) {
  return os << addr.toString();
}

}  // namespace graphscan

namespace std {

// Inject a customized hash function
template <>
struct hash<graphscan::HostAddr> {
  std::size_t operator()(const graphscan::HostAddr& h) const noexcept;
};

}  // namespace std

#endif  // COMMON_DATATYPES_HOSTADDR_H_
