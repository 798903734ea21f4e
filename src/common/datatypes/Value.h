/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_DATATYPES_VALUE_H_
#define COMMON_DATATYPES_VALUE_H_

#include "common/base/Base.h"

namespace graphscan {

enum class NullType {
  __NULL__ = 0,
  BAD_DATA = 1,
  BAD_TYPE = 2,
  UNKNOWN_PROP = 3,
};

/**
 * The scalar cell of a scanned row. A storage host only hands back
 * property values, so the container kinds are left out.
 */
struct Value {
  static const Value kEmpty;
  static const Value kNullValue;
  static const Value kNullBadType;

  enum class Type : uint8_t {
    __EMPTY__ = 1,
    BOOL = 1 << 1,
    INT = 1 << 2,
    FLOAT = 1 << 3,
    STRING = 1 << 4,
    NULLVALUE = 1 << 7,
  };

  Value() = default;
  Value(const Value& rhs) = default;
  Value(Value&& rhs) noexcept = default;
  Value& operator=(const Value& rhs) = default;
  Value& operator=(Value&& rhs) noexcept = default;

  // Disable pointer ctors except the char*, or they would decay to bool
  template <typename T>
  Value(T*) = delete;                    // NOLINT
  Value(const std::nullptr_t) = delete;  // NOLINT
  Value(NullType v) : value_(v) {}       // NOLINT
  Value(bool v) : value_(v) {}           // NOLINT
  Value(int8_t v) : value_(static_cast<int64_t>(v)) {}   // NOLINT
  Value(int16_t v) : value_(static_cast<int64_t>(v)) {}  // NOLINT
  Value(int32_t v) : value_(static_cast<int64_t>(v)) {}  // NOLINT
  Value(int64_t v) : value_(v) {}        // NOLINT
  Value(double v) : value_(v) {}         // NOLINT
  Value(const std::string& v) : value_(v) {}  // NOLINT
  Value(std::string&& v) : value_(std::move(v)) {}  // NOLINT
  Value(const char* v) : value_(std::string(v)) {}  // NOLINT

  Type type() const;
  std::string typeName() const;

  bool empty() const {
    return type() == Type::__EMPTY__;
  }
  bool isNull() const {
    return type() == Type::NULLVALUE;
  }
  bool isBool() const {
    return type() == Type::BOOL;
  }
  bool isInt() const {
    return type() == Type::INT;
  }
  bool isFloat() const {
    return type() == Type::FLOAT;
  }
  bool isNumeric() const {
    return isInt() || isFloat();
  }
  bool isStr() const {
    return type() == Type::STRING;
  }

  NullType getNull() const;
  bool getBool() const;
  int64_t getInt() const;
  double getFloat() const;
  const std::string& getStr() const;

  std::string toString() const;

  bool operator==(const Value& rhs) const;
  bool operator!=(const Value& rhs) const {
    return !(*this == rhs);
  }

 private:
  std::variant<std::monostate, NullType, bool, int64_t, double, std::string> value_;
};

std::ostream& operator<<(std::ostream& os, const Value::Type& type);

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
  return os << value.toString();
}

}  // namespace graphscan

#endif  // COMMON_DATATYPES_VALUE_H_
