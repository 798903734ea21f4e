/* Copyright (c) 2020 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "common/datatypes/Value.h"

#include <cmath>

namespace graphscan {

const Value Value::kEmpty;
const Value Value::kNullValue(NullType::__NULL__);
const Value Value::kNullBadType(NullType::BAD_TYPE);

Value::Type Value::type() const {
  switch (value_.index()) {
    case 0:
      return Type::__EMPTY__;
    case 1:
      return Type::NULLVALUE;
    case 2:
      return Type::BOOL;
    case 3:
      return Type::INT;
    case 4:
      return Type::FLOAT;
    case 5:
      return Type::STRING;
  }
  LOG(FATAL) << "Unknown value index " << value_.index();
}

std::string Value::typeName() const {
  std::stringstream ss;
  ss << type();
  return ss.str();
}

NullType Value::getNull() const {
  CHECK(isNull());
  return std::get<NullType>(value_);
}

bool Value::getBool() const {
  CHECK(isBool());
  return std::get<bool>(value_);
}

int64_t Value::getInt() const {
  CHECK(isInt());
  return std::get<int64_t>(value_);
}

double Value::getFloat() const {
  CHECK(isFloat());
  return std::get<double>(value_);
}

const std::string& Value::getStr() const {
  CHECK(isStr());
  return std::get<std::string>(value_);
}

std::string Value::toString() const {
  switch (type()) {
    case Type::__EMPTY__:
      return "__EMPTY__";
    case Type::NULLVALUE: {
      switch (getNull()) {
        case NullType::__NULL__:
          return "__NULL__";
        case NullType::BAD_DATA:
          return "__NULL_BAD_DATA__";
        case NullType::BAD_TYPE:
          return "__NULL_BAD_TYPE__";
        case NullType::UNKNOWN_PROP:
          return "__NULL_UNKNOWN_PROP__";
      }
      return "__NULL__";
    }
    case Type::BOOL:
      return getBool() ? "true" : "false";
    case Type::INT:
      return folly::to<std::string>(getInt());
    case Type::FLOAT:
      return folly::to<std::string>(getFloat());
    case Type::STRING:
      return getStr();
  }
  LOG(FATAL) << "Unknown value type " << static_cast<int>(type());
}

bool Value::operator==(const Value& rhs) const {
  if (isNumeric() && rhs.isNumeric()) {
    if (isInt() && rhs.isInt()) {
      return getInt() == rhs.getInt();
    }
    double lhsVal = isInt() ? static_cast<double>(getInt()) : getFloat();
    double rhsVal = rhs.isInt() ? static_cast<double>(rhs.getInt()) : rhs.getFloat();
    return std::abs(lhsVal - rhsVal) < std::numeric_limits<double>::epsilon();
  }
  return value_ == rhs.value_;
}

std::ostream& operator<<(std::ostream& os, const Value::Type& type) {
  switch (type) {
    case Value::Type::__EMPTY__:
      return os << "__EMPTY__";
    case Value::Type::NULLVALUE:
      return os << "__NULL__";
    case Value::Type::BOOL:
      return os << "BOOL";
    case Value::Type::INT:
      return os << "INT";
    case Value::Type::FLOAT:
      return os << "FLOAT";
    case Value::Type::STRING:
      return os << "STRING";
  }
  return os << "__UNKNOWN__";
}

}  // namespace graphscan
