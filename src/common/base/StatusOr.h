/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_BASE_STATUSOR_H_
#define COMMON_BASE_STATUSOR_H_

#include "common/base/Base.h"
#include "common/base/Status.h"

namespace graphscan {

/**
 * StatusOr<T> holds either a value of `T', or a non-OK `Status' explaining
 * why the value is absent.
 */
template <typename T>
class StatusOr final {
 public:
  template <typename U>
  friend class StatusOr;

  template <typename U>
  static constexpr bool is_status_v = std::is_same<Status, std::decay_t<U>>::value;

  // Tell if `U' is of type `StatusOr<V>'
  template <typename U>
  struct is_status_or : std::false_type {};
  template <typename V>
  struct is_status_or<StatusOr<V>> : std::true_type {};

  template <typename U>
  static constexpr bool is_status_or_v = is_status_or<std::decay_t<U>>::value;

  // Tell if `T' is initializable from `U'.
  template <typename U>
  static constexpr bool is_initializable_v = std::is_constructible<T, U>::value &&
                                             std::is_convertible<U, T>::value &&
                                             !is_status_or_v<U> && !is_status_v<U>;

  static_assert(is_copy_or_move_constructible_v<T>, "`T' must be copy/move constructible");
  static_assert(!std::is_reference<T>::value, "`T' must not be of type reference");
  static_assert(!is_status_v<T>, "`T' must not be of type `Status'");
  static_assert(!is_status_or_v<T>, "`T' must not be of type `StatusOr'");

  // A default-constructed StatusOr carries a general error until assigned
  StatusOr() : variant_(Status::Error("Uninitialized StatusOr")) {}

  // Not explicit to allow construct from a `Status', e.g. in the `return' statement
  template <typename U, std::enable_if_t<is_status_v<U>, int> = 0>
  StatusOr(U &&status)  // NOLINT
      : variant_(std::forward<U>(status)) {
    DCHECK(!std::get<Status>(variant_).ok()) << "StatusOr can't be constructed from an OK status";
  }

  // Not explicit to allow construct from a value, e.g. in the `return' statement
  template <typename U, std::enable_if_t<is_initializable_v<U>, int> = 0>
  StatusOr(U &&value)  // NOLINT
      : variant_(std::in_place_type<T>, std::forward<U>(value)) {}

  StatusOr(T &&value)  // NOLINT
      : variant_(std::in_place_type<T>, std::move(value)) {}

  StatusOr(const StatusOr &) = default;
  StatusOr(StatusOr &&) = default;
  StatusOr &operator=(const StatusOr &) = default;
  StatusOr &operator=(StatusOr &&) = default;

  template <typename U, std::enable_if_t<is_initializable_v<U>, int> = 0>
  StatusOr(StatusOr<U> &&rhs) {  // NOLINT
    if (rhs.ok()) {
      variant_.template emplace<T>(std::move(rhs).value());
    } else {
      variant_ = std::move(rhs).status();
    }
  }

  // Tell if `*this' contains a value
  bool ok() const {
    return std::holds_alternative<T>(variant_);
  }

  explicit operator bool() const {
    return ok();
  }

  // Return the associated `Status', OK if it holds a value
  Status status() const & {
    if (ok()) {
      return Status::OK();
    }
    return std::get<Status>(variant_);
  }

  Status status() && {
    if (ok()) {
      return Status::OK();
    }
    return std::move(std::get<Status>(variant_));
  }

  // `ok()' is DCHECKed
  T &value() & {
    DCHECK(ok());
    return std::get<T>(variant_);
  }

  const T &value() const & {
    DCHECK(ok());
    return std::get<T>(variant_);
  }

  // Move the associated value out, `*this' must be a rvalue
  T value() && {
    DCHECK(ok());
    return std::move(std::get<T>(variant_));
  }

 private:
  std::variant<Status, T> variant_;
};

}  // namespace graphscan

#endif  // COMMON_BASE_STATUSOR_H_
