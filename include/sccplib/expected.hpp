#pragma once

#include <system_error>
#include <utility>

namespace sccplib {

template<typename T, typename E = std::error_code>
class Result {
public:
  Result(const T& value) : ok_(true), value_(value) {}
  Result(T&& value) : ok_(true), value_(std::move(value)) {}
  Result(E error) : ok_(false), error_(std::move(error)) {}

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }
  const T& value() const { return value_; }
  T& value() { return value_; }
  const E& error() const { return error_; }

private:
  bool ok_ = false;
  T value_{};
  E error_{};
};

} // namespace sccplib
