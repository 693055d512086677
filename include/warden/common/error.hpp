#pragma once

#include <warden/schema/account_error_code.hpp>
#include <warden/schema/primitives.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace warden::common {

/// Aborts the current account invocation with a typed reason.
///
/// The account restores its state and rolls the execution host back to the
/// invocation checkpoint before the exception leaves the public API.
class account_error : public std::runtime_error {
 public:
  explicit account_error(const warden::schema::account_error_code code)
      : std::runtime_error{std::string{warden::schema::to_string(code)}},
        code_{code} {}

  account_error(const warden::schema::account_error_code code,
                const std::string_view detail)
      : std::runtime_error{std::string{warden::schema::to_string(code)} +
                           ": " + std::string{detail}},
        code_{code} {}

  warden::schema::account_error_code code() const noexcept { return code_; }

 private:
  warden::schema::account_error_code code_;
};

/// Failure reported by a called target, propagated with its return data.
class revert_error : public std::runtime_error {
 public:
  explicit revert_error(warden::schema::bytes_t return_data)
      : std::runtime_error{"call reverted"},
        return_data_{std::move(return_data)} {}

  const warden::schema::bytes_t& return_data() const noexcept {
    return return_data_;
  }

 private:
  warden::schema::bytes_t return_data_;
};

}  // namespace warden::common
