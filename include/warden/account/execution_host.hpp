#pragma once

#include <warden/schema/call_result.hpp>
#include <warden/schema/primitives.hpp>

#include <cstddef>

namespace warden::account {

/// The environment the account runs in: outbound calls, journaled
/// side effects, and the identity the account currently delegates to.
class execution_host {
 public:
  virtual ~execution_host() = default;

  virtual warden::schema::call_result_t call(
      const warden::schema::address_t& target,
      const warden::schema::amount_t& value,
      const warden::schema::bytes_view_t& data) = 0;

  /// Run `target`'s code in the account's own context.
  virtual warden::schema::call_result_t delegate_call(
      const warden::schema::address_t& target,
      const warden::schema::bytes_view_t& data) = 0;

  /// Read-only call; the target must not mutate host state.
  virtual warden::schema::call_result_t static_call(
      const warden::schema::address_t& target,
      const warden::schema::bytes_view_t& data) = 0;

  /// Mark the current point of the side-effect journal.
  virtual std::size_t checkpoint() = 0;

  /// Undo every side effect recorded after `checkpoint`.
  virtual void rollback(std::size_t checkpoint) = 0;

  virtual warden::schema::address_t delegation_target() const = 0;
};

}  // namespace warden::account
