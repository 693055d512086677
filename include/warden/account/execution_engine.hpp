#pragma once

#include <warden/account/execution_codec.hpp>
#include <warden/account/execution_host.hpp>
#include <warden/schema/account_event.hpp>
#include <warden/schema/execution_mode.hpp>
#include <warden/schema/primitives.hpp>

#include <vector>

namespace warden::account {

/// Decodes an execution mode and runs the payload through the host.
///
/// DEFAULT execution throws `revert_error` with the target's return data on
/// the first failing unit. TRY execution records the failure as an event and
/// moves on to the next unit.
class execution_engine final {
 public:
  execution_engine(execution_host& host, warden::schema::event_log_t& events);

  /// Per-unit return data, in payload order.
  std::vector<warden::schema::bytes_t> execute(
      const warden::schema::execution_mode_t& mode,
      const warden::schema::bytes_view_t& payload);

 private:
  std::vector<warden::schema::bytes_t> execute_batch(
      const std::vector<warden::schema::execution_t>& executions,
      warden::schema::exec_type_t exec_type);

  warden::schema::bytes_t execute_unit(
      const warden::schema::execution_t& execution,
      warden::schema::exec_type_t exec_type,
      uint64_t index);

  warden::schema::bytes_t execute_delegate(
      const delegate_execution_t& execution,
      warden::schema::exec_type_t exec_type);

  execution_host& host_;
  warden::schema::event_log_t& events_;
};

}  // namespace warden::account
