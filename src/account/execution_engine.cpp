#include <warden/account/execution_engine.hpp>
#include <warden/common/error.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

using namespace warden::schema;

namespace warden::account {

execution_engine::execution_engine(execution_host& host, event_log_t& events)
    : host_{host}, events_{events} {}

std::vector<bytes_t> execution_engine::execute(const execution_mode_t& mode,
                                               const bytes_view_t& payload) {
  auto decoded = decode_mode(mode);
  if (!is_supported_call_type(decoded.call_type)) {
    throw warden::common::account_error{
        account_error_code::unsupported_call_type,
        std::to_string(static_cast<uint32_t>(decoded.call_type))};
  }
  if (!is_supported_exec_type(decoded.exec_type)) {
    throw warden::common::account_error{
        account_error_code::unsupported_exec_type,
        std::to_string(static_cast<uint32_t>(decoded.exec_type))};
  }
  spdlog::debug("Executing {} payload with {} semantics",
                to_string(decoded.call_type), to_string(decoded.exec_type));

  switch (decoded.call_type) {
    case call_type_t::batch:
      return execute_batch(decode_batch(payload), decoded.exec_type);
    case call_type_t::single:
      return {execute_unit(decode_single(payload), decoded.exec_type, 0)};
    case call_type_t::delegate_call:
      return {execute_delegate(decode_delegate(payload), decoded.exec_type)};
    case call_type_t::static_call:
      break;
  }
  throw warden::common::account_error{account_error_code::unsupported_call_type};
}

std::vector<bytes_t> execution_engine::execute_batch(
    const std::vector<execution_t>& executions,
    const exec_type_t exec_type) {
  auto results = std::vector<bytes_t>{};
  results.reserve(executions.size());
  for (auto index = std::size_t{0}; index < executions.size(); ++index) {
    results.push_back(
        execute_unit(executions[index], exec_type, static_cast<uint64_t>(index)));
  }
  return results;
}

bytes_t execution_engine::execute_unit(const execution_t& execution,
                                       const exec_type_t exec_type,
                                       const uint64_t index) {
  auto result = host_.call(execution.target, execution.value,
                           make_bytes_view(execution.call_data));
  if (result.success) {
    return std::move(result.return_data);
  }
  if (exec_type == exec_type_t::default_exec) {
    throw warden::common::revert_error{std::move(result.return_data)};
  }
  spdlog::debug("Unit {} targeting {} failed under try", index,
                to_hex(execution.target));
  events_.emplace_back(try_execute_unsuccessful_t{index, result.return_data});
  return std::move(result.return_data);
}

bytes_t execution_engine::execute_delegate(
    const delegate_execution_t& execution,
    const exec_type_t exec_type) {
  auto result = host_.delegate_call(execution.target,
                                    make_bytes_view(execution.call_data));
  if (result.success) {
    return std::move(result.return_data);
  }
  if (exec_type == exec_type_t::default_exec) {
    throw warden::common::revert_error{std::move(result.return_data)};
  }
  spdlog::debug("Delegate call to {} failed under try",
                to_hex(execution.target));
  events_.emplace_back(
      try_delegate_call_unsuccessful_t{execution.call_data, result.return_data});
  return std::move(result.return_data);
}

}  // namespace warden::account
