#pragma once

#include <warden/account/execution_host.hpp>
#include <warden/schema/call_result.hpp>
#include <warden/schema/primitives.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace warden::testing {

enum class call_kind_t { call, delegate_call, static_call };

struct call_record_t final {
  call_kind_t kind{call_kind_t::call};
  warden::schema::address_t target{};
  warden::schema::amount_t value{};
  warden::schema::bytes_t data;
};

/// In-memory execution host. Successful calls are appended to a journal
/// that checkpoint/rollback operate on; every attempt, successful or not,
/// is kept in `attempts()`.
///
/// Targets answer with a scripted responder, or by echoing the call data.
class fake_host final : public warden::account::execution_host {
 public:
  using responder_t =
      std::function<warden::schema::call_result_t(const call_record_t&)>;

  fake_host() = default;
  explicit fake_host(const warden::schema::address_t& delegation_target)
      : delegation_target_{delegation_target} {}

  void respond(const warden::schema::address_t& target, responder_t responder) {
    responders_[target] = std::move(responder);
  }

  void fail(const warden::schema::address_t& target,
            warden::schema::bytes_t return_data) {
    respond(target, [return_data](const call_record_t&) {
      return warden::schema::call_result_t{false, return_data};
    });
  }

  warden::schema::call_result_t call(
      const warden::schema::address_t& target,
      const warden::schema::amount_t& value,
      const warden::schema::bytes_view_t& data) override {
    return dispatch(call_record_t{call_kind_t::call, target, value,
                                  warden::schema::make_bytes(data)});
  }

  warden::schema::call_result_t delegate_call(
      const warden::schema::address_t& target,
      const warden::schema::bytes_view_t& data) override {
    return dispatch(call_record_t{call_kind_t::delegate_call, target, 0,
                                  warden::schema::make_bytes(data)});
  }

  warden::schema::call_result_t static_call(
      const warden::schema::address_t& target,
      const warden::schema::bytes_view_t& data) override {
    return dispatch(call_record_t{call_kind_t::static_call, target, 0,
                                  warden::schema::make_bytes(data)});
  }

  std::size_t checkpoint() override { return journal_.size(); }

  void rollback(const std::size_t checkpoint) override {
    ++rollbacks_;
    if (checkpoint < journal_.size()) {
      journal_.resize(checkpoint);
    }
  }

  warden::schema::address_t delegation_target() const override {
    return delegation_target_;
  }

  void set_delegation_target(const warden::schema::address_t& target) {
    delegation_target_ = target;
  }

  const std::vector<call_record_t>& journal() const { return journal_; }
  const std::vector<call_record_t>& attempts() const { return attempts_; }
  std::size_t rollbacks() const { return rollbacks_; }

 private:
  warden::schema::call_result_t dispatch(call_record_t record) {
    attempts_.push_back(record);
    auto responder = responders_.find(record.target);
    auto result = responder == std::end(responders_)
                      ? warden::schema::call_result_t{true, record.data}
                      : responder->second(record);
    if (result.success) {
      journal_.push_back(std::move(record));
    }
    return result;
  }

  std::map<warden::schema::address_t, responder_t> responders_;
  std::vector<call_record_t> journal_;
  std::vector<call_record_t> attempts_;
  std::size_t rollbacks_{};
  warden::schema::address_t delegation_target_{};
};

}  // namespace warden::testing
