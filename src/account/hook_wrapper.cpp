#include <warden/account/hook_wrapper.hpp>

#include <variant>

using namespace warden::schema;

namespace warden::account {

hook_outcome_t collect_outcome(const event_log_t& events,
                               const std::size_t first_event) {
  auto outcome = hook_outcome_t{};
  for (auto i = first_event; i < events.size(); ++i) {
    std::visit(overloaded{
                   [&](const try_execute_unsuccessful_t& event) {
                     outcome.failed_units.push_back(event.index);
                   },
                   [&](const try_delegate_call_unsuccessful_t&) {
                     outcome.failed_units.push_back(0);
                   },
                   [](const auto&) {},
               },
               events[i]);
  }
  return outcome;
}

}  // namespace warden::account
