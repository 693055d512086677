#pragma once

#include <warden/account/module.hpp>
#include <warden/account/module_directory.hpp>
#include <warden/schema/account_event.hpp>
#include <warden/schema/primitives.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>

namespace warden::account {

/// Failed TRY units recorded in `events` from `first_event` onwards.
hook_outcome_t collect_outcome(const warden::schema::event_log_t& events,
                               std::size_t first_event);

/// Bracket `body` with the installed hook's pre_check and post_check.
///
/// Without a hook this is a passthrough. The hook is resolved once, before
/// the body runs, so a body that uninstalls the hook still reports back to
/// it. When the body throws the post_check is skipped and the exception
/// propagates; the enclosing invocation rolls everything back.
template <typename Body>
auto with_hook(const std::optional<warden::schema::address_t>& hook,
               module_directory& directory,
               const warden::schema::event_log_t& events,
               const call_context_t& context,
               Body&& body) -> std::invoke_result_t<Body> {
  if (!hook) {
    return std::forward<Body>(body)();
  }

  auto hook_impl = resolve<hook_module>(directory, *hook);
  spdlog::debug("Running pre-check of hook {}", warden::schema::to_hex(*hook));
  auto token = hook_impl->pre_check(context);
  auto first_event = events.size();

  if constexpr (std::is_void_v<std::invoke_result_t<Body>>) {
    std::forward<Body>(body)();
    hook_impl->post_check(warden::schema::make_bytes_view(token),
                          collect_outcome(events, first_event));
  } else {
    auto result = std::forward<Body>(body)();
    hook_impl->post_check(warden::schema::make_bytes_view(token),
                          collect_outcome(events, first_event));
    return result;
  }
}

}  // namespace warden::account
