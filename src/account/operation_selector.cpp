#include <warden/account/operation_selector.hpp>
#include <warden/blake3/hash.hpp>

#include <algorithm>
#include <array>
#include <iterator>

using namespace warden::schema;

namespace warden::account {

namespace {

inline constexpr auto kTokenReceiverSelectors = std::array{
    uint32_t{0x150b7a02},  // onERC721Received
    uint32_t{0xf23a6e61},  // onERC1155Received
    uint32_t{0xbc197c81},  // onERC1155BatchReceived
};

}  // namespace

selector_t operation_selector(const std::string_view signature) {
  auto digest = warden::blake3::hash(signature);
  auto selector = selector_t{};
  std::copy_n(std::begin(digest), selector.size(), std::begin(selector));
  return selector;
}

selector_t install_module_selector() {
  static const auto selector =
      operation_selector("installModule(uint256,address,bytes)");
  return selector;
}

selector_t uninstall_module_selector() {
  static const auto selector =
      operation_selector("uninstallModule(uint256,address,bytes)");
  return selector;
}

bool is_forbidden_fallback_selector(const selector_t& selector) {
  return selector == selector_t{} || selector == install_module_selector() ||
         selector == uninstall_module_selector();
}

bool is_token_receiver_selector(const selector_t& selector) {
  auto value = selector_value(selector);
  return std::find(std::begin(kTokenReceiverSelectors),
                   std::end(kTokenReceiverSelectors),
                   value) != std::end(kTokenReceiverSelectors);
}

}  // namespace warden::account
