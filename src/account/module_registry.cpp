#include <warden/account/module_registry.hpp>

#include <algorithm>
#include <iterator>

using namespace warden::schema;

namespace warden::account {

bool module_registry::contains(const module_type_t type,
                               const address_t& module) const {
  auto it = modules_.find(type);
  if (it == std::end(modules_)) {
    return false;
  }
  return std::find(std::begin(it->second), std::end(it->second), module) !=
         std::end(it->second);
}

bool module_registry::add(const module_type_t type, const address_t& module) {
  if (contains(type, module)) {
    return false;
  }
  modules_[type].push_back(module);
  return true;
}

bool module_registry::remove(const module_type_t type,
                             const address_t& module) {
  auto it = modules_.find(type);
  if (it == std::end(modules_)) {
    return false;
  }
  auto& members = it->second;
  auto member = std::find(std::begin(members), std::end(members), module);
  if (member == std::end(members)) {
    return false;
  }
  members.erase(member);
  if (members.empty()) {
    modules_.erase(it);
  }
  return true;
}

std::vector<address_t> module_registry::list(const module_type_t type) const {
  auto it = modules_.find(type);
  if (it == std::end(modules_)) {
    return {};
  }
  return it->second;
}

void module_registry::clear(const module_type_t type) {
  modules_.erase(type);
}

bool module_registry::empty(const module_type_t type) const {
  return modules_.find(type) == std::end(modules_);
}

std::vector<module_type_t> module_registry::categories() const {
  auto types = std::vector<module_type_t>{};
  types.reserve(modules_.size());
  for (const auto& [type, members] : modules_) {
    types.push_back(type);
  }
  return types;
}

}  // namespace warden::account
