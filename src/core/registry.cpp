#include "core/registry.hpp"

#include <iostream>
#include <stdexcept>

namespace device_agent::core {

bool ServiceRegistry::contains(const std::string& contract) const {
  return bindings_.find(contract) != bindings_.end();
}

std::vector<std::string> ServiceRegistry::validate(const std::vector<std::string>& required) const {
  std::vector<std::string> missing;
  for (const auto& contract : required) {
    if (!contains(contract)) {
      missing.push_back(contract);
    }
  }
  return missing;
}

void ServiceRegistry::seal() {
  for (const auto& [name, binding] : bindings_) {
    if (binding->lifecycle == Lifecycle::SINGLETON && instantiate(*binding) == nullptr) {
      std::cerr << "[registry] singleton factory for " << name << " produced no instance\n";
    }
  }
  sealed_ = true;
}

std::vector<std::string> ServiceRegistry::contracts() const {
  std::vector<std::string> names;
  names.reserve(bindings_.size());
  for (const auto& [name, _] : bindings_) {
    names.push_back(name);
  }
  return names;
}

void ServiceRegistry::insert(const std::string& contract, std::shared_ptr<Binding> binding, const bool allow_override) {
  if (sealed_) {
    throw std::logic_error("registry is sealed; cannot register " + contract);
  }

  const auto it = bindings_.find(contract);
  if (it != bindings_.end() && !allow_override) {
    throw DuplicateRegistration(contract);
  }

  bindings_[contract] = std::move(binding);
}

std::shared_ptr<const ServiceRegistry::Binding> ServiceRegistry::find(const std::string& contract,
                                                                     const std::type_index interface_type) const {
  const auto it = bindings_.find(contract);
  if (it == bindings_.end()) {
    return nullptr;
  }
  if (it->second->interface_type != interface_type) {
    throw std::logic_error("contract " + contract + " is bound to a different interface");
  }
  return it->second;
}

std::shared_ptr<void> ServiceRegistry::instantiate(const Binding& binding) {
  if (binding.lifecycle == Lifecycle::TRANSIENT) {
    return binding.factory();
  }

  std::call_once(binding.created, [&binding] { binding.instance = binding.factory(); });
  return binding.instance;
}

}  // namespace device_agent::core
