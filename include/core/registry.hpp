#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace device_agent::core {

enum class Lifecycle : std::uint8_t {
  SINGLETON = 0,
  TRANSIENT = 1,
};

// A capability contract: an interface type plus the name it is bound under.
template <typename Interface>
struct Contract {
  const char* name;
};

template <typename Interface>
class Resolution {
 public:
  static Resolution resolved(std::shared_ptr<Interface> instance) { return Resolution(std::move(instance)); }
  static Resolution unavailable() { return Resolution(nullptr); }

  [[nodiscard]] bool available() const noexcept { return instance_ != nullptr; }
  [[nodiscard]] Interface& get() const { return *instance_; }
  [[nodiscard]] const std::shared_ptr<Interface>& shared() const noexcept { return instance_; }

 private:
  explicit Resolution(std::shared_ptr<Interface> instance) : instance_(std::move(instance)) {}

  std::shared_ptr<Interface> instance_;
};

class ServiceRegistry {
 public:
  ServiceRegistry() = default;

  ServiceRegistry(const ServiceRegistry&) = delete;
  ServiceRegistry& operator=(const ServiceRegistry&) = delete;
  ServiceRegistry(ServiceRegistry&&) = default;
  ServiceRegistry& operator=(ServiceRegistry&&) = default;

  template <typename Interface>
  void register_factory(const Contract<Interface>& contract, std::function<std::shared_ptr<Interface>()> factory,
                        Lifecycle lifecycle = Lifecycle::SINGLETON, bool allow_override = false) {
    auto binding = std::make_shared<Binding>();
    binding->interface_type = std::type_index(typeid(Interface));
    binding->lifecycle = lifecycle;
    binding->factory = [factory = std::move(factory)]() -> std::shared_ptr<void> { return factory(); };
    insert(contract.name, std::move(binding), allow_override);
  }

  template <typename Interface>
  void register_instance(const Contract<Interface>& contract, std::shared_ptr<Interface> instance,
                         bool allow_override = false) {
    auto binding = std::make_shared<Binding>();
    binding->interface_type = std::type_index(typeid(Interface));
    binding->lifecycle = Lifecycle::SINGLETON;
    binding->instance = std::move(instance);
    std::call_once(binding->created, [] {});
    insert(contract.name, std::move(binding), allow_override);
  }

  // Throws UnresolvedDependency when the contract has no binding.
  template <typename Interface>
  [[nodiscard]] std::shared_ptr<Interface> resolve(const Contract<Interface>& contract) const {
    const auto binding = find(contract.name, std::type_index(typeid(Interface)));
    if (binding == nullptr) {
      throw UnresolvedDependency(contract.name);
    }
    return std::static_pointer_cast<Interface>(instantiate(*binding));
  }

  // Capability lookup for callers that treat a missing binding as "not available here".
  template <typename Interface>
  [[nodiscard]] Resolution<Interface> lookup(const Contract<Interface>& contract) const {
    const auto binding = find(contract.name, std::type_index(typeid(Interface)));
    if (binding == nullptr) {
      return Resolution<Interface>::unavailable();
    }
    auto instance = std::static_pointer_cast<Interface>(instantiate(*binding));
    if (instance == nullptr) {
      return Resolution<Interface>::unavailable();
    }
    return Resolution<Interface>::resolved(std::move(instance));
  }

  [[nodiscard]] bool contains(const std::string& contract) const;

  // Returns the required contracts that have no binding, in the order given.
  [[nodiscard]] std::vector<std::string> validate(const std::vector<std::string>& required) const;

  // Instantiates every singleton; registration is rejected afterwards.
  void seal();

  [[nodiscard]] bool sealed() const noexcept { return sealed_; }
  [[nodiscard]] std::vector<std::string> contracts() const;

 private:
  struct Binding {
    std::type_index interface_type{typeid(void)};
    Lifecycle lifecycle{Lifecycle::SINGLETON};
    std::function<std::shared_ptr<void>()> factory{};
    mutable std::once_flag created{};
    mutable std::shared_ptr<void> instance{};
  };

  void insert(const std::string& contract, std::shared_ptr<Binding> binding, bool allow_override);
  [[nodiscard]] std::shared_ptr<const Binding> find(const std::string& contract, std::type_index interface_type) const;
  static std::shared_ptr<void> instantiate(const Binding& binding);

  std::map<std::string, std::shared_ptr<const Binding>> bindings_{};
  bool sealed_{false};
};

}  // namespace device_agent::core
