#pragma once

#include <stdexcept>
#include <string>

namespace device_agent::core {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class DuplicateRegistration : public std::runtime_error {
 public:
  explicit DuplicateRegistration(const std::string& contract)
      : std::runtime_error("contract already registered: " + contract), contract_(contract) {}

  [[nodiscard]] const std::string& contract() const noexcept { return contract_; }

 private:
  std::string contract_;
};

class UnresolvedDependency : public std::runtime_error {
 public:
  explicit UnresolvedDependency(const std::string& contract)
      : std::runtime_error("no binding for contract: " + contract), contract_(contract) {}

  [[nodiscard]] const std::string& contract() const noexcept { return contract_; }

 private:
  std::string contract_;
};

class BootstrapError : public std::runtime_error {
 public:
  explicit BootstrapError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace device_agent::core
