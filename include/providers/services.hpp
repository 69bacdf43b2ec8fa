#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/command.hpp"

namespace device_agent::providers {

using CommandRunner =
    std::function<core::CommandResult(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)>;

CommandRunner default_command_runner();

std::string describe_failure(const std::string& program, const core::CommandResult& result);

enum class ServiceManager : std::uint8_t {
  SYSTEMD = 0,
  LAUNCHD = 1,
};

struct ServiceState {
  std::string service{};
  bool active{false};
  std::string state{};
};

struct ActionResult {
  bool ok{false};
  std::string message{};
};

class PlayerProvider {
 public:
  virtual ~PlayerProvider() = default;

  virtual ServiceState status() = 0;
  virtual ActionResult restart() = 0;
};

class ActionProvider {
 public:
  virtual ~ActionProvider() = default;

  virtual ServiceState service_status(const std::string& service) = 0;
  virtual ActionResult restart_service(const std::string& service) = 0;
};

// Talks to systemctl or launchctl. Unit names are restricted to a safe
// character set before they reach argv.
class ServiceControl {
 public:
  ServiceControl(ServiceManager manager, std::chrono::milliseconds timeout, CommandRunner runner);

  ServiceState status(const std::string& service) const;
  ActionResult restart(const std::string& service) const;

  [[nodiscard]] static bool valid_service_name(const std::string& service);

 private:
  ServiceManager manager_;
  std::chrono::milliseconds timeout_;
  CommandRunner runner_;
};

class SystemPlayerProvider final : public PlayerProvider {
 public:
  SystemPlayerProvider(std::string service, ServiceControl control);

  ServiceState status() override;
  ActionResult restart() override;

 private:
  std::string service_;
  ServiceControl control_;
};

// Only services named in the allow-list can be inspected or restarted.
class SystemActionProvider final : public ActionProvider {
 public:
  SystemActionProvider(std::vector<std::string> allowed_services, ServiceControl control);

  ServiceState service_status(const std::string& service) override;
  ActionResult restart_service(const std::string& service) override;

 private:
  [[nodiscard]] bool allowed(const std::string& service) const;

  std::vector<std::string> allowed_services_;
  ServiceControl control_;
};

}  // namespace device_agent::providers
