#include "providers/services.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace device_agent::providers {
namespace {

std::string trim_output(const std::string& output) {
  const auto end = output.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return {};
  }
  const auto begin = output.find_first_not_of(" \t\r\n");
  return output.substr(begin, end - begin + 1);
}

}  // namespace

CommandRunner default_command_runner() {
  return [](const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
    return core::run_command(argv, timeout);
  };
}

std::string describe_failure(const std::string& program, const core::CommandResult& result) {
  if (!result.launched) {
    return program + " could not be started";
  }
  if (result.timed_out) {
    return program + " timed out";
  }
  std::string message = program + " exited with status " + std::to_string(result.exit_code);
  if (const std::string output = trim_output(result.output); !output.empty()) {
    message += ": " + output;
  }
  return message;
}

ServiceControl::ServiceControl(const ServiceManager manager, const std::chrono::milliseconds timeout,
                               CommandRunner runner)
    : manager_(manager), timeout_(timeout), runner_(std::move(runner)) {}

bool ServiceControl::valid_service_name(const std::string& service) {
  if (service.empty() || service.front() == '-') {
    return false;
  }
  return std::all_of(service.begin(), service.end(), [](const unsigned char c) {
    return std::isalnum(c) != 0 || c == '.' || c == '-' || c == '_' || c == '@';
  });
}

ServiceState ServiceControl::status(const std::string& service) const {
  ServiceState state{};
  state.service = service;
  if (!valid_service_name(service)) {
    state.state = "invalid";
    return state;
  }

  if (manager_ == ServiceManager::SYSTEMD) {
    // is-active exits non-zero for inactive units; the printed state is what matters.
    const auto result = runner_({"systemctl", "is-active", service}, timeout_);
    if (!result.launched || result.timed_out) {
      state.state = "unknown";
      return state;
    }
    state.state = trim_output(result.output);
    if (state.state.empty()) {
      state.state = "unknown";
    }
    state.active = state.state == "active";
    return state;
  }

  const auto result = runner_({"launchctl", "list", service}, timeout_);
  if (!result.launched || result.timed_out) {
    state.state = "unknown";
    return state;
  }
  state.active = result.exit_code == 0;
  state.state = state.active ? "loaded" : "not-loaded";
  return state;
}

ActionResult ServiceControl::restart(const std::string& service) const {
  if (!valid_service_name(service)) {
    return {false, "invalid service name: " + service};
  }

  const std::vector<std::string> argv = manager_ == ServiceManager::SYSTEMD
                                            ? std::vector<std::string>{"systemctl", "restart", service}
                                            : std::vector<std::string>{"launchctl", "kickstart", "-k",
                                                                       "system/" + service};
  const auto result = runner_(argv, timeout_);
  if (!result.ok()) {
    const std::string message = describe_failure(argv.front(), result);
    std::cerr << "[actions] restart " << service << " failed: " << message << '\n';
    return {false, message};
  }

  std::cerr << "[actions] restarted " << service << '\n';
  return {true, "restarted " + service};
}

SystemPlayerProvider::SystemPlayerProvider(std::string service, ServiceControl control)
    : service_(std::move(service)), control_(std::move(control)) {}

ServiceState SystemPlayerProvider::status() { return control_.status(service_); }

ActionResult SystemPlayerProvider::restart() { return control_.restart(service_); }

SystemActionProvider::SystemActionProvider(std::vector<std::string> allowed_services, ServiceControl control)
    : allowed_services_(std::move(allowed_services)), control_(std::move(control)) {}

bool SystemActionProvider::allowed(const std::string& service) const {
  return std::find(allowed_services_.begin(), allowed_services_.end(), service) != allowed_services_.end();
}

ServiceState SystemActionProvider::service_status(const std::string& service) {
  if (!allowed(service)) {
    ServiceState state{};
    state.service = service;
    state.state = "not-allowed";
    return state;
  }
  return control_.status(service);
}

ActionResult SystemActionProvider::restart_service(const std::string& service) {
  if (!allowed(service)) {
    return {false, "service not allowed: " + service};
  }
  return control_.restart(service);
}

}  // namespace device_agent::providers
