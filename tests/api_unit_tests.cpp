#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/jsonrpc.hpp"
#include "api/methods.hpp"
#include "api/server.hpp"
#include "core/command.hpp"
#include "core/context.hpp"
#include "core/factory_registry.hpp"
#include "providers/contracts.hpp"
#include "providers/screenshot.hpp"

using device_agent::api::Server;
using device_agent::api::build_method_table;
using device_agent::core::BindingContext;
using device_agent::core::DetectorPaths;
using device_agent::core::DeviceContext;
using device_agent::core::FactoryRegistry;
using device_agent::core::PlatformDetector;
using device_agent::core::PlatformIdentity;
using device_agent::core::ServiceConfig;
using device_agent::core::ServiceRegistry;
using device_agent::model::RawMetricSample;

namespace api = device_agent::api;
namespace core = device_agent::core;
namespace providers = device_agent::providers;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class FixedProvider final : public providers::HealthProvider {
 public:
  FixedProvider(const char* key, double value) : key_(key), value_(value) {}
  const char* name() const override { return key_; }
  bool collect(RawMetricSample& sample) override {
    sample.set(key_, value_);
    return true;
  }

 private:
  const char* key_;
  double value_;
};

class FakeCamera final : public providers::CameraProvider {
 public:
  std::vector<providers::CameraDevice> inventory() override { return {{"/dev/video0", "USB Camera"}}; }
};

struct CommandLog {
  std::vector<std::vector<std::string>> calls{};
};

std::unique_ptr<DeviceContext> make_context(const std::shared_ptr<CommandLog>& log) {
  FactoryRegistry factories;
  factories.add(PlatformIdentity::DESKTOP,
                {[log](ServiceRegistry& registry, const BindingContext& context) {
                   registry.register_instance<providers::HealthProvider>(
                       providers::kCpuHealth, std::make_shared<FixedProvider>("cpu_percent", 90.0));
                   registry.register_instance<providers::HealthProvider>(
                       providers::kMemoryHealth, std::make_shared<FixedProvider>("memory_percent", 40.0));
                   registry.register_instance<providers::HealthProvider>(
                       providers::kDiskHealth, std::make_shared<FixedProvider>("disk_percent", 30.0));
                   registry.register_instance<providers::HealthProvider>(
                       providers::kUptimeHealth, std::make_shared<FixedProvider>("uptime_seconds", 7200.0));
                   registry.register_instance<providers::CameraProvider>(providers::kCamera,
                                                                         std::make_shared<FakeCamera>());

                   const providers::CommandRunner runner = [log](const std::vector<std::string>& argv,
                                                                 std::chrono::milliseconds) {
                     log->calls.push_back(argv);
                     core::CommandResult result{};
                     result.launched = true;
                     result.exit_code = 0;
                     result.output = "active\n";
                     return result;
                   };
                   registry.register_instance<providers::ActionProvider>(
                       providers::kActions,
                       std::make_shared<providers::SystemActionProvider>(
                           context.config.allowed_services,
                           providers::ServiceControl(providers::ServiceManager::SYSTEMD, std::chrono::seconds(1),
                                                     runner)));
                 },
                 {"health.cpu", "health.memory", "health.disk", "health.uptime", "camera", "actions"}});

  ServiceConfig config{};
  config.platform_override = "desktop";
  config.allowed_services = {"kiosk.service"};
  return DeviceContext::bootstrap(
      config, PlatformDetector(DetectorPaths{"/nonexistent/model", "/nonexistent/chassis", "/nonexistent/marker"}),
      factories);
}

nlohmann::json call(const Server& server, const std::string& method, const nlohmann::json& params = nullptr) {
  nlohmann::json request{{"jsonrpc", "2.0"}, {"id", 7}, {"method", method}};
  if (!params.is_null()) {
    request["params"] = params;
  }
  bool should_respond = true;
  return server.handle_request(request, should_respond);
}

int test_platform_and_capabilities() {
  auto log = std::make_shared<CommandLog>();
  auto context = make_context(log);
  const Server server(build_method_table(*context));

  const auto info = call(server, "platform/info");
  if (info["result"]["platform"] != "desktop" || info["result"]["overridden"] != true || info["id"] != 7) {
    return fail("test_platform_and_capabilities", "platform/info mismatch");
  }

  const auto caps = call(server, "capabilities/list")["result"];
  if (caps["camera"] != true || caps["actions"] != true || caps["screenshot"] != false || caps["player"] != false) {
    return fail("test_platform_and_capabilities", "capabilities mismatch");
  }
  return 0;
}

int test_health_endpoints() {
  auto log = std::make_shared<CommandLog>();
  auto context = make_context(log);
  const Server server(build_method_table(*context));

  const auto raw = call(server, "health/raw")["result"];
  if (raw["cpu_percent"] != 90.0 || raw["uptime_seconds"] != 7200 || raw["platform"] != "desktop" ||
      raw["sources"]["health.disk"] != "ok") {
    return fail("test_health_endpoints", "health/raw mismatch");
  }

  const auto summary = call(server, "health/summary")["result"];
  if (summary["score"] != 85 || summary["status"] != "degraded" || summary["contributing_factors"].size() != 1U ||
      summary["contributing_factors"][0]["factor"] != "cpu") {
    return fail("test_health_endpoints", "health/summary mismatch");
  }

  const auto invalidated = call(server, "health/invalidate")["result"];
  if (invalidated["invalidated"] != true || context->metrics().stats().collection_cycles != 1U) {
    return fail("test_health_endpoints", "invalidate mismatch");
  }
  (void)call(server, "health/raw");
  if (context->metrics().stats().collection_cycles != 2U) {
    return fail("test_health_endpoints", "collect after invalidate should refresh");
  }
  return 0;
}

int test_unbound_capability_maps_to_unavailable_error() {
  auto log = std::make_shared<CommandLog>();
  auto context = make_context(log);
  const Server server(build_method_table(*context));

  const auto screenshot = call(server, "screenshot/capture");
  if (screenshot["error"]["code"] != api::kCapabilityUnavailable) {
    return fail("test_unbound_capability_maps_to_unavailable_error", "screenshot should be unavailable");
  }
  const auto player = call(server, "player/status");
  if (player["error"]["code"] != api::kCapabilityUnavailable) {
    return fail("test_unbound_capability_maps_to_unavailable_error", "player should be unavailable");
  }

  const auto camera = call(server, "camera/inventory")["result"];
  if (camera["count"] != 1 || camera["devices"][0]["node"] != "/dev/video0") {
    return fail("test_unbound_capability_maps_to_unavailable_error", "camera inventory mismatch");
  }
  return 0;
}

int test_actions_respect_allow_list() {
  auto log = std::make_shared<CommandLog>();
  auto context = make_context(log);
  const Server server(build_method_table(*context));

  const auto missing_param = call(server, "actions/restart_service", nlohmann::json::object());
  if (missing_param["error"]["code"] != api::kInvalidParams) {
    return fail("test_actions_respect_allow_list", "missing service should be invalid params");
  }

  const auto denied = call(server, "actions/restart_service", {{"service", "sshd.service"}})["result"];
  if (denied["ok"] != false || !log->calls.empty()) {
    return fail("test_actions_respect_allow_list", "unlisted service must not reach systemctl");
  }

  const auto restarted = call(server, "actions/restart_service", {{"service", "kiosk.service"}})["result"];
  if (restarted["ok"] != true || log->calls.size() != 1U ||
      log->calls[0] != std::vector<std::string>{"systemctl", "restart", "kiosk.service"}) {
    return fail("test_actions_respect_allow_list", "allowed restart should run systemctl restart");
  }

  const auto status = call(server, "actions/service_status", {{"service", "kiosk.service"}})["result"];
  if (status["active"] != true || status["state"] != "active") {
    return fail("test_actions_respect_allow_list", "status should parse is-active output");
  }
  return 0;
}

int test_protocol_errors_and_notifications() {
  auto log = std::make_shared<CommandLog>();
  auto context = make_context(log);
  const Server server(build_method_table(*context));

  if (call(server, "no/such/method")["error"]["code"] != api::kMethodNotFound) {
    return fail("test_protocol_errors_and_notifications", "unknown method code mismatch");
  }

  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"method\":\"health/invalidate\"}\n"
      "not json\n"
      "\n"
      "{\"jsonrpc\":\"1.0\",\"id\":\"a\",\"method\":\"platform/info\"}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":\"b\",\"method\":\"platform/info\"}\n");
  std::ostringstream out;
  std::ostringstream err;
  if (server.run(in, out, err) != 0) {
    return fail("test_protocol_errors_and_notifications", "run should exit cleanly at EOF");
  }

  std::vector<nlohmann::json> responses;
  std::istringstream lines(out.str());
  for (std::string line; std::getline(lines, line);) {
    responses.push_back(nlohmann::json::parse(line));
  }

  if (responses.size() != 3U) {
    return fail("test_protocol_errors_and_notifications", "notification must not produce a response");
  }
  if (responses[0]["error"]["code"] != api::kParseError || !responses[0]["id"].is_null()) {
    return fail("test_protocol_errors_and_notifications", "parse error response mismatch");
  }
  if (responses[1]["error"]["code"] != api::kInvalidParams || responses[1]["id"] != "a") {
    return fail("test_protocol_errors_and_notifications", "bad version should be rejected");
  }
  if (responses[2]["result"]["platform"] != "desktop" || responses[2]["id"] != "b") {
    return fail("test_protocol_errors_and_notifications", "valid request should succeed");
  }
  return 0;
}

int test_invalid_utf8_in_result_is_replaced() {
  api::MethodTable methods;
  methods.emplace("device/label", api::Method{"device/label", "raw sysfs label",
                                              [](const nlohmann::json&) { return nlohmann::json("kiosk\xff"); }});
  const Server server(std::move(methods));

  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":9,\"method\":\"device/label\"}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":10,\"method\":\"device/label\"}\n");
  std::ostringstream out;
  std::ostringstream err;
  if (server.run(in, out, err) != 0) {
    return fail("test_invalid_utf8_in_result_is_replaced", "run should survive an unencodable result");
  }

  std::vector<nlohmann::json> responses;
  std::istringstream lines(out.str());
  for (std::string line; std::getline(lines, line);) {
    responses.push_back(nlohmann::json::parse(line));
  }
  if (responses.size() != 2U || responses[0]["id"] != 9 || responses[1]["id"] != 10) {
    return fail("test_invalid_utf8_in_result_is_replaced", "every request should still be answered");
  }
  if (responses[0]["result"] != "kiosk\xef\xbf\xbd") {
    return fail("test_invalid_utf8_in_result_is_replaced", "invalid byte should become U+FFFD");
  }
  return 0;
}

int test_command_runner_captures_output_and_enforces_timeout() {
  const auto echoed = core::run_command({"sh", "-c", "echo ready; exit 3"}, std::chrono::seconds(5));
  if (!echoed.launched || echoed.timed_out || echoed.exit_code != 3 || echoed.output != "ready\n" || echoed.ok()) {
    return fail("test_command_runner_captures_output_and_enforces_timeout", "exit code or output mismatch");
  }

  const auto start = std::chrono::steady_clock::now();
  const auto slow = core::run_command({"sleep", "5"}, std::chrono::milliseconds(100));
  if (!slow.timed_out || std::chrono::steady_clock::now() - start > std::chrono::seconds(2)) {
    return fail("test_command_runner_captures_output_and_enforces_timeout", "slow command should be killed");
  }

  const auto missing = core::run_command({"device-agent-no-such-binary"}, std::chrono::seconds(1));
  if (missing.launched) {
    return fail("test_command_runner_captures_output_and_enforces_timeout", "missing binary should not launch");
  }
  return 0;
}

int test_screenshot_provider_runs_capture_command() {
  const auto dir = std::filesystem::temp_directory_path() / "device_agent_screens";
  std::filesystem::remove_all(dir);

  std::vector<std::string> seen;
  const providers::CommandRunner runner = [&seen](const std::vector<std::string>& argv, std::chrono::milliseconds) {
    seen = argv;
    std::ofstream(argv.back()) << "PNG";
    core::CommandResult result{};
    result.launched = true;
    result.exit_code = 0;
    return result;
  };

  providers::CommandScreenshotProvider provider("grim -t png", dir.string(), std::chrono::seconds(1), runner);
  const auto shot = provider.capture();
  std::filesystem::remove_all(dir);

  if (!shot.ok || shot.size_bytes != 3U || seen.size() != 4U || seen[0] != "grim" || seen[3] != shot.path) {
    return fail("test_screenshot_provider_runs_capture_command", "capture argv or result mismatch");
  }

  const providers::CommandRunner failing = [](const std::vector<std::string>&, std::chrono::milliseconds) {
    core::CommandResult result{};
    result.launched = true;
    result.exit_code = 1;
    result.output = "cannot open display\n";
    return result;
  };
  providers::CommandScreenshotProvider broken("scrot", dir.string(), std::chrono::seconds(1), failing);
  const auto failed = broken.capture();
  std::filesystem::remove_all(dir);
  if (failed.ok || failed.error.find("cannot open display") == std::string::npos) {
    return fail("test_screenshot_provider_runs_capture_command", "failure should carry the command output");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_platform_and_capabilities(); rc != 0) {
    return rc;
  }
  if (int rc = test_health_endpoints(); rc != 0) {
    return rc;
  }
  if (int rc = test_unbound_capability_maps_to_unavailable_error(); rc != 0) {
    return rc;
  }
  if (int rc = test_actions_respect_allow_list(); rc != 0) {
    return rc;
  }
  if (int rc = test_protocol_errors_and_notifications(); rc != 0) {
    return rc;
  }
  if (int rc = test_invalid_utf8_in_result_is_replaced(); rc != 0) {
    return rc;
  }
  if (int rc = test_command_runner_captures_output_and_enforces_timeout(); rc != 0) {
    return rc;
  }
  if (int rc = test_screenshot_provider_runs_capture_command(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] api unit tests\n";
  return 0;
}
