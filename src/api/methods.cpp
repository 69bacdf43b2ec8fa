#include "api/methods.hpp"

#include <stdexcept>
#include <string>

#include "core/registry.hpp"
#include "model/json.hpp"
#include "providers/contracts.hpp"

namespace device_agent::api {
namespace {

template <typename Interface>
std::shared_ptr<Interface> require(const core::DeviceContext& context, const core::Contract<Interface>& contract) {
  const auto resolution = context.registry().lookup(contract);
  if (!resolution.available()) {
    throw CapabilityUnavailable(contract.name);
  }
  return resolution.shared();
}

std::string service_param(const nlohmann::json& params) {
  const auto it = params.find("service");
  if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("service must be a non-empty string");
  }
  return it->get<std::string>();
}

nlohmann::json to_json(const providers::ServiceState& state) {
  return nlohmann::json{{"service", state.service}, {"active", state.active}, {"state", state.state}};
}

nlohmann::json to_json(const providers::ActionResult& result) {
  return nlohmann::json{{"ok", result.ok}, {"message", result.message}};
}

nlohmann::json platform_info(const core::DeviceContext& context) {
  const auto& platform = context.platform();
  return nlohmann::json{{"platform", core::to_string(platform.identity)},
                        {"overridden", platform.overridden},
                        {"os", platform.probe.os_name},
                        {"machine", platform.probe.machine},
                        {"device_model", platform.probe.device_tree_model}};
}

nlohmann::json capabilities(const core::DeviceContext& context) {
  const auto& registry = context.registry();
  nlohmann::json result{{"platform", core::to_string(context.platform().identity)},
                        {"contracts", registry.contracts()}};
  result["camera"] = registry.contains(providers::kCamera.name);
  result["screenshot"] = registry.contains(providers::kScreenshot.name);
  result["player"] = registry.contains(providers::kPlayer.name);
  result["actions"] = registry.contains(providers::kActions.name);
  return result;
}

void add(MethodTable& table, std::string name, std::string description,
         std::function<nlohmann::json(const nlohmann::json&)> handler) {
  auto key = name;
  table.emplace(std::move(key), Method{std::move(name), std::move(description), std::move(handler)});
}

}  // namespace

MethodTable build_method_table(core::DeviceContext& context) {
  MethodTable table;

  add(table, "platform/info", "Detected platform and the signals behind it",
      [&context](const nlohmann::json&) { return platform_info(context); });

  add(table, "capabilities/list", "Contracts bound on this platform",
      [&context](const nlohmann::json&) { return capabilities(context); });

  add(table, "health/raw", "Normalized metrics, served from cache within the TTL",
      [&context](const nlohmann::json&) { return nlohmann::json(context.metrics().collect()); });

  add(table, "health/summary", "Composite health score with contributing factors", [&context](const nlohmann::json&) {
    nlohmann::json result = context.metrics().collect_summary();
    result["platform"] = core::to_string(context.platform().identity);
    return result;
  });

  add(table, "health/invalidate", "Drop the cached metrics", [&context](const nlohmann::json&) {
    context.metrics().invalidate();
    return nlohmann::json{{"invalidated", true}};
  });

  add(table, "camera/inventory", "Video capture devices", [&context](const nlohmann::json&) {
    const auto camera = require(context, providers::kCamera);
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& device : camera->inventory()) {
      devices.push_back({{"node", device.node}, {"name", device.name}});
    }
    return nlohmann::json{{"devices", devices}, {"count", devices.size()}};
  });

  add(table, "screenshot/capture", "Capture the display to a file", [&context](const nlohmann::json&) {
    const auto result = require(context, providers::kScreenshot)->capture();
    nlohmann::json out{{"ok", result.ok}};
    if (result.ok) {
      out["path"] = result.path;
      out["size_bytes"] = result.size_bytes;
    } else {
      out["error"] = result.error;
    }
    return out;
  });

  add(table, "player/status", "Playback service state",
      [&context](const nlohmann::json&) { return to_json(require(context, providers::kPlayer)->status()); });

  add(table, "player/restart", "Restart the playback service",
      [&context](const nlohmann::json&) { return to_json(require(context, providers::kPlayer)->restart()); });

  add(table, "actions/service_status", "State of an allow-listed service", [&context](const nlohmann::json& params) {
    const std::string service = service_param(params);
    return to_json(require(context, providers::kActions)->service_status(service));
  });

  add(table, "actions/restart_service", "Restart an allow-listed service", [&context](const nlohmann::json& params) {
    const std::string service = service_param(params);
    return to_json(require(context, providers::kActions)->restart_service(service));
  });

  return table;
}

}  // namespace device_agent::api
