#include "providers/bindings.hpp"

#include <chrono>
#include <memory>

#include "core/platform.hpp"
#include "providers/contracts.hpp"

namespace device_agent::providers {
namespace {

constexpr std::chrono::seconds kServiceCommandTimeout{15};
constexpr std::chrono::seconds kScreenshotTimeout{10};
constexpr const char* kDeviceTreeModel = "/proc/device-tree/model";

ServiceManager service_manager_for(const core::PlatformProbe& probe) {
  return probe.os_name == "Darwin" ? ServiceManager::LAUNCHD : ServiceManager::SYSTEMD;
}

ServiceControl service_control_for(const core::BindingContext& context) {
  return ServiceControl(service_manager_for(context.probe), kServiceCommandTimeout, default_command_runner());
}

void install_actions(core::ServiceRegistry& registry, const core::BindingContext& context) {
  const auto allowed = context.config.allowed_services;
  const auto control = service_control_for(context);
  registry.register_factory<ActionProvider>(
      kActions, [allowed, control]() { return std::make_shared<SystemActionProvider>(allowed, control); });
}

std::vector<std::string> with_baseline(std::vector<std::string> extra) {
  std::vector<std::string> required = baseline_contracts();
  required.insert(required.end(), extra.begin(), extra.end());
  return required;
}

}  // namespace

void install_baseline(core::ServiceRegistry& registry, const core::BindingContext& context) {
  const auto window = context.config.cpu_sample_window;
  const auto disk_path = context.config.disk_path;

  registry.register_factory<HealthProvider>(kCpuHealth, [window]() { return make_cpu_provider(window); });
  registry.register_factory<HealthProvider>(kMemoryHealth, []() { return make_memory_provider(); });
  registry.register_factory<HealthProvider>(kDiskHealth, [disk_path]() { return make_disk_provider(disk_path); });
  registry.register_factory<HealthProvider>(kUptimeHealth, []() { return make_uptime_provider(); });
  registry.register_factory<HealthProvider>(kNetworkHealth, []() { return make_network_provider(); });
}

void install_desktop(core::ServiceRegistry& registry, const core::BindingContext& context) {
  install_baseline(registry, context);
  registry.register_factory<HealthProvider>(kLoadHealth, []() { return make_load_provider(); });
  registry.register_factory<CameraProvider>(kCamera, []() { return std::make_shared<V4l2CameraProvider>(); });
  install_actions(registry, context);
}

void install_embedded(core::ServiceRegistry& registry, const core::BindingContext& context) {
  install_baseline(registry, context);
  registry.register_factory<HealthProvider>(kThermalHealth, []() { return make_thermal_provider(); });
  registry.register_factory<HealthProvider>(kDeviceHealth,
                                            []() { return make_device_info_provider(kDeviceTreeModel); });

  const auto command = context.config.screenshot_command;
  const auto directory = context.config.screenshot_dir;
  registry.register_factory<ScreenshotProvider>(kScreenshot, [command, directory]() {
    return std::make_shared<CommandScreenshotProvider>(command, directory, kScreenshotTimeout);
  });

  const auto player_service = context.config.player_service;
  const auto control = service_control_for(context);
  registry.register_factory<PlayerProvider>(
      kPlayer, [player_service, control]() { return std::make_shared<SystemPlayerProvider>(player_service, control); });

  install_actions(registry, context);
}

core::FactoryRegistry default_factory_registry() {
  core::FactoryRegistry factories;
  factories.add(core::PlatformIdentity::GENERIC, {install_baseline, baseline_contracts()});
  factories.add(core::PlatformIdentity::DESKTOP, {install_desktop, with_baseline({kCamera.name, kActions.name})});
  factories.add(core::PlatformIdentity::EMBEDDED,
                {install_embedded, with_baseline({kScreenshot.name, kPlayer.name, kActions.name})});
  return factories;
}

}  // namespace device_agent::providers
