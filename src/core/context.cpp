#include "core/context.hpp"

#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "providers/contracts.hpp"

namespace device_agent::core {

DeviceContext::DeviceContext(ConstructionTag, ServiceConfig config, DetectedPlatform platform)
    : config_(std::move(config)), platform_(std::move(platform)) {}

std::unique_ptr<DeviceContext> DeviceContext::bootstrap(const ServiceConfig& config, const PlatformDetector& detector,
                                                        const FactoryRegistry& factories) {
  DetectedPlatform detected = detector.detect_with_evidence(config.platform_override);

  std::cerr << "[platform] " << to_string(detected.identity) << (detected.overridden ? " (override)" : "")
            << " os=" << detected.probe.os_name << " machine=" << detected.probe.machine << '\n';

  auto context = std::make_unique<DeviceContext>(ConstructionTag{}, config, std::move(detected));

  const PlatformBindings& bindings = factories.select(context->platform_.identity);
  bindings.install(context->registry_, BindingContext{context->config_, context->platform_.probe});

  const std::vector<std::string> missing = context->registry_.validate(bindings.required);
  if (!missing.empty()) {
    std::ostringstream message;
    message << "missing bindings for platform " << to_string(context->platform_.identity) << ":";
    for (const auto& contract : missing) {
      message << ' ' << contract;
    }
    throw BootstrapError(message.str());
  }

  context->registry_.seal();

  std::vector<Contract<providers::HealthProvider>> polled;
  for (const auto& contract : providers::health_contracts()) {
    if (!provider_enabled(context->config_, providers::provider_key(contract))) {
      std::cerr << "[registry] provider " << contract.name << " disabled by configuration\n";
      continue;
    }
    if (context->registry_.contains(contract.name)) {
      polled.push_back(contract);
    }
  }

  FacadeOptions options{};
  options.cache_ttl = context->config_.cache_ttl;
  options.provider_timeout = context->config_.provider_timeout;
  options.worker_threads = context->config_.worker_threads;

  const std::size_t polled_count = polled.size();
  context->metrics_ = std::make_unique<MetricsFacade>(context->registry_, context->platform_.identity,
                                                      std::move(polled), risk::HealthScorer(context->config_.scoring),
                                                      options);

  std::cerr << "[registry] " << context->registry_.contracts().size() << " contracts bound, " << polled_count
            << " metrics providers polled\n";
  return context;
}

}  // namespace device_agent::core
