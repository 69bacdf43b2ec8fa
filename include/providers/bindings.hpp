#pragma once

#include "core/factory_registry.hpp"

namespace device_agent::providers {

// Binding sets for desktop, embedded and generic hosts.
core::FactoryRegistry default_factory_registry();

void install_baseline(core::ServiceRegistry& registry, const core::BindingContext& context);
void install_desktop(core::ServiceRegistry& registry, const core::BindingContext& context);
void install_embedded(core::ServiceRegistry& registry, const core::BindingContext& context);

}  // namespace device_agent::providers
