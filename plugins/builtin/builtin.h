#pragma once
#include "bbhunt/plugin_api.h"

namespace bbhunt {

// Plugins compiled into the host, enrolled as the "builtin" source.
void register_builtin_plugins(IPluginRegistrar& host);

// Per-plugin registration hooks.
void register_echo_plugin(IPluginRegistrar& host);
void register_resource_report_plugin(IPluginRegistrar& host);
void register_subdomain_enum_plugin(IPluginRegistrar& host);

} // namespace bbhunt
