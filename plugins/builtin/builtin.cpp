#include "builtin.h"

namespace bbhunt {

void register_builtin_plugins(IPluginRegistrar& host) {
    register_echo_plugin(host);
    register_resource_report_plugin(host);
    register_subdomain_enum_plugin(host);
}

} // namespace bbhunt
