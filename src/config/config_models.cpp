#include "autooffset/config/config_models.hpp"

namespace aof {

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.machines = {
        MachineConfig{.id = 1, .name = "Lathe #1 (OP-10)", .ip = "192.168.0.145", .port = 8193},
        MachineConfig{.id = 2, .name = "Lathe #2 (OP-20)", .ip = "192.168.0.146", .port = 8193},
    };
    for (const auto& machine : config.machines) {
        for (const std::int16_t slot : {std::int16_t{11}, std::int16_t{12}}) {
            ToolProfile tool;
            tool.machineId = machine.id;
            tool.toolSlot = slot;
            tool.basicSize = 48.0;
            config.tools.push_back(tool);
        }
    }
    return config;
}

} // namespace aof
