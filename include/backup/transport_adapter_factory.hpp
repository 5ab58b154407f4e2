#pragma once

#include "backup/transport_adapter.hpp"
#include "backup/backup_config.hpp"
#include "common/command_runner.hpp"
#include <memory>
#include <string>
#include <stdexcept>

// Creates the adapter for config.deviceType ("iphone", "android" or "pixel").
// Throws std::runtime_error for an unknown device type.
std::shared_ptr<TransportAdapter> createTransportAdapter(const BackupConfig& config,
        std::shared_ptr<CommandRunner> runner = nullptr);
