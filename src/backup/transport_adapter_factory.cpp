#include "backup/transport_adapter_factory.hpp"
#include "backup/iphone/mounted_fs_adapter.hpp"
#include "backup/android/remote_shell_adapter.hpp"
#include "common/logger.hpp"

std::shared_ptr<TransportAdapter> createTransportAdapter(const BackupConfig& config,
        std::shared_ptr<CommandRunner> runner)
{
    if (!runner) {
        runner = std::make_shared<ProcessRunner>();
    }

    std::string type = normalizeDeviceType(config.deviceType);
    Logger::info("Creating transport adapter for device type: " + config.deviceType);

    if (type == "iphone") {
        Logger::debug("Using mounted filesystem adapter (ifuse)");
        return std::make_shared<MountedFsAdapter>(runner, config);
    } else if (type == "android") {
        Logger::debug("Using remote shell adapter (adb)");
        return std::make_shared<RemoteShellAdapter>(runner, config);
    } else {
        Logger::error("Unsupported device type: " + config.deviceType);
        throw std::runtime_error("Unsupported device type: " + config.deviceType);
    }
}
