#include "backup/device_session.hpp"
#include "common/logger.hpp"
#include <stdexcept>

DeviceSession::DeviceSession(TransportAdapter& adapter)
    : adapter_(adapter) {
    if (!adapter_.establish()) {
        throw std::runtime_error("Failed to connect to " + adapter_.deviceName() + ": " +
                                 adapter_.getLastError());
    }
    Logger::info("Connected to " + adapter_.deviceName());
}

DeviceSession::~DeviceSession() {
    release();
}

void DeviceSession::release() {
    if (released_) {
        return;
    }
    released_ = true;
    adapter_.teardown();
}
