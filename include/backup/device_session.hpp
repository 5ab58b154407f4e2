#pragma once

#include "backup/transport_adapter.hpp"

// Holds an established adapter for the lifetime of one run. The constructor
// throws std::runtime_error when establish() fails; the destructor releases
// the device exactly once on every exit path.
class DeviceSession {
public:
    explicit DeviceSession(TransportAdapter& adapter);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    TransportAdapter& adapter() { return adapter_; }

    // Releases early. Later calls and the destructor do nothing.
    void release();

private:
    TransportAdapter& adapter_;
    bool released_{false};
};
