#pragma once

#include <cstddef>
#include <string>

namespace scrubby
{

    inline constexpr std::size_t kDeviceIdLength = 32; // hex characters

    /**
     * Machine identity signals hashed into the device id. Missing signals are
     * replaced by fixed markers so the id stays deterministic.
     */
    struct DeviceSignals
    {
        std::string machine_id;
        std::string hostname;
        std::string user;

        /** Read /etc/machine-id (or the dbus copy), the hostname and the login user */
        static DeviceSignals collect();
    };

    /** SHA-256 over "machine|host|user", truncated to 128 bits, lower-case hex */
    std::string derive_device_id(const DeviceSignals &signals);

    /** Device id of the machine this process runs on */
    std::string current_device_id();

} // namespace scrubby
