#include "scrubby/device_id.hpp"
#include "scrubby/crypto.hpp"
#include <array>
#include <cstdlib>
#include <format>
#include <fstream>
#include <optional>
#include <string_view>
#include <unistd.h>

namespace scrubby
{

    namespace
    {
        std::string trim(std::string_view s)
        {
            const char *ws = " \t\r\n";
            auto first = s.find_first_not_of(ws);
            if (first == std::string_view::npos)
                return {};
            auto last = s.find_last_not_of(ws);
            return std::string(s.substr(first, last - first + 1));
        }

        std::optional<std::string> read_first_line(const char *path)
        {
            std::ifstream file(path);
            if (!file.is_open())
                return std::nullopt;
            std::string line;
            std::getline(file, line);
            auto value = trim(line);
            if (value.empty())
                return std::nullopt;
            return value;
        }

        std::optional<std::string> env_value(const char *name)
        {
            const char *v = std::getenv(name);
            if (!v)
                return std::nullopt;
            auto value = trim(v);
            if (value.empty())
                return std::nullopt;
            return value;
        }
    }

    DeviceSignals DeviceSignals::collect()
    {
        DeviceSignals signals;

        auto machine = read_first_line("/etc/machine-id");
        if (!machine)
            machine = read_first_line("/var/lib/dbus/machine-id");
        signals.machine_id = machine.value_or("");

        auto host = read_first_line("/etc/hostname");
        if (!host)
        {
            std::array<char, 256> buf{};
            if (::gethostname(buf.data(), buf.size() - 1) == 0 && buf[0] != '\0')
                host = trim(buf.data());
        }
        if (!host)
            host = env_value("HOSTNAME");
        signals.hostname = host.value_or("");

        auto user = env_value("USER");
        if (!user)
            user = env_value("USERNAME");
        signals.user = user.value_or("");

        return signals;
    }

    std::string derive_device_id(const DeviceSignals &signals)
    {
        auto raw = std::format("{}|{}|{}",
                               signals.machine_id.empty() ? "no-machine-id" : signals.machine_id,
                               signals.hostname.empty() ? "unknown-host" : signals.hostname,
                               signals.user.empty() ? "unknown-user" : signals.user);
        return crypto::SHA256::to_hex(crypto::SHA256::hash(raw), kDeviceIdLength / 2);
    }

    std::string current_device_id()
    {
        return derive_device_id(DeviceSignals::collect());
    }

} // namespace scrubby
