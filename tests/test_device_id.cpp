#include <catch2/catch_test_macros.hpp>
#include "scrubby/device_id.hpp"
#include <algorithm>

using namespace scrubby;

TEST_CASE("Device id is a truncated SHA-256 of the signals", "[device]")
{
    DeviceSignals signals{"m1", "host", "alice"};
    REQUIRE(derive_device_id(signals) == "3e4fe38d54b2bd34775cae4bee30c0f9");
}

TEST_CASE("Missing signals use fixed markers", "[device]")
{
    REQUIRE(derive_device_id(DeviceSignals{}) == "3d95625b4128e498872420337825c8d8");
}

TEST_CASE("Device id changes with any signal", "[device]")
{
    DeviceSignals base{"m1", "host", "alice"};
    auto id = derive_device_id(base);

    auto other_user = base;
    other_user.user = "bob";
    auto other_host = base;
    other_host.hostname = "laptop";
    auto other_machine = base;
    other_machine.machine_id = "m2";

    REQUIRE(derive_device_id(other_user) != id);
    REQUIRE(derive_device_id(other_host) != id);
    REQUIRE(derive_device_id(other_machine) != id);
}

TEST_CASE("Current device id is stable and well formed", "[device]")
{
    auto id = current_device_id();
    REQUIRE(id.size() == kDeviceIdLength);
    REQUIRE(std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
    REQUIRE(current_device_id() == id);
}
