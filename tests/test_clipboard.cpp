#include <catch2/catch_test_macros.hpp>
#include "scrubby/clipboard.hpp"

using namespace scrubby;

namespace
{
    BackendAvailability all_tools()
    {
        return BackendAvailability{true, true, true, true};
    }
}

TEST_CASE("macOS tools are preferred", "[clipboard]")
{
    REQUIRE(pick_backend(true, true, all_tools()) == ClipboardBackend::Pbpaste);
}

TEST_CASE("Backend follows the session type", "[clipboard]")
{
    auto linux_tools = all_tools();
    linux_tools.pb = false;

    REQUIRE(pick_backend(true, false, linux_tools) == ClipboardBackend::WlPaste);
    REQUIRE(pick_backend(false, true, linux_tools) == ClipboardBackend::Xclip);
    REQUIRE(pick_backend(true, true, linux_tools) == ClipboardBackend::WlPaste);

    auto xsel_only = BackendAvailability{false, true, false, true};
    REQUIRE(pick_backend(false, true, xsel_only) == ClipboardBackend::Xsel);
}

TEST_CASE("Any installed tool is used without a session", "[clipboard]")
{
    REQUIRE(pick_backend(false, false, BackendAvailability{false, true, false, false}) == ClipboardBackend::WlPaste);
    REQUIRE(pick_backend(false, false, BackendAvailability{false, false, true, false}) == ClipboardBackend::Xclip);
    REQUIRE(pick_backend(false, false, BackendAvailability{false, false, false, true}) == ClipboardBackend::Xsel);
    REQUIRE(pick_backend(true, true, BackendAvailability{false, false, false, true}) == ClipboardBackend::Xsel);
}

TEST_CASE("No tools means no backend", "[clipboard]")
{
    REQUIRE_FALSE(pick_backend(true, true, BackendAvailability{}).has_value());
}

TEST_CASE("Backend names", "[clipboard]")
{
    REQUIRE(backend_name(ClipboardBackend::Pbpaste) == "pbpaste");
    REQUIRE(backend_name(ClipboardBackend::WlPaste) == "wl-paste");
    REQUIRE(backend_name(ClipboardBackend::Xclip) == "xclip");
    REQUIRE(backend_name(ClipboardBackend::Xsel) == "xsel");
}
