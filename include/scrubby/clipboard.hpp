#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace scrubby
{

    /**
     * Text clipboard seen by the scrubber: returns the current text, accepts
     * text to write. Failures are reported per operation.
     */
    class Clipboard
    {
    public:
        virtual ~Clipboard() = default;

        virtual Result<std::string> read() = 0;
        virtual Result<void> write(const std::string &text) = 0;
    };

    enum class ClipboardBackend
    {
        Pbpaste, // macOS pbpaste/pbcopy
        WlPaste, // Wayland wl-paste/wl-copy
        Xclip,
        Xsel
    };

    std::string_view backend_name(ClipboardBackend backend);

    struct BackendAvailability
    {
        bool pb{false};
        bool wl{false};
        bool xclip{false};
        bool xsel{false};

        /** Look the tools up on $PATH */
        static BackendAvailability probe();
    };

    /**
     * macOS tools first, then the tools matching the session (Wayland before
     * X11, xclip before xsel), then whatever is installed.
     */
    std::optional<ClipboardBackend> pick_backend(bool wayland, bool x11, const BackendAvailability &available);

    /** Clipboard backed by the platform's command-line tools */
    class CommandClipboard : public Clipboard
    {
    public:
        explicit CommandClipboard(ClipboardBackend backend);

        /** Pick a backend from the environment; ClipboardError when none is installed */
        static Result<std::unique_ptr<CommandClipboard>> detect();

        Result<std::string> read() override;
        Result<void> write(const std::string &text) override;

        ClipboardBackend backend() const { return backend_; }

    private:
        ClipboardBackend backend_;
    };

} // namespace scrubby
