#include "scrubby/clipboard.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace scrubby
{

    namespace
    {
        bool has_cmd(std::string_view cmd)
        {
            const char *path_env = std::getenv("PATH");
            if (!path_env)
                return false;
            std::string_view path(path_env);
            std::size_t pos = 0;
            while (pos <= path.size())
            {
                auto sep = path.find(':', pos);
                auto dir = path.substr(pos, sep == std::string_view::npos ? std::string_view::npos : sep - pos);
                if (!dir.empty())
                {
                    auto candidate = std::filesystem::path(dir) / cmd;
                    if (::access(candidate.c_str(), X_OK) == 0)
                        return true;
                }
                if (sep == std::string_view::npos)
                    break;
                pos = sep + 1;
            }
            return false;
        }

        bool exited_ok(int status)
        {
            return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
        }

        Result<std::string> run_read(const char *cmd)
        {
            FILE *pipe = ::popen(cmd, "r");
            if (!pipe)
                return std::unexpected(ScrubbyError::clipboard(std::format("Failed to read clipboard: cannot run '{}'", cmd)));

            std::string result;
            std::array<char, 4096> buffer;
            std::size_t n;
            while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
                result.append(buffer.data(), n);

            if (!exited_ok(::pclose(pipe)))
                return std::unexpected(ScrubbyError::clipboard(std::format("Clipboard read command failed: {}", cmd)));
            return result;
        }

        Result<void> run_write(const char *cmd, const std::string &text)
        {
            FILE *pipe = ::popen(cmd, "w");
            if (!pipe)
                return std::unexpected(ScrubbyError::clipboard(std::format("Failed to write clipboard: cannot run '{}'", cmd)));

            std::size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
            int status = ::pclose(pipe);
            if (written != text.size() || !exited_ok(status))
                return std::unexpected(ScrubbyError::clipboard(std::format("Clipboard write command failed: {}", cmd)));
            return {};
        }

        // xclip/xsel: fall back to the primary selection when the clipboard is empty
        Result<std::string> read_with_primary_fallback(const char *clipboard_cmd, const char *primary_cmd)
        {
            auto text = run_read(clipboard_cmd);
            if (text && !text->empty())
                return text;
            return run_read(primary_cmd);
        }
    }

    std::string_view backend_name(ClipboardBackend backend)
    {
        switch (backend)
        {
        case ClipboardBackend::Pbpaste:
            return "pbpaste";
        case ClipboardBackend::WlPaste:
            return "wl-paste";
        case ClipboardBackend::Xclip:
            return "xclip";
        case ClipboardBackend::Xsel:
            return "xsel";
        }
        return "unknown";
    }

    BackendAvailability BackendAvailability::probe()
    {
        BackendAvailability a;
        a.pb = has_cmd("pbpaste") && has_cmd("pbcopy");
        a.wl = has_cmd("wl-paste") && has_cmd("wl-copy");
        a.xclip = has_cmd("xclip");
        a.xsel = has_cmd("xsel");
        return a;
    }

    std::optional<ClipboardBackend> pick_backend(bool wayland, bool x11, const BackendAvailability &a)
    {
        if (a.pb)
            return ClipboardBackend::Pbpaste;
        if (wayland && a.wl)
            return ClipboardBackend::WlPaste;
        if (x11 && a.xclip)
            return ClipboardBackend::Xclip;
        if (x11 && a.xsel)
            return ClipboardBackend::Xsel;
        if (a.wl)
            return ClipboardBackend::WlPaste;
        if (a.xclip)
            return ClipboardBackend::Xclip;
        if (a.xsel)
            return ClipboardBackend::Xsel;
        return std::nullopt;
    }

    CommandClipboard::CommandClipboard(ClipboardBackend backend) : backend_(backend) {}

    Result<std::unique_ptr<CommandClipboard>> CommandClipboard::detect()
    {
        bool wayland = std::getenv("WAYLAND_DISPLAY") != nullptr;
        bool x11 = std::getenv("DISPLAY") != nullptr;

        auto backend = pick_backend(wayland, x11, BackendAvailability::probe());
        if (!backend)
        {
            return std::unexpected(ScrubbyError::clipboard(
                "No supported clipboard utilities found. Install pbpaste/pbcopy (macOS), "
                "wl-paste/wl-copy (Wayland), or xclip/xsel (X11)."));
        }
        spdlog::debug("clipboard backend: {}", backend_name(*backend));
        return std::make_unique<CommandClipboard>(*backend);
    }

    Result<std::string> CommandClipboard::read()
    {
        switch (backend_)
        {
        case ClipboardBackend::Pbpaste:
            return run_read("pbpaste 2>/dev/null");
        case ClipboardBackend::WlPaste:
            return run_read("wl-paste --no-newline 2>/dev/null");
        case ClipboardBackend::Xclip:
            return read_with_primary_fallback("xclip -selection clipboard -o 2>/dev/null",
                                              "xclip -selection primary -o 2>/dev/null");
        case ClipboardBackend::Xsel:
            return read_with_primary_fallback("xsel --clipboard --output 2>/dev/null",
                                              "xsel --primary --output 2>/dev/null");
        }
        return std::unexpected(ScrubbyError::clipboard("Unknown clipboard backend"));
    }

    Result<void> CommandClipboard::write(const std::string &text)
    {
        switch (backend_)
        {
        case ClipboardBackend::Pbpaste:
            return run_write("pbcopy 2>/dev/null", text);
        case ClipboardBackend::WlPaste:
            return run_write("wl-copy 2>/dev/null", text);
        case ClipboardBackend::Xclip:
            return run_write("xclip -selection clipboard >/dev/null 2>&1", text);
        case ClipboardBackend::Xsel:
            return run_write("xsel --clipboard --input >/dev/null 2>&1", text);
        }
        return std::unexpected(ScrubbyError::clipboard("Unknown clipboard backend"));
    }

} // namespace scrubby
