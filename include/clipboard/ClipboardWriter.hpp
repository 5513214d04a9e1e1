#pragma once

#include <string>

namespace uppy {

/**
 * Replaces the system clipboard with a UTF-8 string by piping it into a
 * clipboard helper (wl-copy, xclip, or a user supplied command).
 */
class ClipboardWriter {
public:
    explicit ClipboardWriter(const std::string& command);

    // UPPY_CLIPBOARD_CMD, else wl-copy under Wayland, else xclip under X11, else empty
    static std::string detectCommand();

    // false and a reason when the helper is missing, cannot be started or exits non-zero
    bool copyText(const std::string& text, std::string& error) const;

    const std::string& getCommand() const { return command_; }

private:
    std::string command_;
};

} // namespace uppy
