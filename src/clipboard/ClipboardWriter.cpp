#include "clipboard/ClipboardWriter.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <sys/wait.h>

namespace uppy {

namespace {
    bool envSet(const char* name) {
        const char* value = std::getenv(name);
        return value != nullptr && *value != '\0';
    }
}

ClipboardWriter::ClipboardWriter(const std::string& command)
    : command_(command) {}

std::string ClipboardWriter::detectCommand() {
    if (envSet("UPPY_CLIPBOARD_CMD")) {
        return std::getenv("UPPY_CLIPBOARD_CMD");
    }
    if (envSet("WAYLAND_DISPLAY")) {
        return "wl-copy --type 'text/plain;charset=utf-8'";
    }
    if (envSet("DISPLAY")) {
        return "xclip -selection clipboard -t UTF8_STRING";
    }
    return "";
}

bool ClipboardWriter::copyText(const std::string& text, std::string& error) const {
    if (command_.empty()) {
        error = "no clipboard helper found (set UPPY_CLIPBOARD_CMD, or run under Wayland/X11)";
        return false;
    }

    FILE* pipe = popen(command_.c_str(), "w");
    if (!pipe) {
        error = "failed to start '" + command_ + "' (" + std::strerror(errno) + ")";
        return false;
    }

    size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    bool flushed = std::fflush(pipe) == 0;
    int status = pclose(pipe);

    if (written != text.size() || !flushed) {
        error = "failed to write to '" + command_ + "'";
        return false;
    }
    if (status == -1) {
        error = "failed to wait for '" + command_ + "' (" + std::strerror(errno) + ")";
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        error = "'" + command_ + "' exited with status " +
                std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status);
        return false;
    }
    return true;
}

} // namespace uppy
