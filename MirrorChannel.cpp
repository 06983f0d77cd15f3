#include "MirrorChannel.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace KUCHIPAKU {

    PipeMirrorTarget::~PipeMirrorTarget() {
        Close();
    }

    bool PipeMirrorTarget::Open(const std::string& command) {
        Close();

        // A display window that quits must not take the stage down with it.
        signal(SIGPIPE, SIG_IGN);

        pipe_ = popen(command.c_str(), "w");
        if (pipe_ == nullptr) {
            std::cerr << "Failed to launch display window (" << command << "): "
                << std::strerror(errno) << "\n";
            return false;
        }

        int fd = fileno(pipe_);
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            std::cerr << "Failed to make display pipe non-blocking: "
                << std::strerror(errno) << "\n";
            Close();
            return false;
        }

        std::cout << "Display window launched: " << command << "\n";
        return true;
    }

    void PipeMirrorTarget::Close() {
        if (pipe_ == nullptr)
            return;
        // The child sees EOF on stdin and exits.
        int status = pclose(pipe_);
        pipe_ = nullptr;
        if (status == -1) {
            std::cerr << "Display window did not shut down cleanly: "
                << std::strerror(errno) << "\n";
        }
    }

    void PipeMirrorTarget::PostMessage(const std::string& text) {
        if (pipe_ == nullptr)
            return;

        std::string line = text;
        line += '\n';

        // Lines up to PIPE_BUF bytes are written atomically or not at all.
        ssize_t written = write(fileno(pipe_), line.data(), line.size());
        if (written == static_cast<ssize_t>(line.size()))
            return;

        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            ++dropped_count_;
            return;
        }
        if (written >= 0) {
            // Partial write of an oversized line; the receiver drops the
            // fragment as malformed.
            ++dropped_count_;
            return;
        }

        std::cerr << "Display window went away: " << std::strerror(errno) << "\n";
        Close();
    }

    StdinMirrorSource::StdinMirrorSource() {
        int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
        if (flags < 0 || fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK) < 0) {
            std::cerr << "Failed to make stdin non-blocking: " << std::strerror(errno) << "\n";
            closed_ = true;
        }
    }

    std::vector<MirrorMessage> StdinMirrorSource::Poll() {
        std::vector<MirrorMessage> messages;
        if (closed_)
            return messages;

        char buffer[4096];
        while (true) {
            ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
            if (n > 0) {
                std::vector<MirrorMessage> batch = receiver_.Feed(std::string(buffer, n));
                messages.insert(messages.end(), batch.begin(), batch.end());
                continue;
            }
            if (n == 0) {
                std::cout << "Stage closed the mirror channel.\n";
                closed_ = true;
                break;
            }
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::cerr << "Mirror read failed: " << std::strerror(errno) << "\n";
                closed_ = true;
            }
            break;
        }
        return messages;
    }

}  // namespace KUCHIPAKU
