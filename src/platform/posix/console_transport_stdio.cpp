#include "sustainbot/console/console_engine.h"

#include <atomic>
#include <iostream>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace sustainbot::console {

namespace {

// Line-buffered stdin/stdout. The terminal stays in canonical mode, so the
// kernel does the line editing and read_byte only sees committed lines.
class StdioConsoleTransport final : public IConsoleTransport {
public:
    bool read_byte(std::uint8_t& out, int timeout_ms) override
    {
        if (_eof.load()) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN | POLLHUP | POLLERR;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret <= 0) {
            return false; // timeout or interrupted
        }

        if ((pfd.revents & (POLLIN | POLLHUP)) == 0) {
            return false;
        }

        unsigned char ch = 0;
        const ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n == 0) {
            _eof.store(true);
            return false;
        }
        if (n != 1) {
            return false;
        }
        out = static_cast<std::uint8_t>(ch);
        return true;
    }

    bool at_eof() const override { return _eof.load(); }

    void write(std::string_view s) override
    {
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.flush();
    }

    void write_line(std::string_view s) override
    {
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.put('\n');
        std::cout.flush();
    }

private:
    std::atomic<bool> _eof{false};
};

} // namespace

std::unique_ptr<IConsoleTransport> create_default_console_transport()
{
    return std::make_unique<StdioConsoleTransport>();
}

} // namespace sustainbot::console
