#pragma once

#include "sustainbot/dispatch/request_runner.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace sustainbot::console {

class IConsoleTransport {
public:
    virtual ~IConsoleTransport() = default;

    // Reads a single input byte.
    // Returns false on timeout or when input is unavailable (EOF).
    virtual bool read_byte(std::uint8_t& out, int timeout_ms) = 0;

    // True once the input side has reached end of file.
    virtual bool at_eof() const { return false; }

    // Read a line by buffering bytes until '\n' or '\r'.
    virtual bool read_line(std::string& out, int timeout_ms)
    {
        out.clear();

        std::uint8_t ch = 0;
        if (!read_byte(ch, timeout_ms)) {
            return false;
        }

        for (;;) {
            if (ch == '\r' || ch == '\n') {
                return true;
            }
            out.push_back(static_cast<char>(ch));

            // The rest of the line is already buffered; block until it arrives.
            if (!read_byte(ch, -1)) {
                return !out.empty();
            }
        }
    }

    virtual void write(std::string_view s) = 0;

    virtual void write_line(std::string_view s) = 0;
};

// Platform-provided default transport (POSIX: stdio).
std::unique_ptr<IConsoleTransport> create_default_console_transport();

// Local chat stand-in: every typed line is a message from `user`.
class ConsoleEngine {
public:
    ConsoleEngine(dispatch::RequestRunner& runner, IConsoleTransport& io, std::string user);

    // Blocking loop (best for dedicated thread/task).
    void run_loop();

    // One cooperative iteration. Returns false to stop the console.
    // `timeout_ms` is passed to the transport.
    bool step(int timeout_ms);

private:
    bool handle_line(std::string_view line);

    void emit(std::string_view text);

    dispatch::RequestRunner& _runner;
    IConsoleTransport& _io;
    std::string _user;

    std::string _prompt{"> "};
    bool _greeted{false};

    std::mutex _out_mx;
};

} // namespace sustainbot::console
