#include "sustainbot/console/console_engine.h"

#include "sustainbot/dispatch/message_parse.h"

#include <string>
#include <utility>

namespace sustainbot::console {

ConsoleEngine::ConsoleEngine(dispatch::RequestRunner& runner, IConsoleTransport& io, std::string user)
    : _runner(runner)
    , _io(io)
    , _user(std::move(user))
{}

void ConsoleEngine::run_loop()
{
    while (step(-1)) {
        // loop
    }
    _runner.wait_idle();
}

bool ConsoleEngine::step(int timeout_ms)
{
    if (!_greeted) {
        _greeted = true;
        std::lock_guard<std::mutex> g(_out_mx);
        _io.write_line("sustainbot console (type 'help', 'exit' to quit)");
        _io.write(_prompt);
    }

    std::string line;
    if (!_io.read_line(line, timeout_ms)) {
        // Timeout keeps going; end of input stops the console.
        return !_io.at_eof();
    }

    const bool keep_going = handle_line(line);
    if (keep_going) {
        std::lock_guard<std::mutex> g(_out_mx);
        _io.write(_prompt);
    }
    return keep_going;
}

bool ConsoleEngine::handle_line(std::string_view line)
{
    line = dispatch::trim_ws(line);
    if (line.empty()) {
        return true;
    }

    // Ignore lines that contain ANSI escape (often init strings / terminal noise).
    if (line.find('\x1b') != std::string_view::npos) {
        return true;
    }

    if (line == "exit" || line == "quit") {
        emit("bye");
        return false;
    }

    _runner.submit(dispatch::InboundMessage{_user, std::string(line)},
                   [this](std::string_view text) { emit(text); });
    return true;
}

void ConsoleEngine::emit(std::string_view text)
{
    std::lock_guard<std::mutex> g(_out_mx);
    _io.write_line(text);
}

} // namespace sustainbot::console
