#pragma once

#include "sustainbot/command/command_handler.h"
#include "sustainbot/dispatch/message_dispatcher.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace sustainbot::dispatch {

// Whatever turns a message into responses: MessageDispatcher or PatternRouter.
// Anything a sink throws is logged and answered with
// "Sorry <@user>, an error occurred while processing your request."
using MessageSink = std::function<void(const InboundMessage&, const command::OutputFn&)>;

/**
 * Runs every submitted message on its own worker thread so one slow handler
 * does not hold up unrelated messages.
 *
 * With a non-zero timeout a watchdog replies "your request timed out" once it
 * elapses; anything the handler says afterwards is dropped. The handler itself
 * is not cancelled. Each message therefore gets either its handler's output or
 * the timeout notice.
 *
 * `say` may be called from worker threads; it must be safe to call
 * concurrently across messages.
 */
class RequestRunner {
public:
    RequestRunner(MessageSink sink, std::chrono::milliseconds timeout);
    ~RequestRunner();

    RequestRunner(const RequestRunner&) = delete;
    RequestRunner& operator=(const RequestRunner&) = delete;

    void submit(InboundMessage msg, command::OutputFn say);

    // Blocks until every submitted message has finished (including ones that
    // already timed out).
    void wait_idle();

    // Messages whose handler has not returned yet.
    std::size_t in_flight() const;

private:
    struct Job;
    struct Slot {
        std::shared_ptr<Job> job;
        std::thread worker;
        std::thread watchdog;
    };

    void reap_finished_locked();

    MessageSink _sink;
    std::chrono::milliseconds _timeout;

    mutable std::mutex _mx;
    std::list<Slot> _slots;
};

} // namespace sustainbot::dispatch
