#include "sustainbot/dispatch/request_runner.h"

#include "sustainbot/core/logging.h"
#include "sustainbot/help/help_service.h"

#include <condition_variable>
#include <exception>
#include <string>
#include <utility>

namespace sustainbot::dispatch {

using sustainbot::log::Level;
static constexpr const char* TAG = "runner";

struct RequestRunner::Job {
    std::mutex mx;
    std::condition_variable cv;
    bool done{false};
    bool timed_out{false};
};

RequestRunner::RequestRunner(MessageSink sink, std::chrono::milliseconds timeout)
    : _sink(std::move(sink))
    , _timeout(timeout)
{}

RequestRunner::~RequestRunner()
{
    wait_idle();
}

void RequestRunner::submit(InboundMessage msg, command::OutputFn say)
{
    auto job = std::make_shared<Job>();
    auto out = std::make_shared<command::OutputFn>(std::move(say));

    // Output after a timeout notice is dropped.
    command::OutputFn guarded = [job, out](std::string_view text) {
        std::lock_guard<std::mutex> g(job->mx);
        if (job->timed_out) {
            return;
        }
        (*out)(text);
    };

    Slot slot;
    slot.job = job;

    if (_timeout.count() > 0) {
        slot.watchdog = std::thread([job, out, user = msg.user, timeout = _timeout] {
            std::unique_lock<std::mutex> lk(job->mx);
            if (job->cv.wait_for(lk, timeout, [&] { return job->done; })) {
                return;
            }
            job->timed_out = true;
            SB_LOGW(TAG, "Request from '%s' timed out after %lld ms",
                    user.c_str(), static_cast<long long>(timeout.count()));

            std::string reply = help::apology(user);
            reply.append("your request timed out after " + std::to_string(timeout.count()) + " ms.");
            (*out)(reply);
        });
    }

    slot.worker = std::thread([sink = _sink, job, msg = std::move(msg), guarded = std::move(guarded)] {
        const std::string failed = help::apology(msg.user)
            + "an error occurred while processing your request.";
        try {
            sink(msg, guarded);
        } catch (const std::exception& ex) {
            SB_LOGE(TAG, "Unhandled error while processing message from '%s': %s",
                    msg.user.c_str(), ex.what());
            guarded(failed);
        } catch (...) {
            SB_LOGE(TAG, "Unknown error while processing message from '%s'", msg.user.c_str());
            guarded(failed);
        }
        {
            std::lock_guard<std::mutex> g(job->mx);
            job->done = true;
        }
        job->cv.notify_all();
    });

    std::lock_guard<std::mutex> lock(_mx);
    reap_finished_locked();
    _slots.push_back(std::move(slot));
}

void RequestRunner::reap_finished_locked()
{
    for (auto it = _slots.begin(); it != _slots.end();) {
        bool done = false;
        {
            std::lock_guard<std::mutex> g(it->job->mx);
            done = it->job->done;
        }
        if (!done) {
            ++it;
            continue;
        }
        if (it->worker.joinable()) it->worker.join();
        if (it->watchdog.joinable()) it->watchdog.join();
        it = _slots.erase(it);
    }
}

void RequestRunner::wait_idle()
{
    std::list<Slot> pending;
    {
        std::lock_guard<std::mutex> lock(_mx);
        pending.swap(_slots);
    }

    for (auto& s : pending) {
        if (s.worker.joinable()) s.worker.join();
        if (s.watchdog.joinable()) s.watchdog.join();
    }
}

std::size_t RequestRunner::in_flight() const
{
    std::lock_guard<std::mutex> lock(_mx);
    std::size_t n = 0;
    for (const auto& s : _slots) {
        std::lock_guard<std::mutex> g(s.job->mx);
        if (!s.job->done) ++n;
    }
    return n;
}

} // namespace sustainbot::dispatch
