#include "runtime/bridge_session.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/request_decoder.hpp"
#include "session/line_reader.hpp"

namespace bridge::runtime {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::Outcome;

namespace {

struct PendingLine {
    std::string raw;
    std::future<Outcome> outcome;
};

}  // namespace

BridgeSession::BridgeSession(std::shared_ptr<const tools::ToolDispatcher> dispatcher,
                             std::shared_ptr<session::ResponseWriter> writer,
                             std::size_t max_in_flight)
    : dispatcher_(std::move(dispatcher)),
      writer_(std::move(writer)),
      max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {}

Outcome BridgeSession::process_line(const std::string& line) const {
    try {
        auto decoded = protocol::decode_request(line);
        if (core::errors::is_error(decoded)) {
            const auto& err = core::errors::get_error(decoded);
            LOG_WARN("Rejected request line [" + err.code + "]: " + err.message);
            return err;
        }
        return dispatcher_->dispatch(core::errors::get_value(decoded));
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("Unexpected failure while processing line: ") + ex.what());
        return BridgeError{ErrorCategory::Internal, std::string("Internal error: ") + ex.what(),
                           "internal_error"};
    }
}

core::errors::Result<SessionStats> BridgeSession::run(std::istream& in) {
    session::LineReader reader(in);
    SessionStats stats;

    std::mutex mutex;
    std::condition_variable cv;
    // Futures in input order. The writer only pops the front after writing it,
    // so pending.size() is the number of lines in flight.
    std::deque<PendingLine> pending;
    bool input_done = false;
    bool output_lost = false;
    std::optional<BridgeError> output_error;

    std::thread writer_thread([&]() {
        while (true) {
            PendingLine* front = nullptr;
            bool lost = false;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [&] { return !pending.empty() || input_done; });
                if (pending.empty()) {
                    return;
                }
                // deque::push_back keeps references to existing elements valid.
                front = &pending.front();
                lost = output_lost;
            }

            const Outcome outcome = front->outcome.get();
            if (!lost) {
                auto written = writer_->write(front->raw, outcome);
                if (core::errors::is_error(written)) {
                    const auto& err = core::errors::get_error(written);
                    LOG_ERROR("Output lost [" + err.code + "]: " + err.message);
                    std::lock_guard<std::mutex> lock(mutex);
                    output_lost = true;
                    output_error = err;
                } else {
                    ++stats.lines_out;
                    if (core::errors::is_error(outcome)) {
                        ++stats.failures;
                    }
                }
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                pending.pop_front();
            }
            cv.notify_all();
        }
    });

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return pending.size() < max_in_flight_ || output_lost; });
            if (output_lost) {
                break;
            }
        }

        auto line = reader.next();
        if (!line.has_value()) {
            break;
        }
        ++stats.lines_in;
        LOG_DEBUG("Received line " + std::to_string(stats.lines_in) + ": " + *line);

        PendingLine unit;
        unit.raw = *line;
        auto task = [this, raw = *line]() { return process_line(raw); };
        try {
            unit.outcome = std::async(std::launch::async, task);
        } catch (const std::system_error& ex) {
            // No thread available: evaluate on the writer thread instead.
            LOG_WARN(std::string("Falling back to deferred processing: ") + ex.what());
            unit.outcome = std::async(std::launch::deferred, task);
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.push_back(std::move(unit));
        }
        cv.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        input_done = true;
    }
    cv.notify_all();
    writer_thread.join();

    if (output_error.has_value()) {
        return *output_error;
    }
    return stats;
}

}  // namespace bridge::runtime
