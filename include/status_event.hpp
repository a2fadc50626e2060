#ifndef STATUS_EVENT_HPP
#define STATUS_EVENT_HPP
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "channel.hpp"
#include "errors.hpp"

/**
 * @brief One progress or result record of a long running operation.
 *
 * A stream carries any number of intermediate records per file and ends with
 * a record holding "100%" or an error for that file.
 */
struct StatusEvent {
    std::string file_name;
    std::string state;      ///< Phase label, e.g. "Uploading (to: origin)"
    std::string progress;   ///< Percentage such as "42%", or empty
    std::string rate;       ///< "1.0 MiB/s", or empty
    std::string raw_input;  ///< Command line that produced the event
    std::string raw_output; ///< Tool output the event was parsed from
    std::optional<errors::Failure> error;
    bool notice = false; ///< Informational, never counted as a failure
};

using EventChannel = procutil::Channel<StatusEvent>;

/**
 * @brief Producer side of an EventStream. Safe for concurrent senders.
 */
class EventSink {
  public:
    explicit EventSink(std::shared_ptr<EventChannel> chan) : chan_(std::move(chan)) {}

    void send(StatusEvent ev) { chan_->push(std::move(ev)); }

    /** @brief Emit an error event for @p file. */
    void fail(const std::string& file, errors::Failure f, const std::string& input = "");

    /** @brief Emit a non-fatal notice. */
    void notice(const std::string& file, const std::string& state, const std::string& message);

  private:
    std::shared_ptr<EventChannel> chan_;
};

/**
 * @brief Lazy, finite and non-restartable sequence of status events.
 *
 * The producer runs on its own thread and the channel is closed exactly once
 * when it returns or throws. An exception escaping the producer becomes a
 * final error event. Destroying the stream waits for the producer.
 */
class EventStream {
  public:
    using Producer = std::function<void(EventSink&)>;

    explicit EventStream(Producer producer);

    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&&) noexcept = default;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /** @brief Next event, blocking; `std::nullopt` once the stream is done. */
    std::optional<StatusEvent> next() { return chan_->pop(); }

    /** @brief Drain the remaining events. */
    std::vector<StatusEvent> collect();

  private:
    std::shared_ptr<EventChannel> chan_;
    std::jthread worker_;
};

/**
 * @brief Copy every event of @p sub into @p sink.
 *
 * @return Number of events that carried an error.
 */
size_t forward(EventStream& sub, EventSink& sink);

#endif // STATUS_EVENT_HPP
