#include "status_event.hpp"
#include <exception>
#include "logger.hpp"

void EventSink::fail(const std::string& file, errors::Failure f, const std::string& input) {
    StatusEvent ev;
    ev.file_name = file;
    ev.raw_input = input;
    ev.raw_output = f.detail;
    ev.error = std::move(f);
    send(std::move(ev));
}

void EventSink::notice(const std::string& file, const std::string& state,
                       const std::string& message) {
    StatusEvent ev;
    ev.file_name = file;
    ev.state = state;
    ev.raw_output = message;
    ev.notice = true;
    send(std::move(ev));
}

namespace {

struct CloseOnExit {
    std::shared_ptr<EventChannel> chan;
    ~CloseOnExit() { chan->close(); }
};

void run_producer(const EventStream::Producer& producer, std::shared_ptr<EventChannel> chan) {
    CloseOnExit guard{chan};
    EventSink sink(chan);
    try {
        producer(sink);
    } catch (const errors::OperationError& e) {
        log_error("Operation failed", e.what());
        sink.fail("", e.failure());
    } catch (const std::exception& e) {
        log_error("Operation failed", e.what());
        sink.fail("", errors::Failure{errors::Category::Command, e.what(), {}, ""});
    }
}

} // namespace

EventStream::EventStream(Producer producer) : chan_(std::make_shared<EventChannel>()) {
    worker_ = std::jthread(run_producer, std::move(producer), chan_);
}

std::vector<StatusEvent> EventStream::collect() {
    std::vector<StatusEvent> out;
    while (auto ev = next())
        out.push_back(std::move(*ev));
    return out;
}

size_t forward(EventStream& sub, EventSink& sink) {
    size_t failed = 0;
    while (auto ev = sub.next()) {
        if (ev->error && !ev->notice)
            ++failed;
        sink.send(std::move(*ev));
    }
    return failed;
}
