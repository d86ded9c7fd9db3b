#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

struct PipelineEvent {
    std::string job_id;
    std::string kind;  // "state", "fetch_progress", "transfer_progress"
    nlohmann::json payload;
    std::int64_t at{0};
};

class EventSink {
public:
    virtual ~EventSink() = default;
    // Must return promptly whatever the consumer is doing.
    virtual void emit(PipelineEvent ev) = 0;
};

// Hands events to a consumer on a background thread through a bounded
// queue. When the queue is full the event is dropped and the drop logged.
class AsyncEventSink : public EventSink {
public:
    using Consumer = std::function<void(const PipelineEvent&)>;

    AsyncEventSink(Consumer consumer, std::size_t capacity);
    ~AsyncEventSink() override;

    void emit(PipelineEvent ev) override;
    void stop();

    std::uint64_t dropped() const;
    std::uint64_t delivered() const;

private:
    void run();

    Consumer consumer_;
    std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<PipelineEvent> queue_;
    bool stop_{false};
    std::uint64_t dropped_{0};
    std::uint64_t delivered_{0};
    std::thread thread_;
};

// Default consumer: one JSON line per event under the [event] tag, also
// appended to `path` when it is not empty.
class JsonLinesEventLog {
public:
    explicit JsonLinesEventLog(const std::string& path);
    void operator()(const PipelineEvent& ev);

private:
    std::mutex mtx_;
    std::ofstream out_;
};

nlohmann::json to_json(const PipelineEvent& ev);
