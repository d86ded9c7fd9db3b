#include "../include/event_sink.hpp"
#include "../include/util.hpp"

AsyncEventSink::AsyncEventSink(Consumer consumer, std::size_t capacity)
    : consumer_(std::move(consumer)), capacity_(capacity == 0 ? 1 : capacity) {
    thread_ = std::thread(&AsyncEventSink::run, this);
}

AsyncEventSink::~AsyncEventSink() {
    stop();
}

void AsyncEventSink::emit(PipelineEvent ev) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) return;
        if (queue_.size() >= capacity_) {
            ++dropped_;
            log_warn("event", "sink backlog full, dropping " + ev.kind + " event for job " + ev.job_id);
            return;
        }
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void AsyncEventSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_ && !thread_.joinable()) return;
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

std::uint64_t AsyncEventSink::dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}

std::uint64_t AsyncEventSink::delivered() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return delivered_;
}

void AsyncEventSink::run() {
    while (true) {
        PipelineEvent ev;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&] { return stop_ || !queue_.empty(); });
            if (queue_.empty()) break;  // stopping and drained
            ev = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            consumer_(ev);
        } catch (const std::exception& e) {
            log_error("event", std::string("consumer failed: ") + e.what());
        }
        std::lock_guard<std::mutex> lock(mtx_);
        ++delivered_;
    }
}

JsonLinesEventLog::JsonLinesEventLog(const std::string& path) {
    if (path.empty()) return;
    out_.open(path, std::ios::app);
    if (!out_) log_warn("event", "cannot open event log " + path + ", logging to stdout only");
}

void JsonLinesEventLog::operator()(const PipelineEvent& ev) {
    std::string line = to_json(ev).dump();
    log_info("event", line);
    std::lock_guard<std::mutex> lock(mtx_);
    if (out_.is_open()) out_ << line << '\n' << std::flush;
}

nlohmann::json to_json(const PipelineEvent& ev) {
    return nlohmann::json{{"job_id", ev.job_id}, {"kind", ev.kind}, {"at", ev.at}, {"payload", ev.payload}};
}
