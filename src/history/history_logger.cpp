#include "autooffset/history/history_logger.hpp"

#include <iostream>

namespace aof {

HistoryLogger::HistoryLogger(std::unique_ptr<IHistoryStore> store) : store_(std::move(store)) {}

HistoryLogger::~HistoryLogger() { stop(); }

bool HistoryLogger::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || !store_) {
        return false;
    }
    running_ = true;
    stopping_ = false;
    writer_ = std::thread([this]() { run(); });
    std::cout << "[aof-history] writer started (" << store_->describe() << ")\n";
    return true;
}

void HistoryLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void HistoryLogger::log(const OffsetChangeRecord& record) {
    const bool queued = enqueue([this, record](IHistoryStore& store) {
        std::string error;
        if (!store.append(record, error)) {
            std::cerr << "[aof-history] append failed: " << error << '\n';
            std::lock_guard<std::mutex> lock(mutex_);
            ++appendFailures_;
        }
    });
    if (!queued) {
        std::cerr << "[aof-history] writer not running, record for machine " << record.machineId << " slot "
                  << record.toolSlot << " dropped\n";
    }
}

std::future<std::optional<OffsetChangeRecord>> HistoryLogger::queryLatest(std::uint16_t machineId,
                                                                          std::int16_t toolSlot) {
    auto promise = std::make_shared<std::promise<std::optional<OffsetChangeRecord>>>();
    auto future = promise->get_future();
    if (!enqueue([promise, machineId, toolSlot](IHistoryStore& store) {
            promise->set_value(store.latest(machineId, toolSlot));
        })) {
        promise->set_value(std::optional<OffsetChangeRecord>{});
    }
    return future;
}

std::future<std::vector<OffsetChangeRecord>> HistoryLogger::queryRecent(std::size_t limit) {
    auto promise = std::make_shared<std::promise<std::vector<OffsetChangeRecord>>>();
    auto future = promise->get_future();
    if (!enqueue([promise, limit](IHistoryStore& store) { promise->set_value(store.recent(limit)); })) {
        promise->set_value(std::vector<OffsetChangeRecord>{});
    }
    return future;
}

std::future<std::vector<OffsetChangeRecord>> HistoryLogger::queryRecent(std::uint16_t machineId,
                                                                      std::int16_t toolSlot,
                                                                      std::size_t limit) {
    auto promise = std::make_shared<std::promise<std::vector<OffsetChangeRecord>>>();
    auto future = promise->get_future();
    if (!enqueue([promise, machineId, toolSlot, limit](IHistoryStore& store) {
            promise->set_value(store.recent(machineId, toolSlot, limit));
        })) {
        promise->set_value(std::vector<OffsetChangeRecord>{});
    }
    return future;
}

std::uint64_t HistoryLogger::appendFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendFailures_;
}

std::size_t HistoryLogger::queuedJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool HistoryLogger::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    wake_.notify_one();
    return true;
}

void HistoryLogger::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job(*store_);
    }
}

} // namespace aof
