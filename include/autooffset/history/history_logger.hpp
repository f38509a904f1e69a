/**
 * @file history_logger.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "autooffset/history/i_history_store.hpp"

namespace aof {

/**
 * @brief Dedicated writer thread in front of an IHistoryStore.
 *
 * `log()` never blocks on the store. Queries are queued behind pending appends,
 * so a query observes every record logged before it.
 */
class HistoryLogger {
public:
    explicit HistoryLogger(std::unique_ptr<IHistoryStore> store);
    ~HistoryLogger();

    HistoryLogger(const HistoryLogger&) = delete;
    HistoryLogger& operator=(const HistoryLogger&) = delete;

    bool start();

    /**
     * @brief Drains queued work, then joins the writer.
     */
    void stop();

    void log(const OffsetChangeRecord& record);
    std::future<std::optional<OffsetChangeRecord>> queryLatest(std::uint16_t machineId, std::int16_t toolSlot);
    std::future<std::vector<OffsetChangeRecord>> queryRecent(std::size_t limit);
    std::future<std::vector<OffsetChangeRecord>> queryRecent(std::uint16_t machineId,
                                                             std::int16_t toolSlot,
                                                             std::size_t limit);

    std::uint64_t appendFailures() const;
    std::size_t queuedJobs() const;

private:
    using Job = std::function<void(IHistoryStore& store)>;

    bool enqueue(Job job);
    void run();

    std::unique_ptr<IHistoryStore> store_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Job> jobs_;
    bool running_ = false;
    bool stopping_ = false;
    std::uint64_t appendFailures_ = 0;
    std::thread writer_;
};

} // namespace aof
