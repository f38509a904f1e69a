/**
 * @file history_stores.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "autooffset/history/i_history_store.hpp"

namespace SQLite {
class Database;
}

namespace aof {

/**
 * @brief Bounded in-memory history; the oldest record is evicted once `capacity` is reached.
 */
class InMemoryHistoryStore final : public IHistoryStore {
public:
    static constexpr std::size_t kDefaultCapacity = 1000U;

    explicit InMemoryHistoryStore(std::size_t capacity = kDefaultCapacity);

    bool append(const OffsetChangeRecord& record, std::string& outError) override;
    std::optional<OffsetChangeRecord> latest(std::uint16_t machineId, std::int16_t toolSlot) const override;
    std::vector<OffsetChangeRecord> recent(std::size_t limit) const override;
    std::vector<OffsetChangeRecord> recent(std::uint16_t machineId,
                                           std::int16_t toolSlot,
                                           std::size_t limit) const override;
    std::string describe() const override { return "memory"; }

    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<OffsetChangeRecord> records_;
};

/**
 * @brief SQLite database holding the `offset_history` table.
 *
 * Timestamps are stored as milliseconds since the Unix epoch. Queries are
 * answered by the database, so records from earlier runs are included.
 */
class SqliteHistoryStore final : public IHistoryStore {
public:
    explicit SqliteHistoryStore(std::string path);
    ~SqliteHistoryStore() override;

    SqliteHistoryStore(const SqliteHistoryStore&) = delete;
    SqliteHistoryStore& operator=(const SqliteHistoryStore&) = delete;

    /**
     * @brief Create missing parent directories, open the database and create the table.
     */
    bool open(std::string& outError);

    bool append(const OffsetChangeRecord& record, std::string& outError) override;
    std::optional<OffsetChangeRecord> latest(std::uint16_t machineId, std::int16_t toolSlot) const override;
    std::vector<OffsetChangeRecord> recent(std::size_t limit) const override;
    std::vector<OffsetChangeRecord> recent(std::uint16_t machineId,
                                           std::int16_t toolSlot,
                                           std::size_t limit) const override;
    std::string describe() const override { return "sqlite:" + path_; }

    std::size_t count() const;

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::unique_ptr<SQLite::Database> db_;
};

} // namespace aof
