#include "autooffset/history/history_stores.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <SQLiteCpp/Database.h>
#include <SQLiteCpp/Exception.h>
#include <SQLiteCpp/Statement.h>

namespace aof {
namespace {

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS offset_history ("
    "id INTEGER PRIMARY KEY, "
    "timestamp INTEGER NOT NULL, "
    "machine_id INTEGER NOT NULL, "
    "tool_num INTEGER NOT NULL, "
    "old_value INTEGER NOT NULL, "
    "change_amount INTEGER NOT NULL, "
    "new_value INTEGER NOT NULL, "
    "success INTEGER NOT NULL)";

constexpr const char* kCreateIndex =
    "CREATE INDEX IF NOT EXISTS offset_history_tool ON offset_history (machine_id, tool_num, timestamp)";

constexpr const char* kSelectColumns =
    "SELECT timestamp, machine_id, tool_num, old_value, change_amount, new_value, success FROM offset_history ";

std::int64_t toMillis(std::chrono::system_clock::time_point timestamp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
}

OffsetChangeRecord rowToRecord(SQLite::Statement& query) {
    OffsetChangeRecord record;
    record.timestamp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(query.getColumn(0).getInt64())));
    record.machineId = static_cast<std::uint16_t>(query.getColumn(1).getInt());
    record.toolSlot = static_cast<std::int16_t>(query.getColumn(2).getInt());
    record.oldValue = query.getColumn(3).getInt();
    record.delta = query.getColumn(4).getInt();
    record.newValue = query.getColumn(5).getInt();
    record.success = query.getColumn(6).getInt() != 0;
    return record;
}

std::vector<OffsetChangeRecord> collect(SQLite::Statement& query) {
    std::vector<OffsetChangeRecord> out;
    while (query.executeStep()) {
        out.push_back(rowToRecord(query));
    }
    return out;
}

std::int64_t sqlLimit(std::size_t limit) {
    constexpr std::size_t kMaxLimit = 0x7FFFFFFFU;
    return static_cast<std::int64_t>(limit < kMaxLimit ? limit : kMaxLimit);
}

} // namespace

InMemoryHistoryStore::InMemoryHistoryStore(std::size_t capacity) : capacity_(capacity > 0U ? capacity : 1U) {}

bool InMemoryHistoryStore::append(const OffsetChangeRecord& record, std::string& outError) {
    (void)outError;
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
    return true;
}

std::optional<OffsetChangeRecord> InMemoryHistoryStore::latest(std::uint16_t machineId,
                                                               std::int16_t toolSlot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->machineId == machineId && it->toolSlot == toolSlot) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<OffsetChangeRecord> InMemoryHistoryStore::recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OffsetChangeRecord> out;
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::vector<OffsetChangeRecord> InMemoryHistoryStore::recent(std::uint16_t machineId,
                                                             std::int16_t toolSlot,
                                                             std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OffsetChangeRecord> out;
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it) {
        if (it->machineId == machineId && it->toolSlot == toolSlot) {
            out.push_back(*it);
        }
    }
    return out;
}

std::size_t InMemoryHistoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

SqliteHistoryStore::SqliteHistoryStore(std::string path) : path_(std::move(path)) {}

SqliteHistoryStore::~SqliteHistoryStore() = default;

bool SqliteHistoryStore::open(std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            outError = "Failed to create history directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    try {
        auto db = std::make_unique<SQLite::Database>(path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        db->exec(kCreateTable);
        db->exec(kCreateIndex);
        db_ = std::move(db);
    } catch (const SQLite::Exception& ex) {
        outError = "Failed to open history database " + path_ + ": " + ex.what();
        return false;
    }
    return true;
}

bool SqliteHistoryStore::append(const OffsetChangeRecord& record, std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        outError = "history database not open: " + path_;
        return false;
    }
    try {
        SQLite::Statement insert(*db_,
                                 "INSERT INTO offset_history (timestamp, machine_id, tool_num, old_value, "
                                 "change_amount, new_value, success) VALUES (?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, toMillis(record.timestamp));
        insert.bind(2, static_cast<int>(record.machineId));
        insert.bind(3, static_cast<int>(record.toolSlot));
        insert.bind(4, record.oldValue);
        insert.bind(5, record.delta);
        insert.bind(6, record.newValue);
        insert.bind(7, record.success ? 1 : 0);
        insert.exec();
    } catch (const SQLite::Exception& ex) {
        outError = "insert into " + path_ + " failed: " + ex.what();
        return false;
    }
    return true;
}

std::optional<OffsetChangeRecord> SqliteHistoryStore::latest(std::uint16_t machineId, std::int16_t toolSlot) const {
    const auto rows = recent(machineId, toolSlot, 1U);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

std::vector<OffsetChangeRecord> SqliteHistoryStore::recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || limit == 0U) {
        return {};
    }
    try {
        SQLite::Statement query(*db_, std::string(kSelectColumns) + "ORDER BY timestamp DESC, id DESC LIMIT ?");
        query.bind(1, sqlLimit(limit));
        return collect(query);
    } catch (const SQLite::Exception& ex) {
        std::cerr << "[aof-history] query on " << path_ << " failed: " << ex.what() << '\n';
        return {};
    }
}

std::vector<OffsetChangeRecord> SqliteHistoryStore::recent(std::uint16_t machineId,
                                                           std::int16_t toolSlot,
                                                           std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || limit == 0U) {
        return {};
    }
    try {
        SQLite::Statement query(*db_, std::string(kSelectColumns) +
                                          "WHERE machine_id = ? AND tool_num = ? "
                                          "ORDER BY timestamp DESC, id DESC LIMIT ?");
        query.bind(1, static_cast<int>(machineId));
        query.bind(2, static_cast<int>(toolSlot));
        query.bind(3, sqlLimit(limit));
        return collect(query);
    } catch (const SQLite::Exception& ex) {
        std::cerr << "[aof-history] query on " << path_ << " failed: " << ex.what() << '\n';
        return {};
    }
}

std::size_t SqliteHistoryStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0U;
    }
    try {
        SQLite::Statement query(*db_, "SELECT COUNT(*) FROM offset_history");
        if (query.executeStep()) {
            return static_cast<std::size_t>(query.getColumn(0).getInt64());
        }
    } catch (const SQLite::Exception& ex) {
        std::cerr << "[aof-history] count on " << path_ << " failed: " << ex.what() << '\n';
    }
    return 0U;
}

} // namespace aof
