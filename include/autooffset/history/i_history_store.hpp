/**
 * @file i_history_store.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "autooffset/core/measurement.hpp"

namespace aof {

/**
 * @brief Append-only store of offset change records.
 */
class IHistoryStore {
public:
    virtual ~IHistoryStore() = default;

    virtual bool append(const OffsetChangeRecord& record, std::string& outError) = 0;
    virtual std::optional<OffsetChangeRecord> latest(std::uint16_t machineId, std::int16_t toolSlot) const = 0;

    /**
     * @brief Up to `limit` records, newest first.
     */
    virtual std::vector<OffsetChangeRecord> recent(std::size_t limit) const = 0;

    /**
     * @brief Up to `limit` records of one tool slot, newest first.
     */
    virtual std::vector<OffsetChangeRecord> recent(std::uint16_t machineId,
                                                   std::int16_t toolSlot,
                                                   std::size_t limit) const = 0;
    virtual std::string describe() const = 0;
};

} // namespace aof
