#include "autooffset/calibration/batch_aggregator.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>

namespace aof {

BatchAggregator::BatchAggregator(ToolProfileTable& profiles, AvailabilityFn availability)
    : profiles_(profiles), availability_(std::move(availability)) {}

void BatchAggregator::insert(std::uint16_t machineId, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[machineId].push_back(value);
}

std::optional<double> BatchAggregator::tryExtract(std::uint16_t machineId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(machineId);
    if (it == queues_.end()) {
        return std::nullopt;
    }
    auto& queue = it->second;
    const bool available = !availability_ || availability_(machineId);
    if (queue.size() < threshold_) {
        return std::nullopt;
    }
    if (!available) {
        std::cerr << "[aof-batch] machine " << machineId << " unavailable, discarding batch of "
                  << queue.size() << " samples\n";
        queue.clear();
        ++discardedBatches_;
        return std::nullopt;
    }

    std::vector<double> batch;
    batch.swap(queue);
    const auto average = trimmedMean(std::move(batch));
    if (!average.has_value()) {
        return std::nullopt;
    }
    profiles_.recordAverage(machineId, *average);
    std::cout << "[aof-batch] machine " << machineId << " batch average " << *average << '\n';
    return average;
}

bool BatchAggregator::setThreshold(std::size_t threshold, std::string& outError) {
    if (threshold == 0U || threshold > kMaxThreshold) {
        outError = "batch threshold must be within 1.." + std::to_string(kMaxThreshold);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = threshold;
    return true;
}

std::size_t BatchAggregator::threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

std::size_t BatchAggregator::pendingCount(std::uint16_t machineId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(machineId);
    return it == queues_.end() ? 0U : it->second.size();
}

std::uint64_t BatchAggregator::discardedBatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discardedBatches_;
}

std::optional<double> BatchAggregator::trimmedMean(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }
    std::sort(values.begin(), values.end());
    auto first = values.begin();
    auto last = values.end();
    if (values.size() > 2U) {
        ++first;
        --last;
    }
    const double sum = std::accumulate(first, last, 0.0);
    return sum / static_cast<double>(std::distance(first, last));
}

} // namespace aof
