#include "price_range.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace zones {

PriceRangePartition::PriceRangePartition(double start, double end,
                                         std::size_t n_chunks)
    : start_(start), end_(end), n_chunks_(n_chunks) {
    if (n_chunks_ == 0) {
        throw std::invalid_argument("n_chunks must be > 0");
    }
    // Written as !(end > start) so NaN bounds are rejected too
    if (!(end_ > start_)) {
        throw std::invalid_argument("price range end (" + std::to_string(end_) +
                                    ") must be > start (" +
                                    std::to_string(start_) + ")");
    }
}

std::size_t PriceRangePartition::chunk_index(double price) const {
    double index = std::floor((price - start_) / chunk_size());
    if (!(index > 0.0)) {
        return 0;
    }
    if (index >= static_cast<double>(n_chunks_ - 1)) {
        return n_chunks_ - 1;
    }
    return static_cast<std::size_t>(index);
}

std::size_t PriceRangePartition::count_intersecting_chunks(double low,
                                                           double high) const {
    if (high < low) {
        std::swap(low, high);
    }

    // Outside the partition on either side: nothing intersects
    if (high < start_ || low > end_) {
        return 0;
    }

    const double last_possible = static_cast<double>(n_chunks_ - 1);
    double first = std::min(
        last_possible, std::max(0.0, std::floor((low - start_) / chunk_size())));
    double last =
        std::min(last_possible, std::floor((high - start_) / chunk_size()));

    if (last < first) {
        return 0;
    }
    return static_cast<std::size_t>(last - first) + 1;
}

std::pair<double, double>
PriceRangePartition::chunk_bounds(std::size_t index) const {
    if (index >= n_chunks_) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " out of range");
    }
    double bottom = start_ + static_cast<double>(index) * chunk_size();
    return {bottom, bottom + chunk_size()};
}

} // namespace zones
