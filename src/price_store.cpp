#include "price_store.hpp"

#include <algorithm>
#include <cctype>

namespace zones {

std::string LivePriceStore::normalize(const std::string& symbol) {
    std::string lowered(symbol);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

void LivePriceStore::set_price(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (suspended_) {
        return;
    }
    prices_[normalize(symbol)] = price;
}

std::optional<double> LivePriceStore::get_price(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(normalize(symbol));
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, double> LivePriceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prices_;
}

void LivePriceStore::suspend() {
    std::lock_guard<std::mutex> lock(mutex_);
    suspended_ = true;
}

void LivePriceStore::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    suspended_ = false;
}

bool LivePriceStore::is_suspended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suspended_;
}

} // namespace zones
