#include "multi_pair_monitor.hpp"

#include <iostream>
#include <utility>

namespace zones {

MultiPairMonitor::MultiPairMonitor(bool log_progress)
    : log_progress_(log_progress) {}

void MultiPairMonitor::add_pair(PairContext context) {
    context.initialize_signals();
    std::string pair = context.pair_name;
    contexts_.insert_or_assign(pair, std::move(context));
}

bool MultiPairMonitor::update_model(const TradingModel& model, double price) {
    bool changed = true;
    auto it = contexts_.find(model.pair_name());
    if (it == contexts_.end()) {
        PairContext context(model, price);
        context.initialize_signals();
        it = contexts_.emplace(model.pair_name(), std::move(context)).first;
    } else {
        it->second.current_price = price;
        changed = it->second.replace_model(model);
    }

    if (log_progress_) {
        std::cout << "[MONITOR] pair=" << it->first << " price=" << price
                  << " zones=" << it->second.current_zones.size()
                  << " changed=" << changed << "\n";
    }
    return changed;
}

bool MultiPairMonitor::process_price_update(const std::string& pair,
                                            double new_price) {
    auto it = contexts_.find(pair);
    if (it == contexts_.end()) {
        return false;
    }

    PairContext& context = it->second;
    if (!context.needs_update(new_price)) {
        return false;
    }

    context.update(new_price);
    if (log_progress_) {
        std::cout << "[MONITOR] pair=" << pair << " transition price="
                  << new_price << " zones=" << context.current_zones.size()
                  << "\n";
    }
    return true;
}

std::vector<const PairContext*> MultiPairMonitor::get_signals() const {
    std::vector<const PairContext*> with_signals;
    for (const auto& [pair, context] : contexts_) {
        if (context.has_signals()) {
            with_signals.push_back(&context);
        }
    }
    return with_signals;
}

const PairContext* MultiPairMonitor::get_context(const std::string& pair) const {
    auto it = contexts_.find(pair);
    return it != contexts_.end() ? &it->second : nullptr;
}

std::vector<const PairContext*> MultiPairMonitor::get_all_contexts() const {
    std::vector<const PairContext*> all;
    all.reserve(contexts_.size());
    for (const auto& [pair, context] : contexts_) {
        all.push_back(&context);
    }
    return all;
}

std::map<std::string, std::vector<TradingSignal>>
MultiPairMonitor::get_all_signals() const {
    std::map<std::string, std::vector<TradingSignal>> all;
    for (const auto& [pair, context] : contexts_) {
        if (!context.signals.empty()) {
            all[pair] = context.signals;
        }
    }
    return all;
}

std::map<std::string, std::vector<std::string>>
MultiPairMonitor::pairs_by_zone_type() const {
    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& [pair, context] : contexts_) {
        for (const auto& [id, type] : context.current_zones) {
            grouped[to_string(type)].push_back(pair);
        }
    }
    return grouped;
}

} // namespace zones
