#include "pair_context.hpp"

#include <algorithm>
#include <sstream>

namespace zones {

namespace {

bool contains_zone(const std::vector<ZoneOccupancy>& zones,
                   const ZoneOccupancy& zone) {
    return std::find(zones.begin(), zones.end(), zone) != zones.end();
}

// Sticky superzones holding price are reported as Support/Resistance
bool is_sticky(ZoneType type) {
    return type == ZoneType::Sticky || type == ZoneType::Support ||
           type == ZoneType::Resistance;
}

} // namespace

const char* to_string(TradingSignal::Kind kind) {
    switch (kind) {
    case TradingSignal::Kind::ZoneEntered:
        return "ZoneEntered";
    case TradingSignal::Kind::ZoneExited:
        return "ZoneExited";
    case TradingSignal::Kind::InStickyZone:
        return "InStickyZone";
    default:
        return "Unknown";
    }
}

std::string TradingSignal::description() const {
    std::ostringstream out;
    switch (kind) {
    case Kind::ZoneEntered:
        out << "Entered " << to_string(zone_type) << " superzone "
            << superzone_id;
        break;
    case Kind::ZoneExited:
        out << "Exited " << to_string(zone_type) << " superzone "
            << superzone_id;
        break;
    case Kind::InStickyZone:
        out << "In sticky superzone " << superzone_id;
        break;
    }
    return out.str();
}

PairContext::PairContext(TradingModel model, double initial_price)
    : pair_name(model.pair_name()), current_price(initial_price),
      trading_model(std::move(model)),
      last_updated(std::chrono::system_clock::now()) {
    trading_model.update_price(initial_price);
    current_zones = trading_model.find_superzones_at_price(initial_price);
}

void PairContext::initialize_signals() {
    signals.clear();
    for (const auto& [id, type] : current_zones) {
        if (is_sticky(type)) {
            signals.push_back({TradingSignal::Kind::InStickyZone, id, type});
        }
    }
}

bool PairContext::needs_update(double new_price) const {
    return trading_model.find_superzones_at_price(new_price) != current_zones;
}

void PairContext::update(double new_price) {
    std::vector<ZoneOccupancy> previous = std::move(current_zones);
    current_price = new_price;
    trading_model.update_price(new_price);
    current_zones = trading_model.find_superzones_at_price(new_price);
    last_updated = std::chrono::system_clock::now();
    rebuild_signals(previous);
}

bool PairContext::replace_model(TradingModel model) {
    std::vector<ZoneOccupancy> previous = std::move(current_zones);
    trading_model = std::move(model);
    trading_model.update_price(current_price);
    current_zones = trading_model.find_superzones_at_price(current_price);
    last_updated = std::chrono::system_clock::now();
    if (current_zones == previous) {
        return false;
    }
    rebuild_signals(previous);
    return true;
}

void PairContext::rebuild_signals(const std::vector<ZoneOccupancy>& previous) {
    signals.clear();

    for (const auto& zone : previous) {
        if (!contains_zone(current_zones, zone)) {
            signals.push_back(
                {TradingSignal::Kind::ZoneExited, zone.first, zone.second});
        }
    }
    for (const auto& zone : current_zones) {
        if (!contains_zone(previous, zone)) {
            signals.push_back(
                {TradingSignal::Kind::ZoneEntered, zone.first, zone.second});
        }
    }
    // Occupancy signals are restated on every transition
    for (const auto& [id, type] : current_zones) {
        if (is_sticky(type)) {
            signals.push_back({TradingSignal::Kind::InStickyZone, id, type});
        }
    }
}

bool PairContext::has_signals() const {
    return std::any_of(signals.begin(), signals.end(),
                       [](const TradingSignal& s) { return s.is_signal(); });
}

} // namespace zones
