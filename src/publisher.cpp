#include "publisher.hpp"
#include "cva_cache.hpp"
#include "pricezones/v1/zones.pb.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace zones {

namespace {

void fill_superzone(const SuperZone &sz, pricezones::v1::SuperZone *out) {
  out->set_id(sz.id);
  out->set_first_index(sz.index_range.first);
  out->set_last_index(sz.index_range.second);
  out->set_price_bottom(sz.price_bottom);
  out->set_price_top(sz.price_top);
  out->set_price_center(sz.price_center);
}

void fill_superzones(
    const std::vector<SuperZone> &superzones,
    google::protobuf::RepeatedPtrField<pricezones::v1::SuperZone> *out) {
  for (const auto &sz : superzones) {
    fill_superzone(sz, out->Add());
  }
}

pricezones::v1::ZoneType toProtoZoneType(ZoneType type) {
  switch (type) {
  case ZoneType::Sticky:
    return pricezones::v1::ZONE_TYPE_STICKY;
  case ZoneType::Slippy:
    return pricezones::v1::ZONE_TYPE_SLIPPY;
  case ZoneType::Support:
    return pricezones::v1::ZONE_TYPE_SUPPORT;
  case ZoneType::Resistance:
    return pricezones::v1::ZONE_TYPE_RESISTANCE;
  case ZoneType::LowWicks:
    return pricezones::v1::ZONE_TYPE_LOW_WICKS;
  case ZoneType::HighWicks:
    return pricezones::v1::ZONE_TYPE_HIGH_WICKS;
  case ZoneType::Neutral:
    return pricezones::v1::ZONE_TYPE_NEUTRAL;
  default:
    return pricezones::v1::ZONE_TYPE_UNSPECIFIED;
  }
}

pricezones::v1::Signal::Kind toProtoKind(TradingSignal::Kind kind) {
  switch (kind) {
  case TradingSignal::Kind::ZoneEntered:
    return pricezones::v1::Signal::KIND_ZONE_ENTERED;
  case TradingSignal::Kind::ZoneExited:
    return pricezones::v1::Signal::KIND_ZONE_EXITED;
  case TradingSignal::Kind::InStickyZone:
    return pricezones::v1::Signal::KIND_IN_STICKY_ZONE;
  default:
    return pricezones::v1::Signal::KIND_UNSPECIFIED;
  }
}

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace

std::string encode_snapshot(const TradingModel &model) {
  pricezones::v1::ZoneSnapshot snapshot;
  snapshot.set_pair(model.pair_name());

  if (const auto &cva = model.cva()) {
    auto [price_min, price_max] = cva->price_range().min_max();
    snapshot.set_zone_count(cva->zone_count);
    snapshot.set_price_min(price_min);
    snapshot.set_price_max(price_max);
    snapshot.set_time_decay_factor(cva->time_decay_factor);
    snapshot.set_decay_multiplier(cva->decay_multiplier);
    snapshot.set_start_timestamp_ms(cva->start_timestamp_ms);
    snapshot.set_end_timestamp_ms(cva->end_timestamp_ms);
    snapshot.set_total_candles(cva->total_candles);
  }

  if (auto price = model.current_price()) {
    snapshot.set_has_current_price(true);
    snapshot.set_current_price(*price);
  }

  const ClassifiedZones &classified = model.zones();
  fill_superzones(classified.sticky_superzones, snapshot.mutable_sticky());
  fill_superzones(classified.slippy_superzones, snapshot.mutable_slippy());
  fill_superzones(classified.low_wicks_superzones, snapshot.mutable_low_wicks());
  fill_superzones(classified.high_wicks_superzones, snapshot.mutable_high_wicks());

  if (const SuperZone *support = model.nearest_support_superzone()) {
    fill_superzone(*support, snapshot.mutable_support());
  }
  if (const SuperZone *resistance = model.nearest_resistance_superzone()) {
    fill_superzone(*resistance, snapshot.mutable_resistance());
  }

  std::string payload;
  if (!snapshot.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize zone snapshot protobuf");
  }
  return payload;
}

std::string snapshot_msg_id(const std::string &subject,
                            const TradingModel &model) {
  std::string msg_id = subject;
  if (const auto &cva = model.cva()) {
    msg_id += ":" + std::to_string(cva->start_timestamp_ms) + ":" +
              std::to_string(cva->end_timestamp_ms) + ":" +
              std::to_string(cva->total_candles) + ":" +
              std::to_string(cva->zone_count) + ":" +
              std::to_string(double_bits(cva->time_decay_factor));
  }
  if (auto price = model.current_price()) {
    msg_id += ":" + std::to_string(double_bits(*price));
  }
  return msg_id;
}

std::string encode_signals(const PairContext &context) {
  pricezones::v1::PairSignals message;
  message.set_pair(context.pair_name);
  message.set_current_price(context.current_price);
  message.set_updated_at_ms(toEpochMs(context.last_updated));

  for (const auto &[id, type] : context.current_zones) {
    auto *zone = message.add_current_zones();
    zone->set_superzone_id(id);
    zone->set_zone_type(toProtoZoneType(type));
  }

  for (const auto &signal : context.signals) {
    auto *out = message.add_signals();
    out->set_kind(toProtoKind(signal.kind));
    out->set_superzone_id(signal.superzone_id);
    out->set_zone_type(toProtoZoneType(signal.zone_type));
    out->set_description(signal.description());
  }

  std::string payload;
  if (!message.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize pair signals protobuf");
  }
  return payload;
}

void InMemoryPublisher::publish_model(const TradingModel &model) {
  PublishedMessage message{model.pair_name(), encode_snapshot(model)};
  std::lock_guard<std::mutex> lock(mutex_);
  snapshots_.push_back(std::move(message));
}

void InMemoryPublisher::publish_signals(const PairContext &context) {
  PublishedMessage message{context.pair_name, encode_signals(context)};
  std::lock_guard<std::mutex> lock(mutex_);
  signals_.push_back(std::move(message));
}

std::vector<PublishedMessage> InMemoryPublisher::snapshots() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_;
}

std::vector<PublishedMessage> InMemoryPublisher::signals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signals_;
}

} // namespace zones
