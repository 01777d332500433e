#pragma once

#include "pair_context.hpp"
#include "trading_model.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zones {

struct JetStreamConfig {
  std::string url;
  std::string stream;
  std::string subject_root;
  std::chrono::milliseconds publish_timeout{500};
};

/// Abstract publisher interface for emitting zone snapshots and signals.
class ZonePublisher {
public:
  virtual ~ZonePublisher() = default;

  /// Publish a freshly computed model (after a front-buffer swap).
  virtual void publish_model(const TradingModel &model) = 0;

  /// Publish the signals of a zone-occupancy transition.
  virtual void publish_signals(const PairContext &context) = 0;
};

/// Serialize a model as pricezones.v1.ZoneSnapshot
/// @throws std::runtime_error if serialization fails
std::string encode_snapshot(const TradingModel &model);

/// JetStream de-duplication id for a snapshot on `subject`. Two models get
/// the same id only if window, candle count, zone count, decay and price
/// all match.
std::string snapshot_msg_id(const std::string &subject,
                            const TradingModel &model);

/// Serialize a context as pricezones.v1.PairSignals
/// @throws std::runtime_error if serialization fails
std::string encode_signals(const PairContext &context);

/// One encoded message as it would go on the wire
struct PublishedMessage {
  std::string pair;
  std::string payload;
};

/// In-memory publisher used for tests and bootstrap scaffolding.
class InMemoryPublisher : public ZonePublisher {
public:
  void publish_model(const TradingModel &model) override;
  void publish_signals(const PairContext &context) override;

  std::vector<PublishedMessage> snapshots() const;
  std::vector<PublishedMessage> signals() const;

private:
  mutable std::mutex mutex_;
  std::vector<PublishedMessage> snapshots_;
  std::vector<PublishedMessage> signals_;
};

/// JetStream publisher that serializes zones to protobuf and writes to NATS.
class JetStreamPublisher : public ZonePublisher {
public:
  explicit JetStreamPublisher(const JetStreamConfig &config);
  ~JetStreamPublisher() override;

  void publish_model(const TradingModel &model) override;
  void publish_signals(const PairContext &context) override;

private:
  std::string build_subject(const std::string &kind,
                            const std::string &pair) const;
  std::string sanitize_token(const std::string &token) const;
  void publish_payload(const std::string &subject, const std::string &msg_id,
                       const std::string &payload);

  struct Connection; // NATS connection + JetStream context
  JetStreamConfig config_;
  std::unique_ptr<Connection> conn_;
  mutable std::mutex mutex_;
};

} // namespace zones
