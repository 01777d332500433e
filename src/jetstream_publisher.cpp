#include "publisher.hpp"

#include <cctype>
#include <chrono>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nats.h>

namespace zones {

struct JetStreamPublisher::Connection {
  natsConnection *nc{nullptr};
  jsCtx *js{nullptr};

  ~Connection() {
    if (js != nullptr) {
      jsCtx_Destroy(js);
      js = nullptr;
    }
    if (nc != nullptr) {
      natsConnection_Close(nc);
      natsConnection_Destroy(nc);
      nc = nullptr;
    }
  }
};

namespace {

std::string natsErrorMessage(natsStatus status) {
  const char *text = natsStatus_GetText(status);
  return text != nullptr ? std::string{text} : std::string{"unknown"};
}

int64_t nowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

JetStreamPublisher::JetStreamPublisher(const JetStreamConfig &config)
    : config_(config), conn_(std::make_unique<Connection>()) {
  natsOptions *opts = nullptr;
  natsStatus status = natsOptions_Create(&opts);
  if (status != NATS_OK) {
    throw std::runtime_error("natsOptions_Create failed: " +
                             natsErrorMessage(status));
  }

  if (config_.url.empty()) {
    config_.url = "nats://127.0.0.1:4222";
  }
  if (config_.subject_root.empty()) {
    config_.subject_root = "pricezones";
  }

  status = natsOptions_SetURL(opts, config_.url.c_str());
  if (status != NATS_OK) {
    natsOptions_Destroy(opts);
    throw std::runtime_error("natsOptions_SetURL failed: " +
                             natsErrorMessage(status));
  }

  status = natsConnection_Connect(&conn_->nc, opts);
  natsOptions_Destroy(opts);
  if (status != NATS_OK) {
    throw std::runtime_error("natsConnection_Connect failed: " +
                             natsErrorMessage(status));
  }

  status = natsConnection_JetStream(&conn_->js, conn_->nc, nullptr);
  if (status != NATS_OK) {
    throw std::runtime_error("natsConnection_JetStream failed: " +
                             natsErrorMessage(status));
  }
}

JetStreamPublisher::~JetStreamPublisher() = default;

std::string JetStreamPublisher::sanitize_token(const std::string &token) const {
  std::string sanitized;
  sanitized.reserve(token.size());
  for (char c : token) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('_');
    }
  }
  return sanitized;
}

std::string JetStreamPublisher::build_subject(const std::string &kind,
                                              const std::string &pair) const {
  std::ostringstream subject;
  subject << config_.subject_root << '.' << kind << '.' << sanitize_token(pair);
  return subject.str();
}

void JetStreamPublisher::publish_model(const TradingModel &model) {
  std::string subject = build_subject("zones", model.pair_name());
  // Identical computations share an id; the stream drops the duplicate
  publish_payload(subject, snapshot_msg_id(subject, model),
                  encode_snapshot(model));
}

void JetStreamPublisher::publish_signals(const PairContext &context) {
  std::string subject = build_subject("signals", context.pair_name);
  auto updated_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        context.last_updated.time_since_epoch())
                        .count();
  std::string msg_id = subject + ":" + std::to_string(updated_ms);
  publish_payload(subject, msg_id, encode_signals(context));
}

void JetStreamPublisher::publish_payload(const std::string &subject,
                                         const std::string &msg_id,
                                         const std::string &payload) {
  if (!conn_ || conn_->js == nullptr) {
    throw std::runtime_error("JetStream context not initialized");
  }

  if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("payload too large for js_Publish");
  }

  jsPubAck *ack = nullptr;
  jsErrCode err_code = static_cast<jsErrCode>(0);

  jsPubOptions opts;
  jsPubOptions_Init(&opts);
  if (!config_.stream.empty()) {
    opts.ExpectStream = config_.stream.c_str();
  }
  opts.MsgId = msg_id.c_str();
  if (config_.publish_timeout.count() > 0) {
    opts.MaxWait = config_.publish_timeout.count();
  }

  natsStatus status;
  int64_t started = nowMs();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = js_Publish(&ack, conn_->js, subject.c_str(), payload.data(),
                        static_cast<int>(payload.size()), &opts, &err_code);
  }

  if (ack != nullptr) {
    jsPubAck_Destroy(ack);
  }

  if (status != NATS_OK) {
    throw std::runtime_error("js_Publish failed: " + natsErrorMessage(status) +
                             ", jsErrCode=" + std::to_string(err_code) +
                             ", subject=" + subject + ", waited_ms=" +
                             std::to_string(nowMs() - started));
  }
}

} // namespace zones
