#include "publisher.hpp"
#include "zone_engine.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

struct ReplayOptions {
  std::string input_path;
  int64_t interval_ms{zones::MS_IN_30_MIN};
  std::size_t zone_count{100};
  double decay{1.5};
  std::size_t min_candles{100};
  std::map<std::string, double> prices;
  std::string nats_url;
  std::string stream = "ZONES";
  std::string subject_root = "pricezones";
  int timeout_sec{30};
};

void usage() {
  std::cerr << "Usage: zone_replay --input FILE [--interval-ms N] [--zones N] "
            << "[--decay F] [--min-candles N] [--price PAIR=VALUE ...] "
            << "[--timeout-sec N] [--nats-url URL] [--stream NAME] "
            << "[--subject-root ROOT]\n";
}

bool parse_price(const std::string &arg, ReplayOptions &options) {
  auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    std::cerr << "expected PAIR=VALUE, got: " << arg << "\n";
    return false;
  }
  options.prices[arg.substr(0, eq)] = std::stod(arg.substr(eq + 1));
  return true;
}

bool parse_args(int argc, char **argv, ReplayOptions &options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--input" && i + 1 < argc) {
      options.input_path = argv[++i];
    } else if (arg == "--interval-ms" && i + 1 < argc) {
      options.interval_ms = std::stoll(argv[++i]);
    } else if (arg == "--zones" && i + 1 < argc) {
      options.zone_count = std::stoul(argv[++i]);
    } else if (arg == "--decay" && i + 1 < argc) {
      options.decay = std::stod(argv[++i]);
    } else if (arg == "--min-candles" && i + 1 < argc) {
      options.min_candles = std::stoul(argv[++i]);
    } else if (arg == "--price" && i + 1 < argc) {
      if (!parse_price(argv[++i], options)) {
        return false;
      }
    } else if (arg == "--timeout-sec" && i + 1 < argc) {
      options.timeout_sec = std::stoi(argv[++i]);
    } else if (arg == "--nats-url" && i + 1 < argc) {
      options.nats_url = argv[++i];
    } else if (arg == "--stream" && i + 1 < argc) {
      options.stream = argv[++i];
    } else if (arg == "--subject-root" && i + 1 < argc) {
      options.subject_root = argv[++i];
    } else if (arg == "--help") {
      usage();
      return false;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usage();
      return false;
    }
  }
  if (options.input_path.empty()) {
    usage();
    return false;
  }
  return true;
}

using TimedCandle = std::pair<int64_t, zones::Candle>;

/// Dense series from time-sorted rows; missing bars become flat candles at
/// the previous close with zero volume
zones::OhlcvTimeSeries build_series(const std::string &pair,
                                    int64_t interval_ms,
                                    std::vector<TimedCandle> rows) {
  std::sort(rows.begin(), rows.end(),
            [](const TimedCandle &a, const TimedCandle &b) {
              return a.first < b.first;
            });

  zones::OhlcvTimeSeries series;
  series.pair_interval = zones::PairInterval(pair, interval_ms);
  if (rows.empty()) {
    return series;
  }
  series.first_timestamp_ms = rows.front().first;

  for (const auto &[ts, candle] : rows) {
    auto idx = static_cast<std::size_t>((ts - series.first_timestamp_ms) /
                                        interval_ms);
    if (idx < series.size()) {
      std::cerr << "duplicate candle for " << pair << " at " << ts
                << ", skipped\n";
      continue;
    }
    while (series.size() < idx) {
      double prev_close = series.close.back();
      series.push_back(
          zones::Candle(prev_close, prev_close, prev_close, prev_close, 0, 0));
    }
    series.push_back(candle);
  }
  return series;
}

bool load_csv(const std::string &path, int64_t interval_ms,
              zones::TimeSeriesCollection &collection) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "failed to open input file: " << path << "\n";
    return false;
  }

  std::map<std::string, std::vector<TimedCandle>> rows;
  std::string line;
  std::size_t count = 0;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::stringstream ss(line);
    std::vector<std::string> fields;
    std::string field;
    while (std::getline(ss, field, ',')) {
      fields.push_back(field);
    }
    if (fields.size() != 8) {
      std::cerr << "expected 8 fields in line: " << line << "\n";
      continue;
    }

    try {
      int64_t ts = std::stoll(fields[1]);
      zones::Candle candle(std::stod(fields[2]), std::stod(fields[3]),
                           std::stod(fields[4]), std::stod(fields[5]),
                           std::stod(fields[6]), std::stod(fields[7]));
      rows[fields[0]].emplace_back(ts, candle);
      ++count;
    } catch (const std::exception &ex) {
      std::cerr << "failed to parse line: " << line << " error: " << ex.what()
                << "\n";
    }
  }

  if (count == 0) {
    std::cerr << "no candles loaded from input" << std::endl;
    return false;
  }

  collection.name = path;
  for (auto &[pair, pair_rows] : rows) {
    collection.series.push_back(
        build_series(pair, interval_ms, std::move(pair_rows)));
  }
  std::cout << "loaded " << count << " candles for " << rows.size()
            << " pairs" << std::endl;
  return true;
}

void print_superzone(const char *label, const zones::SuperZone &sz) {
  std::cout << "  " << label << " id=" << sz.id << " range=["
            << sz.price_bottom << ", " << sz.price_top
            << "] zones=" << sz.zone_count() << "\n";
}

void print_model(const zones::ZoneEngine &engine, const std::string &pair) {
  auto model = engine.get_model(pair);
  zones::PairStatus status = engine.get_pair_status(pair);
  if (!model) {
    std::cout << pair << ": no model"
              << (status.last_error ? " (" + *status.last_error + ")" : "")
              << "\n";
    return;
  }

  std::cout << pair << ": price=" << model->current_price().value_or(0.0)
            << " candles=" << model->cva()->total_candles << "\n";
  const zones::ClassifiedZones &classified = model->zones();
  for (const auto &sz : classified.sticky_superzones) {
    print_superzone("sticky", sz);
  }
  for (const auto &sz : classified.slippy_superzones) {
    print_superzone("slippy", sz);
  }
  for (const auto &sz : classified.low_wicks_superzones) {
    print_superzone("low-wicks", sz);
  }
  for (const auto &sz : classified.high_wicks_superzones) {
    print_superzone("high-wicks", sz);
  }
  if (const auto *support = model->nearest_support_superzone()) {
    print_superzone("support", *support);
  }
  if (const auto *resistance = model->nearest_resistance_superzone()) {
    print_superzone("resistance", *resistance);
  }

  if (const auto *context = engine.monitor().get_context(pair)) {
    for (const auto &signal : context->signals) {
      std::cout << "  signal " << signal.description() << "\n";
    }
  }
}

} // namespace

int main(int argc, char **argv) {
  ReplayOptions options;
  try {
    if (!parse_args(argc, argv, options)) {
      return 1;
    }
  } catch (const std::exception &ex) {
    std::cerr << "invalid argument value: " << ex.what() << "\n";
    return 1;
  }

  // Reject bad settings before any candle is bucketed by interval
  zones::AnalysisConfig config;
  config.interval_width_ms = options.interval_ms;
  config.zone_count = options.zone_count;
  config.time_decay_factor = options.decay;
  config.min_candles_for_analysis = options.min_candles;
  try {
    config.validate();
  } catch (const std::invalid_argument &ex) {
    std::cerr << "invalid configuration: " << ex.what() << "\n";
    return 1;
  }

  auto collection = std::make_shared<zones::TimeSeriesCollection>();
  if (!load_csv(options.input_path, options.interval_ms, *collection)) {
    return 1;
  }

  auto prices = std::make_shared<zones::LivePriceStore>();
  for (const auto &series : collection->series) {
    auto it = options.prices.find(series.pair_interval.name);
    if (it != options.prices.end()) {
      prices->set_price(it->first, it->second);
    } else if (!series.empty()) {
      prices->set_price(series.pair_interval.name, series.close.back());
    }
  }

  std::unique_ptr<zones::ZoneEngine> engine;
  try {
    engine = std::make_unique<zones::ZoneEngine>(collection, prices, config);
  } catch (const std::exception &ex) {
    std::cerr << "failed to start engine: " << ex.what() << "\n";
    return 1;
  }

  if (!options.nats_url.empty()) {
    zones::JetStreamConfig js_cfg;
    js_cfg.url = options.nats_url;
    js_cfg.stream = options.stream;
    js_cfg.subject_root = options.subject_root;
    try {
      engine->set_publisher(std::make_shared<zones::JetStreamPublisher>(js_cfg));
    } catch (const std::exception &ex) {
      std::cerr << "failed to initialize JetStream publisher: " << ex.what()
                << "\n";
      return 1;
    }
  }

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(options.timeout_sec);
  while (engine->update()) {
    if (std::chrono::steady_clock::now() > deadline) {
      std::cerr << "timed out waiting for analysis: "
                << engine->worker_status_msg().value_or("idle") << "\n";
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  for (const auto &pair : engine->pair_names()) {
    print_model(*engine, pair);
  }
  return 0;
}
