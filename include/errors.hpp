#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace zones {

/// Base class for failures of a single pair analysis attempt
class AnalysisError : public std::runtime_error {
public:
  explicit AnalysisError(const std::string &what) : std::runtime_error(what) {}
};

/// Not enough candles in the selected ranges to produce meaningful zones
class InsufficientDataError : public AnalysisError {
public:
  InsufficientDataError(const std::string &pair, std::size_t have,
                        std::size_t need)
      : AnalysisError("Insufficient data: " + pair + " has only " +
                      std::to_string(have) + " candles (minimum: " +
                      std::to_string(need) + ")"),
        have_(have), need_(need) {}

  std::size_t have() const { return have_; }
  std::size_t need() const { return need_; }

private:
  std::size_t have_;
  std::size_t need_;
};

/// Requested pair is not part of the loaded series
class InvalidPairError : public AnalysisError {
public:
  explicit InvalidPairError(const std::string &pair)
      : AnalysisError("Invalid pair: no OHLCV data loaded for " + pair),
        pair_(pair) {}

  const std::string &pair() const { return pair_; }

private:
  std::string pair_;
};

} // namespace zones
