#include "zone_worker.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace zones {

AnalysisWorker::AnalysisWorker(std::shared_ptr<PairAnalyzer> analyzer,
                               uint32_t num_threads)
    : analyzer_(std::move(analyzer)), num_threads_(num_threads),
      running_(false), jobs_completed_(0) {
    if (!analyzer_) {
        throw std::invalid_argument("analyzer must not be null");
    }
    if (num_threads_ == 0) {
        throw std::invalid_argument("num_threads must be > 0");
    }
}

AnalysisWorker::~AnalysisWorker() {
    stop();
}

void AnalysisWorker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return; // Already running
    }
    if (jobs_.closed()) {
        running_ = false;
        throw std::logic_error("AnalysisWorker cannot be restarted after stop");
    }

    worker_threads_.reserve(num_threads_);
    for (uint32_t i = 0; i < num_threads_; ++i) {
        worker_threads_.emplace_back([this]() { worker_loop(); });
    }

    std::cout << "AnalysisWorker started with " << num_threads_
              << " threads\n";
}

void AnalysisWorker::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        jobs_.close();
        return; // Already stopped
    }

    jobs_.close();
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();
    results_.close();

    std::cout << "AnalysisWorker stopped after " << jobs_completed_
              << " jobs\n";
}

bool AnalysisWorker::submit(JobRequest request) {
    return jobs_.send(std::move(request));
}

std::optional<JobResult> AnalysisWorker::poll_result() {
    return results_.try_recv();
}

std::optional<JobResult> AnalysisWorker::wait_result() {
    return results_.recv();
}

void AnalysisWorker::worker_loop() {
    while (auto request = jobs_.recv()) {
        JobResult result = run_job(*request);
        ++jobs_completed_;
        // Engine gone or shutting down: result is dropped
        results_.send(std::move(result));
    }
}

JobResult AnalysisWorker::run_job(const JobRequest& request) {
    JobResult result;
    result.pair_name = request.pair_name;

    auto start = std::chrono::steady_clock::now();
    try {
        result.model = analyzer_->analyze(request);
        if (!result.model) {
            result.error = "analyzer returned no model";
        }
    } catch (const std::exception& ex) {
        result.model.reset();
        result.error = std::string(ex.what());
    }
    result.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count());

    return result;
}

} // namespace zones
