#include "ExpirationExecutor.hpp"

#include <exception>
#include <stdexcept>
#include <string>

ExpirationExecutor::ExpirationExecutor(size_t thread_count, std::shared_ptr<ILogger> logger)
    : logger_(logger), shutdown_(false) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ExpirationExecutor");
    }
    if (thread_count == 0) {
        throw std::invalid_argument("ExpirationExecutor needs at least one thread");
    }

    // Keep ioc_.run() from returning while no timer is armed
    work_guard_.emplace(net::make_work_guard(ioc_));

    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this, i] { worker_thread(i); });
    }
    logger_->setup("ExpirationExecutor initialized with " + std::to_string(thread_count) + " threads");
}

ExpirationExecutor::ExpirationExecutor(const CacheConfig& config, std::shared_ptr<ILogger> logger)
    : ExpirationExecutor(config.scheduler_threads, logger) {}

ExpirationExecutor::~ExpirationExecutor() {
    shutdown();
}

void ExpirationExecutor::shutdown() {
    if (shutdown_.exchange(true)) {
        return; // Already shutting down
    }
    logger_->debug("Shutting down ExpirationExecutor...");
    work_guard_.reset();
    ioc_.stop();
    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    logger_->debug("ExpirationExecutor shut down complete.");
}

void ExpirationExecutor::worker_thread(size_t index) {
    logger_->debug("Expiration thread " + std::to_string(index) + " started.");
    while (!shutdown_) {
        try {
            ioc_.run();
            return; // run() only returns once the context is stopped
        } catch (const std::exception& e) {
            // A user callback threw during a timer-driven scan. Keep serving
            // the other tables.
            logger_->error("Exception escaped expiration callback on thread " +
                           std::to_string(index) + ": " + std::string(e.what()));
        }
    }
}
