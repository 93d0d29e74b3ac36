#ifndef EXPIRATIONEXECUTOR_HPP
#define EXPIRATIONEXECUTOR_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Owns the io_context on which cache tables arm their expiration timers, and
// the worker threads that run it. Tables bound to context() must be destroyed
// or flushed before the executor goes away.
class ExpirationExecutor {
public:
    ExpirationExecutor(size_t thread_count, std::shared_ptr<ILogger> logger);
    ExpirationExecutor(const CacheConfig& config, std::shared_ptr<ILogger> logger);
    ~ExpirationExecutor();

    ExpirationExecutor(const ExpirationExecutor&) = delete;
    ExpirationExecutor& operator=(const ExpirationExecutor&) = delete;
    ExpirationExecutor(ExpirationExecutor&&) = delete;
    ExpirationExecutor& operator=(ExpirationExecutor&&) = delete;

    net::io_context& context() { return ioc_; }

    size_t threadCount() const { return threads_.size(); }

    // Stops the context and joins the workers. Safe to call more than once.
    void shutdown();

private:
    void worker_thread(size_t index);

    std::shared_ptr<ILogger> logger_;
    net::io_context ioc_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> shutdown_;
};

#endif // EXPIRATIONEXECUTOR_HPP
