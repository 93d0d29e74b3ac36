#ifndef CACHEREGISTRY_HPP
#define CACHEREGISTRY_HPP

#include <boost/asio/io_context.hpp>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "CacheTable.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Hands out named tables, creating each one on first request. Construct one
// per application and pass it to the code that needs tables; the io_context
// must outlive every table handed out.
template <typename Key, typename Value, typename... LoaderArgs>
class CacheRegistry {
public:
    using Table = CacheTable<Key, Value, LoaderArgs...>;

    CacheRegistry(net::io_context& ioc,
                  const CacheConfig& config,
                  std::shared_ptr<ILogger> logger = nullptr)
        : ioc_(ioc),
          attach_logger_(config.attach_logger_to_tables),
          logger_(std::move(logger)) {}

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    // Safe under concurrent first access: exactly one table is created per name.
    std::shared_ptr<Table> getOrCreateTable(const std::string& name) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = tables_.find(name);
            if (it != tables_.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = tables_.find(name);
        if (it != tables_.end()) {
            return it->second;
        }
        auto table = Table::create(name, ioc_, attach_logger_ ? logger_ : std::shared_ptr<ILogger>());
        tables_.emplace(name, table);
        if (logger_) {
            logger_->debug("Created cache table " + name);
        }
        return table;
    }

    bool hasTable(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tables_.find(name) != tables_.end();
    }

    size_t tableCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tables_.size();
    }

private:
    net::io_context& ioc_;
    const bool attach_logger_;
    std::shared_ptr<ILogger> logger_;
    std::unordered_map<std::string, std::shared_ptr<Table>> tables_;
    mutable std::shared_mutex mutex_;
};

#endif // CACHEREGISTRY_HPP
