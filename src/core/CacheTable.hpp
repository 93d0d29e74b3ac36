#ifndef CACHETABLE_HPP
#define CACHETABLE_HPP

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "CacheErrors.hpp"
#include "CacheItem.hpp"
#include "../interfaces/ILogger.hpp"
#include "../utils/Utils.hpp"

namespace net = boost::asio;

/**
 * A named, thread-safe key/value table whose items expire after staying idle
 * for longer than their lifespan.
 *
 * Expiration is driven by a single one-shot timer per table. Every scan walks
 * the items, removes the ones past their lifespan and re-arms the timer for
 * the nearest remaining deadline, so the table wakes up exactly when the next
 * item can expire and sleeps otherwise. The timer fires on a thread running
 * the io_context the table was created with.
 *
 * Tables are always owned by shared_ptr (see create()); a pending timer only
 * keeps a weak reference, so dropping the last owner cancels expiration.
 *
 * Key must be hashable, equality-comparable and printable with operator<<.
 * Extra LoaderArgs are forwarded from value() to the data loader.
 */
template <typename Key, typename Value, typename... LoaderArgs>
class CacheTable : public std::enable_shared_from_this<CacheTable<Key, Value, LoaderArgs...>> {
public:
    using Item = CacheItem<Key, Value>;
    using ItemPtr = std::shared_ptr<Item>;
    using Clock = typename Item::Clock;
    using Duration = typename Item::Duration;
    using DataLoader = std::function<ItemPtr(const Key&, LoaderArgs...)>;
    using ItemCallback = std::function<void(const ItemPtr&)>;
    using Visitor = std::function<void(const Key&, const ItemPtr&)>;

    static std::shared_ptr<CacheTable> create(std::string name,
                                              net::io_context& ioc,
                                              std::shared_ptr<ILogger> logger = nullptr) {
        return std::shared_ptr<CacheTable>(new CacheTable(std::move(name), ioc, std::move(logger)));
    }

    ~CacheTable() = default;

    CacheTable(const CacheTable&) = delete;
    CacheTable& operator=(const CacheTable&) = delete;
    CacheTable(CacheTable&&) = delete;
    CacheTable& operator=(CacheTable&&) = delete;

    const std::string& name() const { return name_; }

    size_t count() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return items_.size();
    }

    // Visits every item under the table's read lock. The visitor must not
    // call back into operations that modify this table.
    void forEach(const Visitor& visit) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, item] : items_) {
            visit(key, item);
        }
    }

    // Called by value() on a miss. Returning nullptr means "cannot load".
    void setDataLoader(DataLoader loader) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        load_data_ = std::move(loader);
    }

    void setAddedItemCallback(ItemCallback callback) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        added_item_ = std::move(callback);
    }

    void setAboutToDeleteItemCallback(ItemCallback callback) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        about_to_delete_item_ = std::move(callback);
    }

    void setLogger(std::shared_ptr<ILogger> logger) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        logger_ = std::move(logger);
    }

    // Inserts or replaces the item for key. An item with a finite lifespan
    // shorter than the current scan interval (or any finite lifespan while no
    // scan is pending) triggers a scan before this returns.
    ItemPtr add(const Key& key, Duration lifeSpan, Value data) {
        ItemPtr item = Item::create(key, lifeSpan, std::move(data));
        typename Clock::duration expDur;
        ItemCallback addedItem;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            logAdding(key, lifeSpan);
            items_[key] = item;
            trackUnscanned(lifeSpan);
            expDur = cleanup_interval_;
            addedItem = added_item_;
        }
        onItemAdded(item, expDur, addedItem);
        return item;
    }

    // Same as add(), but only when key is absent. Returns false and leaves the
    // table untouched otherwise.
    bool notFoundAdd(const Key& key, Duration lifeSpan, Value data) {
        ItemPtr item;
        typename Clock::duration expDur;
        ItemCallback addedItem;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (items_.find(key) != items_.end()) {
                return false;
            }
            item = Item::create(key, lifeSpan, std::move(data));
            logAdding(key, lifeSpan);
            items_[key] = item;
            trackUnscanned(lifeSpan);
            expDur = cleanup_interval_;
            addedItem = added_item_;
        }
        onItemAdded(item, expDur, addedItem);
        return true;
    }

    // Removes key, firing the table's about-to-delete callback and then the
    // item's own expiry callback. Throws KeyNotFoundException if absent.
    ItemPtr remove(const Key& key) {
        ItemPtr item = deleteItem(key, nullptr);
        if (!item) {
            throw KeyNotFoundException();
        }
        return item;
    }

    // Pure membership test: no keep-alive, no loader.
    bool exists(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return items_.find(key) != items_.end();
    }

    // Returns the item for key and keeps it alive. On a miss the data loader,
    // if set, is asked for the item, which is then added to the table.
    ItemPtr value(const Key& key, LoaderArgs... args) {
        ItemPtr item;
        DataLoader loader;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = items_.find(key);
            if (it != items_.end()) {
                item = it->second;
            }
            loader = load_data_;
        }

        if (item) {
            item->keepAlive();
            return item;
        }

        if (loader) {
            ItemPtr loaded = loader(key, args...);
            if (loaded) {
                return add(key, loaded->lifeSpan(), loaded->data());
            }
            throw KeyNotFoundOrLoadableException();
        }

        throw KeyNotFoundException();
    }

    // Drops every item at once and disarms the scheduler. No per-item
    // callbacks fire: this is a bulk reset, not a series of removals.
    void flush() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (logger_) {
            logger_->info("Flushing table " + name_);
        }
        items_.clear();
        cleanup_interval_ = Clock::duration::zero();
        unscanned_lifespan_ = Duration::zero();
        next_deadline_.reset();
        cleanup_timer_.cancel();
    }

    // Up to count items ordered by access count, highest first. Items removed
    // while the ranking is built are skipped, so fewer may come back.
    std::vector<ItemPtr> mostAccessed(size_t count) const {
        std::vector<std::pair<Key, int64_t>> ranking;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            ranking.reserve(items_.size());
            for (const auto& [key, item] : items_) {
                ranking.emplace_back(key, item->accessCount());
            }
        }

        std::sort(ranking.begin(), ranking.end(),
                  [](const std::pair<Key, int64_t>& a, const std::pair<Key, int64_t>& b) {
                      return a.second > b.second;
                  });

        std::vector<ItemPtr> result;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        size_t visited = 0;
        for (const auto& entry : ranking) {
            if (visited >= count) {
                break;
            }
            auto it = items_.find(entry.first);
            if (it != items_.end()) {
                result.push_back(it->second);
            }
            ++visited;
        }
        return result;
    }

    // Interval the current scan wait was armed with; zero while idle.
    typename Clock::duration cleanupInterval() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return cleanup_interval_;
    }

private:
    CacheTable(std::string name, net::io_context& ioc, std::shared_ptr<ILogger> logger)
        : name_(std::move(name)),
          cleanup_timer_(ioc),
          cleanup_interval_(Clock::duration::zero()),
          unscanned_lifespan_(Duration::zero()),
          logger_(std::move(logger)) {}

    // Caller holds mutex_.
    bool debugEnabled() const {
        return logger_ && logger_->isEnabled(LogUtils::LogLevel::DEBUG);
    }

    // Caller holds mutex_.
    void logAdding(const Key& key, Duration lifeSpan) const {
        if (!debugEnabled()) {
            return;
        }
        std::ostringstream ss;
        ss << "Adding item with key " << key << " and lifespan of "
           << Utils::formatDuration(lifeSpan) << " to table " << name_;
        logger_->debug(ss.str());
    }

    // Caller holds mutex_. Remembers the shortest finite lifespan added since
    // the last snapshot so a scan already past its snapshot still covers it.
    void trackUnscanned(Duration lifeSpan) {
        if (lifeSpan > Duration::zero() &&
            (unscanned_lifespan_ == Duration::zero() || lifeSpan < unscanned_lifespan_)) {
            unscanned_lifespan_ = lifeSpan;
        }
    }

    void onItemAdded(const ItemPtr& item, typename Clock::duration expDur, const ItemCallback& addedItem) {
        if (addedItem) {
            addedItem(item);
        }

        // No scan pending, or this item may expire before the pending one fires.
        if (item->lifeSpan() > Duration::zero() &&
            (expDur == Clock::duration::zero() || item->lifeSpan() < expDur)) {
            expirationCheck();
        }
    }

    // Shared delete path for remove() and the scheduler. With a non-null
    // expected item, only that exact instance is removed. Returns nullptr when
    // nothing matched.
    ItemPtr deleteItem(const Key& key, const ItemPtr& expected) {
        ItemPtr item;
        ItemCallback aboutToDeleteItem;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = items_.find(key);
            if (it == items_.end() || (expected && it->second != expected)) {
                return nullptr;
            }
            item = it->second;
            aboutToDeleteItem = about_to_delete_item_;
        }

        if (aboutToDeleteItem) {
            aboutToDeleteItem(item);
        }
        item->notifyAboutToExpire();

        const int64_t hits = item->accessCount();
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (debugEnabled()) {
            std::ostringstream ss;
            ss << "Deleting item with key " << key << " created "
               << Utils::formatDuration(Clock::now() - item->createdOn())
               << " ago and hit " << hits << " times from table " << name_;
            logger_->debug(ss.str());
        }
        auto it = items_.find(key);
        if (it != items_.end() && it->second == item) {
            items_.erase(it);
        }
        return item;
    }

    // One expiration scan. Never holds mutex_ while user callbacks run.
    void expirationCheck() {
        std::vector<std::pair<Key, ItemPtr>> snapshot;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            cleanup_timer_.cancel();
            next_deadline_.reset();
            if (debugEnabled()) {
                if (cleanup_interval_ > Clock::duration::zero()) {
                    logger_->debug("Expiration check triggered after " +
                                   Utils::formatDuration(cleanup_interval_) + " for table " + name_);
                } else {
                    logger_->debug("Expiration check installed for table " + name_);
                }
            }
            unscanned_lifespan_ = Duration::zero();
            snapshot.assign(items_.begin(), items_.end());
        }

        typename Clock::duration smallestDuration = Clock::duration::zero();
        try {
            const auto now = Clock::now();
            for (const auto& [key, item] : snapshot) {
                const Duration lifeSpan = item->lifeSpan();
                if (lifeSpan == Duration::zero()) {
                    continue;
                }

                const auto idle = now - item->accessedOn();
                if (idle >= lifeSpan) {
                    deleteItem(key, item);
                } else {
                    // Closest item to the end of its lifespan decides the next wake-up
                    const typename Clock::duration remaining = lifeSpan - idle;
                    if (smallestDuration == Clock::duration::zero() || remaining < smallestDuration) {
                        smallestDuration = remaining;
                    }
                }
            }
        } catch (...) {
            // Idle unless another scan armed a wait; the next qualifying add re-arms.
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (!next_deadline_) {
                cleanup_interval_ = Clock::duration::zero();
            }
            throw;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (unscanned_lifespan_ > Duration::zero() &&
            (smallestDuration == Clock::duration::zero() || unscanned_lifespan_ < smallestDuration)) {
            smallestDuration = unscanned_lifespan_;
        }
        armTimer(smallestDuration);
    }

    // Caller holds mutex_. At most one wait is pending per table; a pending
    // wait that is due no later than the requested one stays in place.
    void armTimer(typename Clock::duration interval) {
        const auto now = Clock::now();
        if (next_deadline_ &&
            (interval == Clock::duration::zero() || *next_deadline_ <= now + interval)) {
            return;
        }

        cleanup_interval_ = interval;
        if (interval == Clock::duration::zero()) {
            return;
        }

        next_deadline_ = now + interval;
        std::weak_ptr<CacheTable> weak_self = this->weak_from_this();
        cleanup_timer_.expires_at(*next_deadline_);
        cleanup_timer_.async_wait([weak_self](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (auto self = weak_self.lock()) {
                self->expirationCheck();
            }
        });
    }

    const std::string name_;
    std::unordered_map<Key, ItemPtr> items_;

    net::steady_timer cleanup_timer_;
    typename Clock::duration cleanup_interval_;
    std::optional<typename Clock::time_point> next_deadline_;
    Duration unscanned_lifespan_;

    std::shared_ptr<ILogger> logger_;
    DataLoader load_data_;
    ItemCallback added_item_;
    ItemCallback about_to_delete_item_;

    mutable std::shared_mutex mutex_;
};

#endif // CACHETABLE_HPP
