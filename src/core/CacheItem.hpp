#ifndef CACHEITEM_HPP
#define CACHEITEM_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

/**
 * One cached key/value pair plus its expiration and access metadata.
 *
 * key, data, lifespan and creation time are fixed at construction and read
 * without locking. The access timestamp, access counter and expiry callback
 * change over the item's life and are guarded by the item's own lock.
 *
 * Items are handed out as shared_ptr and remain readable after the owning
 * table has dropped them; they just stop being updated.
 */
template <typename Key, typename Value>
class CacheItem {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;
    using ExpiryCallback = std::function<void(const Key&)>;

    // lifeSpan of zero means the item never expires through idleness.
    CacheItem(Key key, Duration lifeSpan, Value data)
        : key_(std::move(key)),
          data_(std::move(data)),
          life_span_(lifeSpan),
          created_on_(Clock::now()),
          accessed_on_(created_on_),
          access_count_(0) {}

    static std::shared_ptr<CacheItem> create(Key key, Duration lifeSpan, Value data) {
        return std::make_shared<CacheItem>(std::move(key), lifeSpan, std::move(data));
    }

    CacheItem(const CacheItem&) = delete;
    CacheItem& operator=(const CacheItem&) = delete;

    // Marks the item as used: restarts its idle clock and bumps the counter.
    void keepAlive() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        accessed_on_ = Clock::now();
        ++access_count_;
    }

    const Key& key() const { return key_; }
    const Value& data() const { return data_; }
    Duration lifeSpan() const { return life_span_; }
    TimePoint createdOn() const { return created_on_; }

    TimePoint accessedOn() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return accessed_on_;
    }

    int64_t accessCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return access_count_;
    }

    // Called with the item's key right before the item leaves its table.
    void setAboutToExpireCallback(ExpiryCallback callback) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        about_to_expire_ = std::move(callback);
    }

    // Runs the expiry callback, if any, under the item's shared lock. The
    // callback must not call any locking accessor of this item (keepAlive,
    // accessedOn, accessCount, setAboutToExpireCallback). Lock-free ones such
    // as key(), data() and createdOn() are fine.
    void notifyAboutToExpire() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (about_to_expire_) {
            about_to_expire_(key_);
        }
    }

private:
    const Key key_;
    const Value data_;
    const Duration life_span_;
    const TimePoint created_on_;

    mutable std::shared_mutex mutex_;
    TimePoint accessed_on_;
    int64_t access_count_;
    ExpiryCallback about_to_expire_;
};

#endif // CACHEITEM_HPP
