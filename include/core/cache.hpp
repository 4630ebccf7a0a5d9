// SPDX-License-Identifier: MIT
/**
 * @file cache.hpp
 * @brief Injectable key/value cache abstraction and a TTL-bounded implementation.
 *
 * The engine never owns global cache state: callers construct a cache once and
 * hand it to the engine by reference.
 */

#ifndef TRACKER_CORE_CACHE_HPP
#define TRACKER_CORE_CACHE_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace tracker
{
    /**
     * @class Cache
     * @brief Abstract string-keyed cache.
     */
    template <typename V>
    class Cache
    {
    public:
        virtual ~Cache() = default;

        /// Cached value for @p key, or nullopt on miss or expiry.
        virtual std::optional<V> get(const std::string &key) = 0;

        virtual void set(const std::string &key, const V &value) = 0;

        /// Maximum age of an entry before it stops being served.
        virtual std::chrono::milliseconds ttl() const = 0;
    };

    /**
     * @class TtlCache
     * @brief Mutex-guarded map whose entries expire after a fixed TTL.
     *
     * The age is checked at read time against the injected clock; an entry
     * whose age is >= ttl is evicted and reported as a miss.
     */
    template <typename V>
    class TtlCache : public Cache<V>
    {
    public:
        using Clock = std::function<std::chrono::steady_clock::time_point()>;

        explicit TtlCache(std::chrono::milliseconds ttl,
                          Clock clock = [] { return std::chrono::steady_clock::now(); })
            : ttl_(ttl), clock_(std::move(clock))
        {
            if (ttl_.count() <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'ttl', got: " +
                                            std::to_string(ttl_.count()) + "ms");
            }
        }

        std::optional<V> get(const std::string &key) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end())
            {
                return std::nullopt;
            }
            if (clock_() - it->second.stored_at >= ttl_)
            {
                entries_.erase(it);
                return std::nullopt;
            }
            return it->second.value;
        }

        void set(const std::string &key, const V &value) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[key] = Entry{value, clock_()};
        }

        std::chrono::milliseconds ttl() const override { return ttl_; }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

    private:
        struct Entry
        {
            V value;
            std::chrono::steady_clock::time_point stored_at;
        };

        std::chrono::milliseconds ttl_;
        Clock clock_;
        mutable std::mutex mutex_;
        std::map<std::string, Entry> entries_;
    };

} // namespace tracker

#endif // TRACKER_CORE_CACHE_HPP
