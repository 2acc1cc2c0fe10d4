#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace DK {

namespace CacheNamespace {
inline constexpr std::string_view States{"states"};
inline constexpr std::string_view Commissions{"commissions"};
inline constexpr std::string_view Search{"search"};
} // namespace CacheNamespace

struct CacheTtls {
    std::chrono::seconds states{std::chrono::hours{6}};
    std::chrono::seconds commissions{std::chrono::hours{1}};
    std::chrono::seconds search{std::chrono::minutes{5}};
};

/**
 * TTL-bounded store keyed by (namespace, key).
 *
 * Entries are held behind shared_ptr<const Value>, so a value handed out by get()
 * can never be mutated by a later set(). An expired entry behaves exactly like a
 * miss and is evicted by the access that finds it expired.
 */
template <typename Value>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit TtlCache(std::chrono::seconds default_ttl = std::chrono::minutes{5})
        : default_ttl_{default_ttl} {}

    void set_ttl(std::string_view ns, std::chrono::seconds ttl) {
        std::lock_guard const lock{mutex_};
        ttls_[std::string{ns}] = ttl;
    }

    auto ttl(std::string_view ns) const -> std::chrono::seconds {
        std::lock_guard const lock{mutex_};
        return ttl_locked(ns);
    }

    auto get(std::string_view ns, std::string_view key, Clock::time_point now = Clock::now())
        -> std::optional<Value> {
        std::lock_guard const lock{mutex_};
        auto it = entries_.find(make_key(ns, key));
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (!(now < it->second.expires_at)) {
            entries_.erase(it);
            return std::nullopt;
        }
        return *it->second.value;
    }

    void set(std::string_view ns, std::string_view key, Value value, Clock::time_point now = Clock::now()) {
        std::lock_guard const lock{mutex_};
        auto expires_at = now + ttl_locked(ns);
        entries_.insert_or_assign(make_key(ns, key),
                                  Entry{std::make_shared<Value const>(std::move(value)), expires_at});
    }

    void erase(std::string_view ns, std::string_view key) {
        std::lock_guard const lock{mutex_};
        entries_.erase(make_key(ns, key));
    }

    void clear_namespace(std::string_view ns) {
        std::lock_guard const lock{mutex_};
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.first == ns) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void clear() {
        std::lock_guard const lock{mutex_};
        entries_.clear();
    }

    // Counts live and not-yet-evicted expired entries alike.
    auto size() const -> std::size_t {
        std::lock_guard const lock{mutex_};
        return entries_.size();
    }

private:
    struct Entry {
        std::shared_ptr<Value const> value;
        Clock::time_point            expires_at{};
    };

    using Key = std::pair<std::string, std::string>;

    static auto make_key(std::string_view ns, std::string_view key) -> Key {
        return Key{std::string{ns}, std::string{key}};
    }

    auto ttl_locked(std::string_view ns) const -> std::chrono::seconds {
        auto it = ttls_.find(std::string{ns});
        return it == ttls_.end() ? default_ttl_ : it->second;
    }

    std::chrono::seconds                                  default_ttl_;
    std::unordered_map<std::string, std::chrono::seconds> ttls_;
    std::map<Key, Entry>                                  entries_;
    mutable std::mutex                                    mutex_;
};

} // namespace DK
