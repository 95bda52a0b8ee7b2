#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Mutual exclusion per string key. Holders are tracked with the time
// they acquired the key so a watchdog can report keys that look stuck.
class KeyedLock
{
public:
    using Clock = std::chrono::steady_clock;

    class Guard
    {
    public:
        Guard(KeyedLock* owner, std::string key)
            : owner(owner), key(std::move(key))
        {
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept
            : owner(other.owner), key(std::move(other.key))
        {
            other.owner = nullptr;
        }
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        const std::string& heldKey() const { return key; }

    private:
        KeyedLock* owner;
        std::string key;
    };

    struct Holder
    {
        std::string key;
        std::chrono::milliseconds held_for;
    };

    // Blocks until the key is free.
    Guard lock(const std::string& key);
    std::optional<Guard> tryLock(const std::string& key);

    // Keys held for at least the threshold, longest first.
    std::vector<Holder> heldLongerThan(std::chrono::milliseconds threshold) const;
    size_t heldCount() const;

private:
    void release(const std::string& key);

    mutable std::mutex state_lock;
    std::condition_variable released;
    std::unordered_map<std::string, Clock::time_point> held;
};
