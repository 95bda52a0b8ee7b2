#include "keyed_lock.hpp"

#include <algorithm>

KeyedLock::Guard& KeyedLock::Guard::operator=(Guard&& other) noexcept
{
    if(this != &other)
    {
        if(owner != nullptr)
        {
            owner->release(key);
        }
        owner = other.owner;
        key = std::move(other.key);
        other.owner = nullptr;
    }
    return *this;
}

KeyedLock::Guard::~Guard()
{
    if(owner != nullptr)
    {
        owner->release(key);
    }
}

KeyedLock::Guard KeyedLock::lock(const std::string& key)
{
    std::unique_lock<std::mutex> l(state_lock);
    released.wait(l, [&] { return !held.contains(key); });
    held.emplace(key, Clock::now());
    return Guard(this, key);
}

std::optional<KeyedLock::Guard> KeyedLock::tryLock(const std::string& key)
{
    std::lock_guard<std::mutex> l(state_lock);
    if(held.contains(key))
    {
        return std::nullopt;
    }
    held.emplace(key, Clock::now());
    return std::optional<Guard>(std::in_place, this, key);
}

std::vector<KeyedLock::Holder>
KeyedLock::heldLongerThan(std::chrono::milliseconds threshold) const
{
    std::vector<Holder> result;
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> l(state_lock);
        for(const auto& [key, since] : held)
        {
            auto held_for =
                std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                                      since);
            if(held_for >= threshold)
            {
                result.push_back({key, held_for});
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Holder& a, const Holder& b)
              { return a.held_for > b.held_for; });
    return result;
}

size_t KeyedLock::heldCount() const
{
    std::lock_guard<std::mutex> l(state_lock);
    return held.size();
}

void KeyedLock::release(const std::string& key)
{
    {
        std::lock_guard<std::mutex> l(state_lock);
        held.erase(key);
    }
    released.notify_all();
}
