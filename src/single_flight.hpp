#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <unordered_map>

// Collapses concurrent calls for the same key into one: the first
// caller runs the function, everyone who arrives while it runs waits
// for and shares its result. Nothing is remembered afterwards.
template<typename K, typename V, typename Hash = std::hash<K>>
class SingleFlight
{
public:
    V run(const K& key, const std::function<V()>& fn)
    {
        std::promise<V> promise;
        {
            std::unique_lock<std::mutex> lock(calls_lock);
            auto it = calls.find(key);
            if(it != calls.end())
            {
                std::shared_future<V> pending = it->second;
                lock.unlock();
                return pending.get();
            }
            calls.emplace(key, promise.get_future().share());
        }

        try
        {
            V result = fn();
            promise.set_value(result);
            finish(key);
            return result;
        }
        catch(...)
        {
            promise.set_exception(std::current_exception());
            finish(key);
            throw;
        }
    }

    // Number of calls currently in flight.
    size_t inFlight() const
    {
        std::lock_guard<std::mutex> lock(calls_lock);
        return calls.size();
    }

private:
    void finish(const K& key)
    {
        std::lock_guard<std::mutex> lock(calls_lock);
        calls.erase(key);
    }

    mutable std::mutex calls_lock;
    std::unordered_map<K, std::shared_future<V>, Hash> calls;
};
