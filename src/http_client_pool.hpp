#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <mw/http_client.hpp>

// A fixed set of HTTP sessions shared by worker threads. A session
// keeps its last response, so a caller holds its lease until it is
// done reading.
class HttpClientPool
{
public:
    using Factory = std::function<std::unique_ptr<mw::HTTPSessionInterface>()>;

    class Lease
    {
    public:
        Lease(HttpClientPool& pool, std::unique_ptr<mw::HTTPSessionInterface> s)
            : pool(&pool), session(std::move(s)) {}
        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        ~Lease();

        mw::HTTPSessionInterface& operator*() const { return *session; }
        mw::HTTPSessionInterface* operator->() const { return session.get(); }

    private:
        HttpClientPool* pool;
        std::unique_ptr<mw::HTTPSessionInterface> session;
    };

    HttpClientPool(size_t size, Factory factory);
    HttpClientPool(const HttpClientPool&) = delete;
    HttpClientPool& operator=(const HttpClientPool&) = delete;

    // Blocks until a session is free.
    Lease acquire();
    size_t size() const { return total; }

private:
    void release(std::unique_ptr<mw::HTTPSessionInterface> session);

    size_t total;
    std::mutex free_lock;
    std::condition_variable free_cv;
    std::vector<std::unique_ptr<mw::HTTPSessionInterface>> free_sessions;
};
