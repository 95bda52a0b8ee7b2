#include "http_client_pool.hpp"

HttpClientPool::Lease::~Lease()
{
    if(session)
    {
        pool->release(std::move(session));
    }
}

HttpClientPool::HttpClientPool(size_t size, Factory factory)
    : total(size == 0 ? 1 : size)
{
    for(size_t i = 0; i < total; i++)
    {
        free_sessions.push_back(factory());
    }
}

HttpClientPool::Lease HttpClientPool::acquire()
{
    std::unique_lock<std::mutex> lock(free_lock);
    free_cv.wait(lock, [this] { return !free_sessions.empty(); });
    auto session = std::move(free_sessions.back());
    free_sessions.pop_back();
    return Lease(*this, std::move(session));
}

void HttpClientPool::release(std::unique_ptr<mw::HTTPSessionInterface> session)
{
    {
        std::lock_guard<std::mutex> lock(free_lock);
        free_sessions.push_back(std::move(session));
    }
    free_cv.notify_one();
}
