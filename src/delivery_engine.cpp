#include "delivery_engine.hpp"

#include <algorithm>
#include <format>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include "http_signature.hpp"
#include "json_ld.hpp"
#include "utils.hpp"

namespace net = boost::asio;

DeliveryEngine::DeliveryEngine(net::any_io_executor ex, HttpClientPool& http,
                               mw::CryptoInterface& crypto,
                               const DeliveryConfig& conf)
    : executor(std::move(ex)), http(http), crypto(crypto), conf(conf)
{
    if(this->conf.max_concurrent_per_domain < 1)
    {
        this->conf.max_concurrent_per_domain = 1;
    }
    if(this->conf.max_attempts < 1)
    {
        this->conf.max_attempts = 1;
    }
}

DeliveryEngine::~DeliveryEngine()
{
    shutdown();
}

void DeliveryEngine::setExhaustedHandler(ExhaustedHandler handler)
{
    std::lock_guard<std::mutex> lock(state_lock);
    on_exhausted = std::move(handler);
}

std::string DeliveryEngine::pairKey(const DeliveryJob& job)
{
    return job.activity_id + " " + job.inbox;
}

std::chrono::milliseconds DeliveryEngine::backoffDelay(int attempt) const
{
    int64_t delay = conf.backoff_base_ms;
    for(int i = 1; i < attempt && delay < conf.backoff_max_ms; i++)
    {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, conf.backoff_max_ms));
}

size_t DeliveryEngine::deliver(const nlohmann::json& activity,
                               const std::vector<std::string>& inboxes,
                               const std::string& key_id,
                               const std::string& private_key_pem)
{
    const std::string body = activity.dump();
    const std::string activity_id = json_ld::getString(activity, "id");
    std::set<std::string> seen;
    size_t queued = 0;
    for(const std::string& inbox : inboxes)
    {
        if(inbox.empty() || !seen.insert(inbox).second)
        {
            continue;
        }
        DeliveryJob job;
        job.activity_id = activity_id;
        job.inbox = inbox;
        job.body = body;
        job.key_id = key_id;
        job.private_key_pem = private_key_pem;
        if(enqueue(std::move(job)))
        {
            queued++;
        }
    }
    return queued;
}

bool DeliveryEngine::enqueue(DeliveryJob job)
{
    std::lock_guard<std::mutex> lock(state_lock);
    if(stopped)
    {
        return false;
    }
    if(!pending_pairs.insert(pairKey(job)).second)
    {
        spdlog::debug("Delivery of {} to {} is already pending",
                      job.activity_id, job.inbox);
        return false;
    }
    startOrQueueLocked(std::make_shared<DeliveryJob>(std::move(job)));
    return true;
}

void DeliveryEngine::startOrQueueLocked(const JobPtr& job)
{
    const std::string domain = hostOf(job->inbox);
    int& active = active_by_domain[domain];
    if(active >= conf.max_concurrent_per_domain)
    {
        waiting_by_domain[domain].push_back(job);
        return;
    }
    active++;
    outstanding++;
    net::post(executor, [this, job]() { attempt(job); });
}

void DeliveryEngine::retireLocked(const DeliveryJob& job)
{
    pending_pairs.erase(pairKey(job));
    if(pending_pairs.empty())
    {
        state_cv.notify_all();
    }
}

E<void> DeliveryEngine::send(const DeliveryJob& job)
{
    mw::HTTPRequest req(job.inbox);
    req.setPayload(job.body);
    req.setContentType("application/activity+json");
    DO_OR_RETURN(http_signature::signRequest(req, "POST", job.inbox, job.body,
                                             job.key_id, job.private_key_pem,
                                             crypto));

    auto session = http.acquire();
    auto res = session->post(req);
    if(!res.has_value())
    {
        return std::unexpected(fromTransportError(res.error()));
    }
    int status = (*res)->status;
    if(status < 200 || status >= 300)
    {
        return std::unexpected(transportTransient(
            std::format("HTTP POST returned status {}", status)));
    }
    return {};
}

void DeliveryEngine::attempt(const JobPtr& job)
{
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(state_lock);
        cancelled = stopped;
    }

    E<void> result;
    if(!cancelled)
    {
        job->attempts++;
        result = send(*job);
    }

    std::optional<DeliveryFailure> failure;
    ExhaustedHandler handler;
    {
        std::lock_guard<std::mutex> lock(state_lock);
        const std::string domain = hostOf(job->inbox);
        if(--active_by_domain[domain] <= 0)
        {
            active_by_domain.erase(domain);
        }
        if(auto w = waiting_by_domain.find(domain); w != waiting_by_domain.end())
        {
            JobPtr next;
            if(!stopped && !w->second.empty())
            {
                next = w->second.front();
                w->second.pop_front();
            }
            if(w->second.empty())
            {
                waiting_by_domain.erase(w);
            }
            if(next)
            {
                startOrQueueLocked(next);
            }
        }

        if(cancelled || stopped)
        {
            outstanding--;
            retireLocked(*job);
        }
        else if(result.has_value())
        {
            spdlog::debug("Delivered {} to {}", job->activity_id, job->inbox);
            outstanding--;
            retireLocked(*job);
        }
        else if(job->attempts >= conf.max_attempts)
        {
            // Stays pending and outstanding until the handler returns.
            failure = DeliveryFailure{job->activity_id, job->inbox,
                                      job->attempts, result.error()};
            handler = on_exhausted;
        }
        else
        {
            auto delay = backoffDelay(job->attempts);
            spdlog::debug("Delivery of {} to {} failed ({}), retrying in {} ms",
                          job->activity_id, job->inbox,
                          errorMsg(result.error()), delay.count());
            auto timer = std::make_shared<net::steady_timer>(executor);
            retry_timers.insert(timer);
            timer->expires_after(delay);
            timer->async_wait([this, job, timer](boost::system::error_code ec)
            {
                std::lock_guard<std::mutex> lock(state_lock);
                outstanding--;
                retry_timers.erase(timer);
                if(ec || stopped)
                {
                    retireLocked(*job);
                    state_cv.notify_all();
                    return;
                }
                startOrQueueLocked(job);
            });
        }
        state_cv.notify_all();
    }

    if(failure.has_value())
    {
        spdlog::warn("Giving up delivering {} to {} after {} attempts: {}",
                     failure->activity_id, failure->inbox, failure->attempts,
                     errorMsg(failure->last_error));
        if(handler)
        {
            handler(*failure);
        }
        std::lock_guard<std::mutex> lock(state_lock);
        outstanding--;
        retireLocked(*job);
        state_cv.notify_all();
    }
}

size_t DeliveryEngine::trackedDomains() const
{
    std::lock_guard<std::mutex> lock(state_lock);
    return active_by_domain.size() + waiting_by_domain.size();
}

void DeliveryEngine::shutdown()
{
    std::unique_lock<std::mutex> lock(state_lock);
    if(!stopped)
    {
        stopped = true;
        for(const auto& timer : retry_timers)
        {
            timer->cancel();
        }
        for(auto& [domain, waiting] : waiting_by_domain)
        {
            for(const auto& job : waiting)
            {
                retireLocked(*job);
            }
        }
        waiting_by_domain.clear();
        spdlog::info("Delivery engine stopped");
    }
    state_cv.wait(lock, [this] { return outstanding == 0; });
}

bool DeliveryEngine::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(state_lock);
    return state_cv.wait_for(lock, timeout,
                             [this] { return pending_pairs.empty(); });
}

size_t DeliveryEngine::pending() const
{
    std::lock_guard<std::mutex> lock(state_lock);
    return pending_pairs.size();
}
