#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <mw/crypto.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "error.hpp"
#include "http_client_pool.hpp"

// One activity on its way to one inbox.
struct DeliveryJob
{
    std::string activity_id;
    std::string inbox;
    std::string body;
    std::string key_id;
    std::string private_key_pem;
    int attempts = 0;
};

// Reported once when a job runs out of attempts.
struct DeliveryFailure
{
    std::string activity_id;
    std::string inbox;
    int attempts = 0;
    BridgeError last_error;
};

// Signs and POSTs activities to inboxes. Each (activity, inbox) pair
// is delivered independently, retried with exponential backoff up to
// max_attempts, then dropped. Nothing survives a restart.
//
// Attempts run on the given executor and block it for the duration of
// the request, so it should be a thread pool.
class DeliveryEngine
{
public:
    using ExhaustedHandler = std::function<void(const DeliveryFailure&)>;

    DeliveryEngine(boost::asio::any_io_executor ex, HttpClientPool& http,
                   mw::CryptoInterface& crypto, const DeliveryConfig& conf);
    ~DeliveryEngine();
    DeliveryEngine(const DeliveryEngine&) = delete;
    DeliveryEngine& operator=(const DeliveryEngine&) = delete;

    // Runs on the executor. The job counts as pending until it returns.
    void setExhaustedHandler(ExhaustedHandler handler);

    // Queues the activity for every inbox, signed with the given key.
    // Returns how many pairs were queued; pairs already pending are
    // skipped.
    size_t deliver(const nlohmann::json& activity,
                   const std::vector<std::string>& inboxes,
                   const std::string& key_id,
                   const std::string& private_key_pem);
    // False if the pair is already pending or the engine is shut down.
    bool enqueue(DeliveryJob job);

    // Cancels pending retries and queued jobs, and waits for running
    // attempts to return.
    void shutdown();
    // Waits until nothing is pending. Returns false on timeout.
    bool waitIdle(std::chrono::milliseconds timeout);
    size_t pending() const;
    // Domains with a running or waiting job.
    size_t trackedDomains() const;

    std::chrono::milliseconds backoffDelay(int attempt) const;

private:
    using JobPtr = std::shared_ptr<DeliveryJob>;

    static std::string pairKey(const DeliveryJob& job);
    // Starts the job if its domain is under the cap, else queues it.
    void startOrQueueLocked(const JobPtr& job);
    void attempt(const JobPtr& job);
    E<void> send(const DeliveryJob& job);
    void retireLocked(const DeliveryJob& job);

    boost::asio::any_io_executor executor;
    HttpClientPool& http;
    mw::CryptoInterface& crypto;
    DeliveryConfig conf;

    mutable std::mutex state_lock;
    std::condition_variable state_cv;
    bool stopped = false;
    // Pairs between enqueue and their last attempt.
    std::set<std::string> pending_pairs;
    std::map<std::string, int> active_by_domain;
    std::map<std::string, std::deque<JobPtr>> waiting_by_domain;
    std::set<std::shared_ptr<boost::asio::steady_timer>> retry_timers;
    // Posted attempts and armed retry timers whose handlers have not
    // run yet. Shutdown waits for this to reach zero.
    int outstanding = 0;
    ExhaustedHandler on_exhausted;
};
