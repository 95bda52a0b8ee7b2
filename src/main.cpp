#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cxxopts.hpp>
#include <mw/crypto.hpp>
#include <mw/http_client.hpp>
#include <spdlog/spdlog.h>

#include "actor_resolver.hpp"
#include "app.hpp"
#include "beast_relay_transport.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "dedup_index.hpp"
#include "delivery_engine.hpp"
#include "error.hpp"
#include "http_client_pool.hpp"
#include "identity_mapper.hpp"
#include "relay_pool.hpp"
#include "schnorr.hpp"
#include "signature_verifier.hpp"
#include "store.hpp"
#include "text_transform.hpp"
#include "url_manager.hpp"

namespace
{

constexpr char SECRET_KEY_CONFIG[] = "secret_key";

// The seed of derived keys. Once generated it is kept in the store, so
// federated actors keep their native keys across restarts.
E<std::string> loadSecretKey(const Config& config, StoreInterface& store)
{
    if(!config.secret_key.empty())
    {
        return config.secret_key;
    }
    ASSIGN_OR_RETURN(auto stored, store.getSystemConfig(SECRET_KEY_CONFIG));
    if(stored.has_value())
    {
        return *stored;
    }
    spdlog::info("Generating a new bridge secret...");
    ASSIGN_OR_RETURN(std::string secret, schnorr::generateSecret());
    DO_OR_RETURN(store.setSystemConfig(SECRET_KEY_CONFIG, secret));
    return secret;
}

int run(const Config& config)
{
    Store store(config.db_path);
    if(auto r = store.init(); !r.has_value())
    {
        spdlog::error("Cannot open {}: {}", config.db_path, errorMsg(r.error()));
        return 2;
    }
    auto secret_key = loadSecretKey(config, store);
    if(!secret_key.has_value())
    {
        spdlog::error("Cannot load the bridge secret: {}",
                      errorMsg(secret_key.error()));
        return 2;
    }

    mw::Crypto crypto;
    URLManager urls(config);
    IdentityMapper identities(store, crypto, urls, *secret_key, config.cache);
    auto system_keys = identities.systemKeys();
    if(!system_keys.has_value())
    {
        spdlog::error("Cannot load the system actor key: {}",
                      errorMsg(system_keys.error()));
        return 2;
    }

    HttpClientPool http(config.worker_threads * 2, []()
    {
        return std::make_unique<mw::HTTPSession>();
    });
    ActorResolver actors(store, http, crypto, urls, *system_keys, config.cache);
    SignatureVerifier verifier(actors, crypto, config.signature_max_skew_seconds);
    DedupIndex dedup(store, config.cache.seen_capacity,
                     config.dedup_retention_seconds);

    boost::asio::io_context io;
    auto work = std::make_optional(boost::asio::make_work_guard(io));
    BeastRelayTransport transport(io.get_executor());
    RelayPool pool(io.get_executor(), transport, dedup, config.relay_backoff);
    for(const auto& relay : config.relays)
    {
        pool.addRelay(relay);
    }
    for(const auto& relay : config.metadata_relays)
    {
        pool.addRelay(relay, RelayRole::METADATA);
    }
    if(pool.relays().empty())
    {
        spdlog::warn("No relay is configured; nothing will be bridged.");
    }

    boost::asio::thread_pool workers(config.worker_threads);
    DeliveryEngine delivery(workers.get_executor(), http, crypto,
                            config.delivery);
    GumboTextTransform transform;
    BridgeCoordinator coordinator(config, store, identities, actors, dedup,
                                  pool, delivery, urls, transform);

    std::thread io_thread([&io]() { io.run(); });
    pool.start();
    coordinator.start(io.get_executor(), workers.get_executor());

    mw::HTTPServer::ListenAddress listen =
        mw::IPSocketInfo{config.bind_address, config.port};
    App app(config, urls, identities, verifier, coordinator, transform, listen);
    int status = 0;
    if(auto r = app.start(); !r.has_value())
    {
        spdlog::error("Failed to start server: {}", mw::errorMsg(r.error()));
        status = 1;
    }
    else
    {
        spdlog::info("Listening at {}:{}, serving {}", config.bind_address,
                     config.port, config.server_url_root);
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&app](const boost::system::error_code& ec, int sig)
        {
            if(!ec)
            {
                spdlog::info("Got signal {}, shutting down...", sig);
                app.stop();
            }
        });
        app.wait();
        signals.cancel();
    }

    pool.stop();
    work.reset();
    io.stop();
    io_thread.join();
    coordinator.stop();
    delivery.shutdown();
    workers.join();
    return status;
}

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("nostap", "Bridge between Nostr relays and the fediverse");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value("/etc/nostap.yaml"))
        ("v,verbose", "Log at debug level")
        ("h,help", "Print this message.");
    auto opts = cmd_options.parse(argc, argv);

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    auto config = Config::fromFile(opts["config"].as<std::string>());
    if(!config.has_value())
    {
        std::cerr << "Failed to load config: " << errorMsg(config.error())
                  << std::endl;
        return 2;
    }

    spdlog::set_level(spdlog::level::from_str(config->log_level));
    if(opts.count("verbose"))
    {
        spdlog::set_level(spdlog::level::debug);
    }
    return run(*config);
}
