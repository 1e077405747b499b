#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <functional>

#include "server_config.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include "endpoint_rules.hpp"
#include "endpoint_resolver.hpp"
#include "rate_limiter.hpp"
#include "redis_cache_store.hpp"
#include "upstream_client.hpp"
#include "forwarding_engine.hpp"
#include "http_session.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace apicache {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ForwardingEngine& engine,
        CacheStore& store,
        Logger& logger,
        ServerState& state
    )
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , engine_(engine)
        , store_(store)
        , logger_(logger)
        , state_(state)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ForwardingEngine& engine_;
    CacheStore& store_;
    Logger& logger_;
    ServerState& state_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            logger_.log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE, "Accept error",
                        {{"error", ec.message()}});
        } else {
            std::make_shared<HttpSession>(
                std::move(socket),
                config_,
                engine_,
                store_,
                logger_,
                state_
            )->run();
        }

        do_accept();
    }
};

}

namespace {

constexpr auto shutdown_grace = std::chrono::seconds(30);
constexpr auto drain_poll_interval = std::chrono::milliseconds(100);

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  --config, -c <path>   Configuration file (default: config.yaml)\n"
              << "  --help, -h            Show this help\n";
}

// Client TLS context for https upstreams: TLS 1.2+, system trust store.
void configure_upstream_tls(ssl::context& ctx) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1
    );
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
}

}

int main(int argc, char* argv[]) {
    using apicache::Logger;

    std::string config_path = "config.yaml";

    // --- CLI Argument Parsing ---
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "[!] " << arg << " requires a path\n";
                return 1;
            }
            config_path = argv[++i];
        } else {
            std::cerr << "[!] Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    apicache::ServerConfig config;
    std::unique_ptr<Logger> logger;
    try {
        config = apicache::ConfigLoader::load(config_path);
        logger = Logger::from_config(config.logging);
    } catch (const apicache::ConfigError& e) {
        std::cerr << "[!] Configuration error: " << e.what() << "\n";
        return 1;
    }

    try {
        int thread_count = config.server.threads;
        if (thread_count <= 0) {
            thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (thread_count == 0) thread_count = 4;
        }

        // Rule patterns are compiled here so a bad one stops startup
        apicache::EndpointRuleTable rules = apicache::EndpointRuleTable::build(
            config.cache.endpoints, config.rate_limit.endpoints);
        apicache::EndpointResolver resolver(rules);
        apicache::RateLimiterRegistry limiters;

        apicache::RedisCacheStore store(config.valkey, *logger);
        if (!store.is_connected()) {
            logger->log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE, "Failed to connect to Valkey", {
                {"host", config.valkey.host}, {"port", std::to_string(config.valkey.port)}
            });
            return 1;
        }
        logger->log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "Connected to Valkey", {
            {"host", config.valkey.host}, {"port", std::to_string(config.valkey.port)}
        });

        ssl::context tls_client{ssl::context::tls_client};
        configure_upstream_tls(tls_client);
        apicache::BeastUpstreamClient upstream(config.upstream, tls_client);

        apicache::ForwardingEngine engine(config, resolver, limiters, store, upstream, *logger);
        apicache::ServerState state;

        // Declared last so pending sessions are destroyed before what they reference
        net::io_context ioc{thread_count};

        auto listener = std::make_shared<apicache::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.server.host), config.server.port},
            config,
            engine,
            store,
            *logger,
            state
        );
        listener->run();

        logger->log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "Starting API cache server", {
            {"address", config.server.host + ":" + std::to_string(config.server.port)},
            {"upstream", config.upstream.base_url},
            {"threads", std::to_string(thread_count)},
            {"cache_rules", std::to_string(rules.cache_rules().size())},
            {"rate_limit_rules", std::to_string(rules.rate_limit_rules().size())}
        });

        // SIGINT / SIGTERM: stop accepting, wait for open sessions up to the
        // grace period, then stop the io threads.
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        net::steady_timer drain_timer(ioc);
        auto drain_deadline = std::chrono::steady_clock::now();
        std::function<void(beast::error_code)> on_drain_tick;
        on_drain_tick = [&](beast::error_code ec) {
            if (ec) return;
            if (state.active_sessions.load() == 0 || std::chrono::steady_clock::now() >= drain_deadline) {
                ioc.stop();
                return;
            }
            drain_timer.expires_after(drain_poll_interval);
            drain_timer.async_wait(on_drain_tick);
        };

        signals.async_wait([&](beast::error_code const& ec, int sig) {
            if (ec) return;
            logger->log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "Shutting down server",
                        {{"signal", std::to_string(sig)}});
            state.begin_drain();
            listener->stop();
            drain_deadline = std::chrono::steady_clock::now() + shutdown_grace;
            drain_timer.expires_after(drain_poll_interval);
            drain_timer.async_wait(on_drain_tick);
        });

        std::vector<std::thread> threads;
        threads.reserve(thread_count - 1);

        for (int i = 0; i < thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }
        engine.join_store_calls();
        upstream.shutdown();

        logger->log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "Server stopped");
        return 0;

    } catch (const apicache::ConfigError& e) {
        logger->log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE, "Invalid configuration",
                    {{"error", e.what()}});
        return 1;
    } catch (const std::exception& e) {
        logger->log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE, "Fatal error",
                    {{"error", e.what()}});
        return 1;
    }
}
