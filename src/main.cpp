#include "core/config.h"
#include "core/server.h"
#include "gateway/router.hpp"
#include "transport/http1_proxy.hpp"
#include "transport/http_client.hpp"
#include "utils/logger.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <vector>

namespace {

// Client-side TLS for both upstreams. Certificates are always verified.
void setup_upstream_tls(boost::asio::ssl::context& ctx, const GatewayConfig& config) {
    ctx.set_options(boost::asio::ssl::context::default_workarounds |
                    boost::asio::ssl::context::no_sslv2 |
                    boost::asio::ssl::context::no_sslv3);
    if (config.upstream_ca_file.empty()) {
        ctx.set_default_verify_paths();
    } else {
        ctx.load_verify_file(config.upstream_ca_file);
    }
    ctx.set_verify_mode(boost::asio::ssl::verify_peer);
}

} // namespace

int main() {
    try {
        GatewayConfig config = GatewayConfig::load([](const char* name) { return std::getenv(name); });
        Logger::instance().set_level(config.log_level);

        LOG_INFO("Starting Meting gateway");
        LOG_INFO("HTTP/2 Port: " << config.port << ", HTTP/1.1 Port: " << config.http1_port
                 << ", Threads: " << config.threads);
        LOG_INFO("SSL: " << (config.use_ssl ? "Enabled" : "Disabled"));
        LOG_INFO("Metadata API: " << config.api_base_url << ", default source: " << config.default_source);
        LOG_INFO("Audio host rules: " << config.audio_hosts.size());

        boost::asio::io_context io_context(config.threads);

        // Setup signal handling
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&io_context](const boost::system::error_code& ec, int signum) {
            if (!ec) {
                LOG_INFO("Received signal " << signum << ", shutting down...");
                io_context.stop();
            }
        });

        boost::asio::ssl::context upstream_tls(boost::asio::ssl::context::tls_client);
        setup_upstream_tls(upstream_tls, config);

        HttpClient client(upstream_tls);
        RequestRouter router(config, client);
        auto handler = [&router](const HttpRequest& request, ResponseSinkPtr sink) {
            router.handle_request(request, std::move(sink));
        };

        Server server = config.use_ssl ?
            Server(io_context, config.port, config.cert_file, config.key_file) :
            Server(io_context, config.port);
        server.set_request_handler(handler);

        // Browsers without h2c reach the same routes over HTTP/1.1
        Http1ProxyServer http1_server(io_context, config.http1_port);
        http1_server.set_request_handler(handler);

        server.start();
        http1_server.start();

        // Run with multiple threads
        std::vector<std::thread> thread_pool;
        thread_pool.reserve(config.threads);

        for (int i = 0; i < config.threads - 1; ++i) {
            thread_pool.emplace_back([&io_context]() {
                io_context.run();
            });
        }

        LOG_INFO("HTTP/2 listener ready on port " << config.port);
        LOG_INFO("HTTP/1.1 listener ready on port " << config.http1_port);

        // Run on main thread
        io_context.run();

        for (auto& t : thread_pool) {
            if (t.joinable()) {
                t.join();
            }
        }

        LOG_INFO("Server shutdown complete");

    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: " << e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " << e.what());
        return 1;
    }

    return 0;
}
