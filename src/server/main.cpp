/**
 * @file main.cpp
 * @brief orca-server: event ingestion, automations and actions over HTTP
 *
 * Run with:
 *   ./build/orca-server --config orca.yaml --port 4200
 *
 * Test with:
 *   curl -X POST http://localhost:4200/events -d '[{"event": "prefect.flow-run.Running",
 *        "resource": {"prefect.resource.id": "prefect.flow-run.1"}}]'
 *   curl -X POST http://localhost:4200/events/filter -d '{"limit": 10}'
 *   curl http://localhost:4200/health
 */

#include "orca/api/routes.hpp"
#include "orca/config/service_config.hpp"
#include "orca/events/signals.hpp"
#include "orca/network/http_router.hpp"
#include "orca/network/http_server_asio.hpp"
#include "orca/observability/logging.hpp"
#include "orca/service/service.hpp"

#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace orca;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <path>   YAML configuration file\n"
              << "  -p, --port <port>     Listen port (overrides server.port)\n"
              << "  -a, --address <addr>  Listen address (overrides server.address)\n"
              << "  -h, --help            Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<uint16_t> port_override;
    std::optional<std::string> address_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if ((arg == "-a" || arg == "--address") && i + 1 < argc) {
            address_override = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    config::ServiceConfig cfg;
    if (!config_path.empty()) {
        auto loaded = config::load_config(config_path);
        if (loaded.is_error()) {
            std::cerr << "Failed to load " << config_path << ": " << loaded.error().message << "\n";
            return 1;
        }
        cfg = loaded.take_value();
    }
    if (port_override) {
        cfg.server.port = *port_override;
    }
    if (address_override) {
        cfg.server.address = *address_override;
    }

    observability::init_logging(cfg.logging);

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("orca automation server");
    spdlog::info("════════════════════════════════════════════");

    service::OrcaService orca_service(cfg);
    auto started = orca_service.start();
    if (started.is_error()) {
        spdlog::error("Startup failed: {}", started.error().message);
        return 1;
    }

    network::HttpRouter router;
    router.use([](const network::HttpContext& ctx, network::HttpResponse&) {
        spdlog::debug("{} {}", network::HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });

    api::ApiContext api_context{orca_service.pipeline(),
                                orca_service.store(),
                                orca_service.registry(),
                                &orca_service.metrics(),
                                cfg.storage.page_size};
    api::register_routes(router, api_context);

    spdlog::info("Registered routes:");
    for (const auto& route : router.list_routes()) {
        spdlog::info("  {}", route);
    }
    spdlog::info("  GET /events/in (websocket)");

    try {
        boost::asio::io_context io_context;

        network::HttpServerAsio server(io_context, cfg.server.address, cfg.server.port);
        server.set_handler([&router](const network::HttpRequest& request) {
            return router.handle_request(request);
        });
        server.add_websocket("/events/in", api::event_stream_handler(orca_service.pipeline()));

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            orca_service.bus().emit(events::ServerShuttingDown{
                signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
            server.close();
            io_context.stop();
        });

        orca_service.bus().emit(events::ServerStarted{cfg.server.address, server.get_port()});

        std::vector<std::thread> threads;
        for (std::size_t i = 1; i < cfg.server.threads; ++i) {
            threads.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& thread : threads) {
            thread.join();
        }
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        orca_service.stop();
        return 1;
    }

    orca_service.stop();
    orca_service.metrics().print_stats();
    spdlog::info("Server shut down cleanly");
    observability::shutdown_logging();
    return 0;
}
