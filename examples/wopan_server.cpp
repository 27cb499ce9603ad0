/**
 * @file wopan_server.cpp
 * @brief Relay service: downloads videos with yt-dlp and pushes files to Wopan
 *
 * ENDPOINTS:
 *   GET  /healthy
 *   POST /api/video/download
 *   POST /api/video/wopan/upload
 *   POST /api/video/wopan/file-upload
 *
 * Every handler runs synchronously on one of the io_context threads; uploads
 * and extractions are long, so --threads bounds how many run at once.
 */

#include "wopan/crypto/metadata_cipher.hpp"
#include "wopan/events/components.hpp"
#include "wopan/events/event_bus.hpp"
#include "wopan/events/events.hpp"
#include "wopan/media/extractor.hpp"
#include "wopan/media/filename.hpp"
#include "wopan/network/http_router.hpp"
#include "wopan/network/http_server_asio.hpp"
#include "wopan/server/config.hpp"
#include "wopan/server/routes.hpp"
#include "wopan/transport/beast_gateway.hpp"
#include "wopan/upload/uploader.hpp"

#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

using namespace wopan;
using namespace wopan::network;

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto loaded = server::load_service_config(args);
    if (loaded.is_error()) {
        std::cerr << loaded.error().message << "\n" << server::service_usage(argv[0]) << std::endl;
        return 2;
    }
    const auto& config = loaded.value();

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    // ════════════════════════════════════════════════════════════
    // Components
    // ════════════════════════════════════════════════════════════

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    transport::BeastTransportGateway transport(config.verify_tls);
    crypto::AesCbcMetadataCipher cipher;

    upload::UploaderConfig uploader_config;
    uploader_config.access_token = config.access_token;
    upload::Uploader uploader(uploader_config, transport, cipher, event_bus);
    if (config.access_token.empty()) {
        spdlog::warn("WOPAN_ACCESS_TOKEN is not set; upload requests will fail");
    }

    media::TempWorkspace workspace(config.temp_dir);
    media::BoostProcessRunner process_runner;
    media::YtDlpExtractor extractor(workspace, process_runner);

    server::ServiceContext context{uploader, extractor, workspace, event_bus, CancellationToken{}};

    // ════════════════════════════════════════════════════════════
    // Router
    // ════════════════════════════════════════════════════════════

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {} from {}",
            HttpMethodUtils::to_string(ctx.request.method),
            ctx.request.url,
            ctx.request.get_header("User-Agent"));
        return true;
    });
    server::register_routes(router, context);

    spdlog::info("Registered routes:");
    for (const auto& route : router.list_routes()) {
        spdlog::info("  {}", route);
    }

    // ════════════════════════════════════════════════════════════
    // Event loop
    // ════════════════════════════════════════════════════════════

    try {
        boost::asio::io_context io_context;

        HttpServerAsio http_server(io_context, config.port, config.max_body_size);
        http_server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(events::ServerShuttingDownEvent{signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
            context.shutdown.cancel();
            http_server.stop();
            io_context.stop();
        });

        event_bus.emit(events::ServerStartedEvent{http_server.get_port()});
        spdlog::info("Temp directory: {}", workspace.root().string());
        spdlog::info("Worker threads: {}", config.threads);
        spdlog::info("Press Ctrl+C to stop");

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < config.threads; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }

        metrics.print_stats();
        spdlog::info("Server shut down cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
}
