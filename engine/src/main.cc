#include "engine.hpp"
#include "engine_service.hpp"
#include "forge/config.hpp"
#include "forge/logging.hpp"
#include "seed.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <chrono>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    forge::EngineConfig config;
    try {
        config = forge::load_config();
    } catch (const forge::EngineError& e) {
        forge::log_error("engine", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }
    forge::set_log_level(config.log_level);

    forge::allocation::InMemoryMasterData master_data;
    forge::pegging::InMemoryPurchasing purchasing;
    forge::inventory::LoggingGlSink gl_sink;
    forge::Engine engine(config, master_data, purchasing);

    if (!config.seed_path.empty()) {
        try {
            forge::load_seed_file(config.seed_path, engine, master_data, purchasing);
        } catch (const forge::EngineError& e) {
            forge::log_error("engine", "invalid_seed",
                             {{"path", config.seed_path}, {"error", e.what()}});
            return 1;
        }
    }

    forge::inventory::GlOutboxDispatcher dispatcher(
        engine.ledger().outbox(), gl_sink, std::chrono::milliseconds(config.gl_drain_interval_ms));
    dispatcher.start();

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    grpc::EnableDefaultHealthCheckService(true);

    auto service = forge::create_engine_service(engine);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        forge::log_error("engine", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    forge::log_info("engine", "fulfillment_engine_server_started", {{"port", config.port}});

    server->Wait();

    return 0;
}
