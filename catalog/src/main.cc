#include "seed_catalog.hpp"
#include "store_service.hpp"
#include "storefront/logging.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <cstdlib>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    const char* port_env = std::getenv("PORT");
    std::string port = port_env ? port_env : "51001";
    const char* bind_env = std::getenv("BIND_ADDRESS");
    std::string server_address = std::string(bind_env ? bind_env : "0.0.0.0") + ":" + port;

    grpc::EnableDefaultHealthCheckService(true);

    auto service = catalog::create_store_service(catalog::make_seed_store());

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        storefront::log_error("store", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    storefront::log_info("store", "store_server_started", {{"address", server_address}});

    server->Wait();

    return 0;
}
