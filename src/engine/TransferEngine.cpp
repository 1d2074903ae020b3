#include "engine/TransferEngine.hpp"

namespace ferry::engine {

BindRequest BindRequest::fromConfig(const types::ServerConfig& config) {
    return {
        .listen_address = config.listen_address,
        .port = config.port,
        .max_connections = config.max_connections,
        .max_connections_per_ip = config.max_connections_per_ip,
        .passive_ports = config.passive_ports,
        .banner = config.banner,
    };
}

}
