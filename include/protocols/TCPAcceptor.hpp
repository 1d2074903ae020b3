#pragma once

#include "engine/TransferEngine.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::protocols {

namespace asio  = boost::asio;
using tcp = asio::ip::tcp;

[[noreturn]] inline void throw_bind_error(std::string_view what, const boost::system::error_code& ec) {
    throw engine::BindError(std::error_code(ec.value(), std::system_category()), std::string(what));
}

template <class Fn>
void wrap_sys(const std::string_view what, Fn&& fn) {
    try { std::forward<Fn>(fn)(); }
    catch (const boost::system::system_error& e) { throw_bind_error(what, e.code()); }
}

inline std::string endpointToString(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

inline tcp::endpoint make_endpoint(const std::string& address, const uint16_t port) {
    tcp::endpoint endpoint;
    wrap_sys("Invalid listen address '" + address + "'", [&] {
        endpoint = tcp::endpoint(asio::ip::make_address(address), port);
    });
    return endpoint;
}

inline void init_acceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    wrap_sys("Failed to open acceptor", [&] { acceptor.open(endpoint.protocol()); });
    wrap_sys("Failed to set reuse_address", [&] {
        acceptor.set_option(asio::socket_base::reuse_address(true));
    });
    wrap_sys("Failed to bind " + endpointToString(endpoint), [&] { acceptor.bind(endpoint); });
    wrap_sys("Failed to listen on " + endpointToString(endpoint), [&] {
        acceptor.listen(asio::socket_base::max_listen_connections);
    });
}

}
