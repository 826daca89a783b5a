#pragma once

#include <utility>  // must precede Boost.Asio: awaitable.hpp uses std::exchange without it

#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sg::protocols {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

[[noreturn]] inline void throwWithContext(std::string_view what, std::string_view detail) {
    throw std::runtime_error(std::string(what) + ": " + std::string(detail));
}

template <class Fn>
void wrapSys(const std::string_view what, Fn&& fn) {
    try { std::forward<Fn>(fn)(); }
    catch (const boost::system::system_error& e) { throwWithContext(what, e.what()); }
}

inline std::string endpointToString(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

inline tcp::endpoint resolveListenEndpoint(const std::string& host, const unsigned short port) {
    boost::system::error_code ec;
    const auto addr = asio::ip::make_address(host, ec);
    if (ec) throwWithContext("Invalid listen address '" + host + "'", ec.message());
    return {addr, port};
}

inline void initAcceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    wrapSys("Failed to open acceptor", [&] { acceptor.open(endpoint.protocol()); });
    wrapSys("Failed to set reuse_address", [&] {
        acceptor.set_option(asio::socket_base::reuse_address(true));
    });
    wrapSys("Failed to bind " + endpointToString(endpoint), [&] { acceptor.bind(endpoint); });
    wrapSys("Failed to listen on acceptor", [&] {
        acceptor.listen(asio::socket_base::max_listen_connections);
    });
}

}
