#include <charconv>
#include <cstring>
#include <iostream>

#include "../include/pmpp/natpmp.hpp"

std::ostream& operator<<(std::ostream& out, const pmp::error_code& error)
{
    const std::string msg = error.message();
    out << error.category().name()
        << ": " << msg
        << " (" << error.value() << ")";
    return out;
}

// Polls until the pending request is answered or given up on.
pmp::response read_response(pmp::session& natpmp, pmp::error_code& error)
{
    pmp::response response;
    do {
        response = natpmp.read_response_or_retry(error);
    } while(error == asio::error::try_again);
    return response;
}

// Accepts a decimal port in [1, 65535] and nothing else.
bool parse_port(const char* arg, uint16_t& port)
{
    const char* end = arg + std::strlen(arg);
    unsigned long value = 0;
    const auto result = std::from_chars(arg, end, value);
    if(result.ec != std::errc() || result.ptr != end || value == 0 || value > 65535)
        return false;
    port = uint16_t(value);
    return true;
}

int main(int argc, char** argv)
{
    pmp::log::set_level(pmp::log::level::info);

    uint16_t port = 4020;
    if(argc > 1 && !parse_port(argv[1], port)) {
        std::cerr << "invalid port: " << argv[1] << " (expected 1-65535)\n";
        return 2;
    }

    pmp::session natpmp{pmp::blocking_udp_transport()};
    pmp::error_code error;
    pmp::open_default(natpmp, error);
    if(error) {
        std::cout << "open error: " << error << '\n';
        return 1;
    }
    std::cout << "gateway: " << natpmp.gateway() << '\n';

    natpmp.send_public_address_request(error);
    if(error) {
        std::cout << "send_public_address_request error: " << error << '\n';
        return 1;
    }
    auto response = read_response(natpmp, error);
    if(error)
        std::cout << "public address error: " << error << '\n';
    else
        std::cout << "public address: "
            << std::get<pmp::gateway_response>(response).external_address << '\n';

    natpmp.send_port_mapping_request(pmp::protocol::udp, port, port,
            std::chrono::hours(2), error);
    if(error) {
        std::cout << "send_port_mapping_request error: " << error << '\n';
        return 1;
    }
    response = read_response(natpmp, error);
    if(error) {
        std::cout << "port mapping error: " << error << '\n';
        return 1;
    }
    const auto& mapping = std::get<pmp::udp_mapping_response>(response);
    std::cout << "mapped udp " << mapping.internal_port << " -> "
        << mapping.external_port << " for " << mapping.lifetime.count() << "s\n";

    natpmp.send_remove_mapping_request(pmp::protocol::udp, port, error);
    if(!error)
        read_response(natpmp, error);
    if(error)
        std::cout << "remove mapping error: " << error << '\n';
    else
        std::cout << "removed mapping\n";
}
