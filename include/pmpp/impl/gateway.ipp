#ifndef PMPP_GATEWAY_IMPL
#define PMPP_GATEWAY_IMPL

#include "../gateway.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>

#include <endian/endian.hpp>
#include <asio/error.hpp>

namespace pmp {

inline asio::ip::address_v4 parse_route_table(std::istream& table,
        error_code& error)
{
/* Example route file:
Iface	Destination	Gateway 	Flags	RefCnt	Use	Metric	Mask		MTU	Window	IRTT
wlp7s0	00000000	0100A8C0	0003	0	0	600	00000000	0	0	0
wlp7s0	0000A8C0	00000000	0001	0	0	600	00FFFFFF	0	0	0
*/
    error = error_code();
    std::string line;
    // Skip the header.
    std::getline(table, line);
    while(std::getline(table, line))
    {
        // Ignore the interface identifier by trimming up to the first whitespace char.
        line.erase(line.cbegin(), std::find_if(line.cbegin(), line.cend(),
            [](const char c) { return std::isspace(static_cast<unsigned char>(c)); }));
        std::istringstream ss(line);
        uint32_t dest = 0;
        uint32_t gateway = 0;
        ss >> std::hex >> dest >> gateway;
        if(!ss) {
            continue;
        }
        if((dest == 0) && (gateway != 0))
        {
            // The route table stores addresses in the architecture's byte
            // order, but they are parsed as if they were big endian.
            if(endian::order::host == endian::order::little)
                return asio::ip::address_v4(endian::reverse(gateway));
            else
                return asio::ip::address_v4(gateway);
        }
    }
    error = make_error_code(error::client::gateway_not_found);
    return {};
}

inline asio::ip::address_v4 system_gateway_resolver::resolve(error_code& error)
{
#if defined(__linux__)
    std::ifstream file(route_table_path_);
    if(!file)
    {
        error = std::make_error_code(std::errc::no_such_file_or_directory);
        return {};
    }
    return parse_route_table(file, error);
#else
    error = asio::error::operation_not_supported;
    return {};
#endif
}

} // pmp

#endif // PMPP_GATEWAY_IMPL
