#ifndef PMPP_GATEWAY_HEADER
#define PMPP_GATEWAY_HEADER

#include "error.hpp"

#include <istream>
#include <string>
#include <utility>

#include <asio/ip/address_v4.hpp>

namespace pmp {

/** Supplies the address of the NAT gateway a session talks to. */
class gateway_resolver
{
public:
    virtual ~gateway_resolver() = default;

    /**
     * @param error Set to `error::client::gateway_not_found` if there is no
     * gateway, or to the error that prevented looking for one.
     *
     * @return The gateway address if no error occurred. Otherwise the
     * return value is a default constructed `asio::ip::address_v4` object.
     */
    virtual asio::ip::address_v4 resolve(error_code& error) = 0;
};

/** Always resolves to the address it was constructed with. */
class static_gateway_resolver final : public gateway_resolver
{
    asio::ip::address_v4 address_;

public:
    explicit static_gateway_resolver(const asio::ip::address_v4& address)
        : address_(address)
    {}

    asio::ip::address_v4 resolve(error_code& error) override
    {
        error = error_code();
        return address_;
    }
};

/**
 * @brief Resolves to the default gateway that is configured for this host.
 *
 * The implementation does not make any network requests. It instead parses
 * the kernel's routing table, which is only supported on Linux. Elsewhere
 * resolving fails with `asio::error::operation_not_supported`.
 */
class system_gateway_resolver final : public gateway_resolver
{
    std::string route_table_path_;

public:
    explicit system_gateway_resolver(
            std::string route_table_path = "/proc/net/route")
        : route_table_path_(std::move(route_table_path))
    {}

    asio::ip::address_v4 resolve(error_code& error) override;
};

/**
 * @brief Extracts the default gateway from the contents of Linux's
 * `/proc/net/route`.
 *
 * The default route is the first one whose destination is 0.0.0.0 and whose
 * gateway isn't.
 *
 * @param error Set to `error::client::gateway_not_found` if the table has no
 * default route.
 */
inline asio::ip::address_v4 parse_route_table(std::istream& table, error_code& error);

} // pmp

#include "impl/gateway.ipp"

#endif // PMPP_GATEWAY_HEADER
