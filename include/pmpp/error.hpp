#ifndef PMPP_ERROR_HEADER
#define PMPP_ERROR_HEADER

#include <cstdint>
#include <type_traits>
#include <string>

#include <asio/error.hpp>
#include <asio/system_error.hpp>

namespace pmp {

using asio::error_code;
using asio::error_category;

/**
 * The result code field of a NAT-PMP response.
 *
 * Any 16-bit value the gateway sends is representable: values past
 * `unsupported_opcode` are simply not named.
 */
enum class result_code : uint16_t
{
    success = 0,
    unsupported_version = 1,
    // E.g. box supports mapping but user has turned feature off.
    not_authorized = 2,
    // E.g. box hasn't obtained a DHCP lease.
    network_failure = 3,
    // Box cannot create any more mappings at this time.
    out_of_resources = 4,
    unsupported_opcode = 5,
};

namespace error {

/** Errors originating in this library rather than in the gateway or the OS. */
enum class client
{
    no_pending_request = 1,
    // The gateway did not answer any of the retransmissions.
    timeout_exhausted,
    malformed_response,
    unsupported_version,
    unexpected_opcode,
    gateway_not_found,
    invalid_argument,
};

struct result_category : public pmp::error_category
{
    const char* name() const noexcept override { return "natpmp.result"; }
    std::string message(int ev) const override
    {
        switch(static_cast<result_code>(ev)) {
        case result_code::success: return "Success";
        case result_code::unsupported_version: return "Unsupported version";
        case result_code::not_authorized: return "Not authorized";
        case result_code::network_failure: return "Network failure";
        case result_code::out_of_resources: return "Out of resources";
        case result_code::unsupported_opcode: return "Unsupported opcode";
        default: return "Unknown result code " + std::to_string(ev);
        }
    }
};

struct client_category : public pmp::error_category
{
    const char* name() const noexcept override { return "natpmp.client"; }
    std::string message(int ev) const override
    {
        switch(static_cast<client>(ev)) {
        case client::no_pending_request: return "No pending request";
        case client::timeout_exhausted: return "Gateway did not respond";
        case client::malformed_response: return "Malformed response";
        case client::unsupported_version: return "Unsupported protocol version";
        case client::unexpected_opcode: return "Unexpected opcode";
        case client::gateway_not_found: return "Cannot find default gateway";
        case client::invalid_argument: return "Invalid argument";
        default: return "Unknown error";
        }
    }
};

inline const result_category& get_result_category()
{
    static result_category instance;
    return instance;
}

inline const client_category& get_client_category()
{
    static client_category instance;
    return instance;
}

} // error

inline error_code make_error_code(result_code rc)
{
    return error_code(static_cast<int>(rc), error::get_result_category());
}

namespace error {

inline error_code make_error_code(client ec)
{
    return error_code(static_cast<int>(ec), get_client_category());
}

} // error

} // pmp

namespace std {
template<> struct is_error_code_enum<pmp::result_code> : public true_type {};
template<> struct is_error_code_enum<pmp::error::client> : public true_type {};
} // std

#endif // PMPP_ERROR_HEADER
