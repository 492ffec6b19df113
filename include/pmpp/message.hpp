#ifndef PMPP_MESSAGE_HEADER
#define PMPP_MESSAGE_HEADER

#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <variant>

#include <asio/ip/address_v4.hpp>

namespace pmp {

/** The UDP port on which NAT-PMP gateways listen for requests. */
constexpr unsigned short natpmp_port = 5351;

/** The only protocol version this library speaks. */
constexpr uint8_t natpmp_version = 0;

enum class protocol { udp, tcp };

enum class opcode : uint8_t
{
    public_address = 0,
    udp_mapping = 1,
    tcp_mapping = 2,
};

/** The gateway answers a request with its opcode with the high bit set. */
constexpr uint8_t response_opcode(opcode op) noexcept
{
    return static_cast<uint8_t>(op) | 0x80;
}

/** Asks the gateway for the address of its WAN facing side. */
struct public_address_request {};

/**
 * This object represents a request for a mapping between host's port and a
 * port on the router's WAN facing side.
 */
struct port_mapping_request
{
    protocol type = protocol::udp;
    // The port on which this host will be listening for connections.
    uint16_t internal_port = 0;
    // The port on which the router's WAN facing side should listen for
    // connections.
    //
    // @note This is only a suggestion and NAT boxes are free to map
    // `internal_port` to something else.
    uint16_t external_port = 0;
    // The requested lifetime of the mapping. It is advised that the mapping be
    // renewed at half of this value. Zero removes the mapping.
    std::chrono::seconds lifetime{0};
};

/** Determines if @p request is a request to remove a mapping. */
inline bool is_remove_mapping_request(const port_mapping_request& request)
{
    return request.lifetime == std::chrono::seconds(0);
}

using request = std::variant<public_address_request, port_mapping_request>;

inline opcode request_opcode(const request& req) noexcept
{
    if(const auto* mapping = std::get_if<port_mapping_request>(&req)) {
        return mapping->type == protocol::udp
            ? opcode::udp_mapping : opcode::tcp_mapping;
    }
    return opcode::public_address;
}

struct gateway_response
{
    result_code result = result_code::success;
    // Seconds since the gateway's mapping table was initialized.
    uint32_t epoch = 0;
    asio::ip::address_v4 external_address;
};

struct mapping_response
{
    result_code result = result_code::success;
    uint32_t epoch = 0;
    uint16_t internal_port = 0;
    // The port the gateway actually mapped, which may differ from the one
    // requested.
    uint16_t external_port = 0;
    // The lifetime the gateway granted.
    std::chrono::seconds lifetime{0};
};

struct udp_mapping_response : mapping_response {};
struct tcp_mapping_response : mapping_response {};

using response = std::variant<
    gateway_response, udp_mapping_response, tcp_mapping_response>;

/** The opcode a response was sent with. */
inline uint8_t response_opcode(const response& r) noexcept
{
    if(std::holds_alternative<gateway_response>(r)) {
        return response_opcode(opcode::public_address);
    } else if(std::holds_alternative<udp_mapping_response>(r)) {
        return response_opcode(opcode::udp_mapping);
    }
    return response_opcode(opcode::tcp_mapping);
}

inline result_code response_result(const response& r) noexcept
{
    return std::visit([](const auto& v) { return v.result; }, r);
}

inline uint32_t response_epoch(const response& r) noexcept
{
    return std::visit([](const auto& v) { return v.epoch; }, r);
}

/**
 * Determines whether the gateway lost its mapping table between two responses.
 *
 * A gateway's epoch advances by roughly a second every second. If the new
 * epoch is below the old one, or fell behind by more than the tolerance
 * RFC 6886 §3.6 allows for clock drift (1/8 of the elapsed time, plus 2
 * seconds), the gateway restarted and every mapping should be recreated.
 *
 * @param elapsed The time that passed on this host between receiving the two
 * epochs.
 */
inline bool gateway_restarted(uint32_t previous_epoch, uint32_t current_epoch,
        std::chrono::seconds elapsed) noexcept
{
    if(current_epoch < previous_epoch) {
        return true;
    }
    const int64_t expected = int64_t(previous_epoch) + elapsed.count() * 7 / 8;
    return int64_t(current_epoch) + 2 < expected;
}

} // pmp

#endif // PMPP_MESSAGE_HEADER
