#ifndef PMPP_CODEC_HEADER
#define PMPP_CODEC_HEADER

#include "message.hpp"
#include "error.hpp"

#include <cstddef>

#include <asio/buffer.hpp>

namespace pmp {

constexpr std::size_t public_address_request_size = 2;
constexpr std::size_t port_mapping_request_size = 12;
constexpr std::size_t public_address_response_size = 12;
constexpr std::size_t port_mapping_response_size = 16;

constexpr std::size_t max_request_size = port_mapping_request_size;
constexpr std::size_t max_response_size = port_mapping_response_size;

/**
 * @brief Serializes @p req into @p buffer.
 *
 * @param error Set to `error::client::invalid_argument` if @p buffer is too
 * small or a field of @p req cannot be represented on the wire.
 *
 * @return The number of bytes written, or 0 if @p error is set.
 */
inline std::size_t encode_request(const request& req,
        asio::mutable_buffer buffer, error_code& error);

/**
 * @brief Parses a single datagram received from the gateway.
 *
 * A response whose result code is not `result_code::success` is NOT reported
 * through @p error: it is a well-formed message and is returned as such.
 *
 * @param error Set to `error::client::unsupported_version`,
 * `error::client::unexpected_opcode` or `error::client::malformed_response`
 * if the datagram isn't a NAT-PMP response.
 *
 * @return The decoded response, or a default constructed one if @p error is
 * set.
 */
inline response decode_response(asio::const_buffer buffer, error_code& error);

} // pmp

#include "impl/codec.ipp"

#endif // PMPP_CODEC_HEADER
