#ifndef PMPP_CODEC_IMPL
#define PMPP_CODEC_IMPL

#include "../codec.hpp"

#include <limits>

#include <endian/endian.hpp>

namespace pmp {

inline std::size_t prep_public_address_request_message(uint8_t* buffer)
{
    buffer[0] = natpmp_version;
    buffer[1] = static_cast<uint8_t>(opcode::public_address);
    return public_address_request_size;
}

inline std::size_t prep_mapping_request_message(uint8_t* buffer,
        const port_mapping_request& mapping, error_code& error)
{
    if(mapping.lifetime.count() < 0
            || mapping.lifetime.count() > std::numeric_limits<uint32_t>::max()) {
        error = make_error_code(error::client::invalid_argument);
        return 0;
    }
    if(mapping.type != protocol::udp && mapping.type != protocol::tcp) {
        error = make_error_code(error::client::invalid_argument);
        return 0;
    }

    buffer[0] = natpmp_version;
    buffer[1] = static_cast<uint8_t>(request_opcode(mapping));
    // Reserved.
    buffer[2] = 0;
    buffer[3] = 0;
    endian::write<endian::order::network, uint16_t>(mapping.internal_port, &buffer[4]);
    endian::write<endian::order::network, uint16_t>(mapping.external_port, &buffer[6]);
    endian::write<endian::order::network, uint32_t>(
            static_cast<uint32_t>(mapping.lifetime.count()), &buffer[8]);
    return port_mapping_request_size;
}

inline std::size_t encode_request(const request& req,
        asio::mutable_buffer buffer, error_code& error)
{
    error = error_code();
    const auto* mapping = std::get_if<port_mapping_request>(&req);
    const std::size_t needed = mapping
        ? port_mapping_request_size : public_address_request_size;
    if(buffer.size() < needed) {
        error = make_error_code(error::client::invalid_argument);
        return 0;
    }

    auto* out = static_cast<uint8_t*>(buffer.data());
    if(mapping) {
        return prep_mapping_request_message(out, *mapping, error);
    }
    return prep_public_address_request_message(out);
}

inline std::size_t expected_response_size(uint8_t op)
{
    return op == response_opcode(opcode::public_address)
        ? public_address_response_size : port_mapping_response_size;
}

inline mapping_response parse_mapping_response(const uint8_t* buffer)
{
    mapping_response mapping;
    mapping.internal_port = endian::read<endian::order::network, uint16_t>(&buffer[8]);
    mapping.external_port = endian::read<endian::order::network, uint16_t>(&buffer[10]);
    mapping.lifetime = std::chrono::seconds(
            endian::read<endian::order::network, uint32_t>(&buffer[12]));
    return mapping;
}

inline response decode_response(asio::const_buffer buffer, error_code& error)
{
    error = error_code();
    const auto* data = static_cast<const uint8_t*>(buffer.data());
    const auto size = buffer.size();

    if(size == 0) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    // Version code must be zero, whatever else is in the packet.
    if(data[0] != natpmp_version) {
        error = make_error_code(error::client::unsupported_version);
        return {};
    }
    if(size < 2) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    // The opcode must be 128 + one of the request opcodes.
    const uint8_t op = data[1];
    if(op != response_opcode(opcode::public_address)
            && op != response_opcode(opcode::udp_mapping)
            && op != response_opcode(opcode::tcp_mapping)) {
        error = make_error_code(error::client::unexpected_opcode);
        return {};
    }
    if(size != expected_response_size(op)) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }

    const auto result = static_cast<result_code>(
            endian::read<endian::order::network, uint16_t>(&data[2]));
    const auto epoch = endian::read<endian::order::network, uint32_t>(&data[4]);

    if(op == response_opcode(opcode::public_address)) {
        gateway_response gateway;
        gateway.result = result;
        gateway.epoch = epoch;
        gateway.external_address = asio::ip::address_v4(
                endian::read<endian::order::network, uint32_t>(&data[8]));
        return gateway;
    }

    auto mapping = parse_mapping_response(data);
    mapping.result = result;
    mapping.epoch = epoch;
    if(op == response_opcode(opcode::udp_mapping)) {
        return udp_mapping_response{mapping};
    }
    return tcp_mapping_response{mapping};
}

} // pmp

#endif // PMPP_CODEC_IMPL
