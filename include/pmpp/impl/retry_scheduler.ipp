#ifndef PMPP_RETRY_SCHEDULER_IMPL
#define PMPP_RETRY_SCHEDULER_IMPL

#include "../retry_scheduler.hpp"
#include "../log.hpp"

namespace pmp {

template<typename Clock>
void retry_scheduler<Clock>::start(const request& req, time_point now,
        error_code& error)
{
    clear();
    request_size_ = encode_request(req, asio::buffer(request_buffer_), error);
    if(error) {
        request_size_ = 0;
        return;
    }

    opcode_ = request_opcode(req);
    if(const auto* mapping = std::get_if<port_mapping_request>(&req)) {
        internal_port_ = mapping->internal_port;
    }
    pending_ = true;
    attempt_ = 0;
    timeout_ = std::chrono::duration_cast<duration>(policy_.initial_timeout);
    deadline_ = now + timeout_;
}

template<typename Clock>
void retry_scheduler<Clock>::clear() noexcept
{
    pending_ = false;
    request_size_ = 0;
    internal_port_ = 0;
    attempt_ = 0;
    timeout_ = duration(0);
}

template<typename Clock>
bool retry_scheduler<Clock>::match(asio::const_buffer datagram, response& out) const
{
    if(!pending_) {
        return false;
    }

    error_code error;
    auto r = decode_response(datagram, error);
    if(error) {
        PMPP_LOG_DEBUG("discarding " << datagram.size()
                << " byte datagram: " << error.message());
        return false;
    }
    if(response_opcode(r) != response_opcode(opcode_)) {
        PMPP_LOG_DEBUG("discarding response with opcode "
                << int(response_opcode(r)) << ", expected "
                << int(response_opcode(opcode_)));
        return false;
    }

    if(response_result(r) == result_code::success) {
        const mapping_response* mapping = nullptr;
        if(const auto* udp = std::get_if<udp_mapping_response>(&r)) {
            mapping = udp;
        } else if(const auto* tcp = std::get_if<tcp_mapping_response>(&r)) {
            mapping = tcp;
        }
        // A successful mapping response echoes the internal port of the
        // request it answers. Anything else is a late reply to an earlier
        // request.
        if(mapping && mapping->internal_port != internal_port_) {
            PMPP_LOG_DEBUG("discarding stale mapping response for port "
                    << mapping->internal_port << ", expected " << internal_port_);
            return false;
        }
    }

    out = std::move(r);
    return true;
}

template<typename Clock>
void retry_scheduler<Clock>::on_retransmitted(time_point now)
{
    ++attempt_;
    timeout_ *= 2;
    deadline_ = now + timeout_;
}

} // pmp

#endif // PMPP_RETRY_SCHEDULER_IMPL
