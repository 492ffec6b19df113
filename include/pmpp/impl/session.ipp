#ifndef PMPP_SESSION_IMPL
#define PMPP_SESSION_IMPL

#include "../session.hpp"
#include "../log.hpp"

#include <utility>

#include <asio/detail/throw_error.hpp>
#include <asio/post.hpp>

namespace pmp {

template<typename Transport, typename Clock>
basic_session<Transport, Clock>::basic_session(Transport transport,
        const session_config& config)
    : transport_(std::move(transport))
    , config_(config)
    , scheduler_(config.retry)
{}

template<typename Transport, typename Clock>
basic_session<Transport, Clock>::basic_session(Transport transport,
        const asio::ip::address_v4& gateway, const session_config& config)
    : basic_session(std::move(transport), config)
{
    open(gateway);
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::open(
        const asio::ip::address_v4& gateway, error_code& error)
{
    error = error_code();
    scheduler_.clear();
    has_epoch_ = false;
    gateway_ = gateway;
    if(!transport_.is_open()) {
        carried_request_ = false;
        transport_.open(error);
        if(error) {
            PMPP_LOG_ERROR("cannot open transport: " << error.message());
            return;
        }
    }
    PMPP_LOG_INFO("using gateway " << gateway_endpoint());
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::open(const asio::ip::address_v4& gateway)
{
    error_code error;
    open(gateway, error);
    asio::detail::throw_error(error, "open");
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::close(error_code& error)
{
    scheduler_.clear();
    carried_request_ = false;
    transport_.close(error);
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::close()
{
    error_code error;
    close(error);
    asio::detail::throw_error(error, "close");
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_public_address_request(error_code& error)
{
    send_request(public_address_request(), error);
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_public_address_request()
{
    error_code error;
    send_public_address_request(error);
    asio::detail::throw_error(error, "send_public_address_request");
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_port_mapping_request(protocol type,
        uint16_t internal_port, uint16_t external_port,
        std::chrono::seconds lifetime, error_code& error)
{
    port_mapping_request mapping;
    mapping.type = type;
    mapping.internal_port = internal_port;
    mapping.external_port = external_port;
    mapping.lifetime = lifetime;
    send_request(mapping, error);
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_port_mapping_request(protocol type,
        uint16_t internal_port, uint16_t external_port,
        std::chrono::seconds lifetime)
{
    error_code error;
    send_port_mapping_request(type, internal_port, external_port, lifetime, error);
    asio::detail::throw_error(error, "send_port_mapping_request");
}

// Removing a mapping involves the exact same request and response message
// formats, with the external port and the lifetime set to zero.

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_remove_mapping_request(protocol type,
        uint16_t internal_port, error_code& error)
{
    send_port_mapping_request(type, internal_port, 0, std::chrono::seconds(0), error);
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_remove_mapping_request(protocol type,
        uint16_t internal_port)
{
    error_code error;
    send_remove_mapping_request(type, internal_port, error);
    asio::detail::throw_error(error, "send_remove_mapping_request");
}

template<typename Transport, typename Clock>
typename basic_session<Transport, Clock>::duration
basic_session<Transport, Clock>::request_timeout(error_code& error) const
{
    error = error_code();
    if(!scheduler_.is_pending()) {
        error = make_error_code(error::client::no_pending_request);
        return duration(0);
    }
    const auto now = Clock::now();
    if(now >= scheduler_.deadline()) {
        return duration(0);
    }
    return scheduler_.deadline() - now;
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_request(const request& req,
        error_code& error)
{
    // Replies to earlier requests would otherwise be taken for replies to
    // this one. A socket that never carried a request can only hold
    // datagrams that already arrived; one that did may still receive replies
    // to it, so it is replaced.
    if(carried_request_) {
        transport_.reopen(error);
        if(error) {
            PMPP_LOG_ERROR("cannot reopen transport: " << error.message());
            scheduler_.clear();
            return;
        }
        carried_request_ = false;
    } else {
        const auto num_discarded = transport_.discard_pending(error);
        if(error) {
            scheduler_.clear();
            return;
        }
        if(num_discarded > 0) {
            PMPP_LOG_DEBUG("discarded " << num_discarded << " stale datagram(s)");
        }
    }

    scheduler_.start(req, Clock::now(), error);
    if(error) {
        return;
    }
    carried_request_ = true;
    send_pending_request(error);
    if(error) {
        PMPP_LOG_ERROR("cannot send request to " << gateway_endpoint()
                << ": " << error.message());
        scheduler_.clear();
        return;
    }
    PMPP_LOG_DEBUG("sent request with opcode "
            << int(static_cast<uint8_t>(scheduler_.pending_opcode()))
            << " to " << gateway_endpoint());
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::send_pending_request(error_code& error)
{
    const auto request = scheduler_.pending_request();
    const auto num_sent = transport_.send_to(request, gateway_endpoint(), error);
    if(error) {
        return;
    }
    if(num_sent != request.size()) {
        error = std::make_error_code(std::errc::bad_message);
    }
}

template<typename Transport, typename Clock>
response basic_session<Transport, Clock>::read_response_or_retry(error_code& error)
{
    error = error_code();
    if(!scheduler_.is_pending()) {
        error = make_error_code(error::client::no_pending_request);
        return {};
    }

    response r;
    while(true) {
        const auto num_received = transport_.receive_from(
                asio::buffer(receive_buffer_), sender_, scheduler_.deadline(), error);
        if(complete_poll(error, num_received, r)) {
            return r;
        }
    }
}

template<typename Transport, typename Clock>
template<typename Handler>
void basic_session<Transport, Clock>::async_poll(Handler handler)
{
    if(!scheduler_.is_pending()) {
        asio::post(transport_.get_executor(),
                [handler = std::move(handler)]() mutable {
                    handler(make_error_code(error::client::no_pending_request),
                            response());
                });
        return;
    }

    transport_.async_receive_from(asio::buffer(receive_buffer_), sender_,
            scheduler_.deadline(),
            [this, handler = std::move(handler)](
                    error_code error, const std::size_t num_received) mutable {
                response r;
                if(complete_poll(error, num_received, r)) {
                    handler(error, std::move(r));
                } else {
                    async_poll(std::move(handler));
                }
            });
}

template<typename Transport, typename Clock>
bool basic_session<Transport, Clock>::complete_poll(error_code& error,
        const std::size_t num_received, response& r)
{
    if(error == asio::error::timed_out) {
        error = error_code();
        if(!scheduler_.can_retransmit()) {
            scheduler_.clear();
            PMPP_LOG_WARNING("gateway " << gateway_ << " did not respond after "
                    << scheduler_.policy().max_attempts << " attempts");
            error = make_error_code(error::client::timeout_exhausted);
            return true;
        }

        // The schedule only advances once the retransmission is on the wire.
        // Until then the deadline stays in the past, so the next poll retries
        // the send right away.
        send_pending_request(error);
        if(error) {
            PMPP_LOG_ERROR("cannot retransmit request to " << gateway_endpoint()
                    << ": " << error.message());
            return true;
        }
        scheduler_.on_retransmitted(Clock::now());
        PMPP_LOG_DEBUG("no response, retransmitted (attempt "
                << scheduler_.attempt() << ", timeout "
                << std::chrono::duration_cast<std::chrono::milliseconds>(
                        scheduler_.current_timeout()).count() << "ms)");
        error = asio::error::try_again;
        return true;
    } else if(error) {
        PMPP_LOG_ERROR("receive failed: " << error.message());
        return true;
    }

    // RFC 6886 §3.1: responses not sent by the gateway must be ignored.
    if(sender_.address() != asio::ip::address(gateway_)) {
        PMPP_LOG_DEBUG("discarding datagram from " << sender_);
        return false;
    }
    if(!scheduler_.match(asio::buffer(receive_buffer_.data(), num_received), r)) {
        return false;
    }

    scheduler_.clear();
    note_epoch(response_epoch(r));
    const auto result = response_result(r);
    if(result != result_code::success) {
        PMPP_LOG_INFO("gateway refused request: "
                << make_error_code(result).message());
        error = make_error_code(result);
    }
    return true;
}

template<typename Transport, typename Clock>
void basic_session<Transport, Clock>::note_epoch(uint32_t epoch)
{
    const auto now = Clock::now();
    if(has_epoch_ && gateway_restarted(last_epoch_, epoch,
                std::chrono::duration_cast<std::chrono::seconds>(now - last_epoch_time_))) {
        PMPP_LOG_WARNING("gateway " << gateway_ << " restarted (epoch "
                << last_epoch_ << " -> " << epoch << "), mappings must be renewed");
    }
    has_epoch_ = true;
    last_epoch_ = epoch;
    last_epoch_time_ = now;
}

template<typename Transport, typename Clock>
void open_with_resolver(basic_session<Transport, Clock>& natpmp,
        gateway_resolver& resolver, error_code& error)
{
    const auto gateway = resolver.resolve(error);
    if(error) {
        return;
    }
    natpmp.open(gateway, error);
}

template<typename Transport, typename Clock>
void open_default(basic_session<Transport, Clock>& natpmp, error_code& error)
{
    system_gateway_resolver resolver;
    open_with_resolver(natpmp, resolver, error);
}

} // pmp

#endif // PMPP_SESSION_IMPL
