#ifndef PMPP_UDP_TRANSPORT_IMPL
#define PMPP_UDP_TRANSPORT_IMPL

#include "../udp_transport.hpp"
#include "../log.hpp"

#include <array>
#include <utility>

namespace pmp {

namespace detail {

inline void open_ephemeral(asio::ip::udp::socket& socket, error_code& error)
{
    socket.open(asio::ip::udp::v4(), error);
    if(error) {
        return;
    }
    socket.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0), error);
    if(error) {
        error_code close_error;
        socket.close(close_error);
        if(close_error) {
            PMPP_LOG_WARNING("failed to close socket: " << close_error.message());
        }
    }
}

} // detail

inline void async_udp_transport::open(error_code& error)
{
    detail::open_ephemeral(socket_, error);
}

inline void async_udp_transport::reopen(error_code& error)
{
    asio::ip::udp::socket fresh(socket_.get_executor());
    detail::open_ephemeral(fresh, error);
    if(error) {
        return;
    }

    error_code close_error;
    socket_.close(close_error);
    if(close_error) {
        PMPP_LOG_WARNING("failed to close socket: " << close_error.message());
    }
    socket_ = std::move(fresh);
}

inline void async_udp_transport::close(error_code& error)
{
    error = error_code();
    if(socket_.is_open()) {
        socket_.close(error);
    }
}

inline std::size_t async_udp_transport::send_to(asio::const_buffer buffer,
        const asio::ip::udp::endpoint& destination, error_code& error)
{
    return socket_.send_to(buffer, destination, 0, error);
}

inline std::size_t async_udp_transport::discard_pending(error_code& error)
{
    socket_.non_blocking(true, error);
    if(error) {
        return 0;
    }

    std::array<uint8_t, 64> sink;
    asio::ip::udp::endpoint sender;
    std::size_t num_discarded = 0;
    while(true) {
        socket_.receive_from(asio::buffer(sink), sender, 0, error);
        if(error == asio::error::would_block) {
            error = error_code();
            break;
        } else if(error) {
            break;
        }
        ++num_discarded;
    }

    error_code restore_error;
    socket_.non_blocking(false, restore_error);
    if(!error) {
        error = restore_error;
    }
    return num_discarded;
}

template<typename Handler>
void async_udp_transport::async_receive_from(asio::mutable_buffer buffer,
        asio::ip::udp::endpoint& sender, clock_type::time_point deadline,
        Handler handler)
{
    const auto op = ++current_op_;
    receive_pending_ = true;
    timed_out_ = false;

    timer_.expires_at(deadline);
    timer_.async_wait([this, op](const error_code& error) {
        if(error || op != current_op_ || !receive_pending_) {
            return;
        }
        timed_out_ = true;
        error_code cancel_error;
        socket_.cancel(cancel_error);
        if(cancel_error) {
            PMPP_LOG_ERROR("failed to cancel receive: " << cancel_error.message());
        }
    });

    socket_.async_receive_from(buffer, sender,
            [this, handler = std::move(handler)](
                    error_code error, const std::size_t num_received) mutable {
                receive_pending_ = false;
                timer_.cancel();
                if(std::exchange(timed_out_, false)
                        && error == asio::error::operation_aborted) {
                    error = asio::error::timed_out;
                }
                handler(error, num_received);
            });
}

inline std::size_t blocking_udp_transport::receive_from(
        asio::mutable_buffer buffer, asio::ip::udp::endpoint& sender,
        clock_type::time_point deadline, error_code& error)
{
    std::size_t num_received = 0;
    impl_.async_receive_from(buffer, sender, deadline,
            [&error, &num_received](const error_code& ec, const std::size_t n) {
                error = ec;
                num_received = n;
            });
    // Both the receive and the deadline timer complete before run returns.
    io_context_->restart();
    io_context_->run();
    return num_received;
}

} // pmp

#endif // PMPP_UDP_TRANSPORT_IMPL
