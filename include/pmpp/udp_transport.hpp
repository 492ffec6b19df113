#ifndef PMPP_UDP_TRANSPORT_HEADER
#define PMPP_UDP_TRANSPORT_HEADER

#include "error.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/buffer.hpp>

namespace pmp {

/**
 * @brief A UDP socket bound to an ephemeral local port, whose receive
 * operations complete with `asio::error::timed_out` once a deadline passes.
 *
 * The socket is not connected: it can exchange datagrams with any peer and
 * leaves it to its user to tell where a datagram came from.
 *
 * All operations run on the `io_context` passed to the constructor, so this
 * transport lets a session be driven by the caller's event loop.
 *
 * @par Thread Safety
 * @e Distinct @e objects: Safe.@n
 * @e Shared @e objects: Unsafe.
 */
class async_udp_transport
{
    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;

    // Identifies the current receive operation so that a late timer
    // completion doesn't cancel a receive started after it.
    std::size_t current_op_ = 0;
    bool receive_pending_ = false;
    bool timed_out_ = false;

public:
    using clock_type = std::chrono::steady_clock;

    explicit async_udp_transport(asio::io_context& io_context)
        : socket_(io_context)
        , timer_(io_context)
    {}

    async_udp_transport(async_udp_transport&&) = default;
    async_udp_transport& operator=(async_udp_transport&&) = default;

    auto get_executor() { return socket_.get_executor(); }

    /** Opens an IPv4 socket and binds it to an OS assigned port. */
    void open(error_code& error);
    void close(error_code& error);
    bool is_open() const { return socket_.is_open(); }

    /**
     * @brief Replaces the socket with one bound to a different OS assigned
     * port.
     *
     * Datagrams addressed to the old port, including those still in flight,
     * are never received. The new socket is bound before the old one is
     * closed, so the two ports cannot coincide. If @p error is set the old
     * socket is kept.
     */
    void reopen(error_code& error);

    asio::ip::udp::endpoint local_endpoint(error_code& error) const
    {
        return socket_.local_endpoint(error);
    }

    std::size_t send_to(asio::const_buffer buffer,
            const asio::ip::udp::endpoint& destination, error_code& error);

    /**
     * @brief Drops every datagram already queued on the socket without
     * blocking.
     *
     * @return The number of datagrams dropped.
     */
    std::size_t discard_pending(error_code& error);

    /**
     * @brief Waits for a single datagram, but no longer than @p deadline.
     *
     * @param handler The handler to be called when the operation completes.
     * The function signature of the handler must be:
     * @code void handler(
     *   pmp::error_code, // asio::error::timed_out if the deadline passed.
     *   std::size_t // The number of bytes received.
     * ); @endcode
     * The handler is invoked through the socket's executor.
     *
     * @note Only a single receive may be outstanding at a time.
     */
    template<typename Handler>
    void async_receive_from(asio::mutable_buffer buffer,
            asio::ip::udp::endpoint& sender, clock_type::time_point deadline,
            Handler handler);
};

/**
 * @brief The blocking counterpart of @ref async_udp_transport.
 *
 * It owns a private `io_context` that it runs on the calling thread for the
 * duration of every receive, so it needs no event loop from its user.
 */
class blocking_udp_transport
{
    // Heap allocated so that the socket's reference to it survives moves.
    std::unique_ptr<asio::io_context> io_context_;
    async_udp_transport impl_;

public:
    using clock_type = async_udp_transport::clock_type;

    blocking_udp_transport()
        : io_context_(std::make_unique<asio::io_context>())
        , impl_(*io_context_)
    {}

    blocking_udp_transport(blocking_udp_transport&&) = default;
    // The destination's io_context would be destroyed while its socket is
    // still registered with it.
    blocking_udp_transport& operator=(blocking_udp_transport&&) = delete;

    void open(error_code& error) { impl_.open(error); }
    void close(error_code& error) { impl_.close(error); }
    bool is_open() const { return impl_.is_open(); }
    void reopen(error_code& error) { impl_.reopen(error); }

    asio::ip::udp::endpoint local_endpoint(error_code& error) const
    {
        return impl_.local_endpoint(error);
    }

    std::size_t send_to(asio::const_buffer buffer,
            const asio::ip::udp::endpoint& destination, error_code& error)
    {
        return impl_.send_to(buffer, destination, error);
    }

    std::size_t discard_pending(error_code& error)
    {
        return impl_.discard_pending(error);
    }

    /**
     * @brief Blocks until a single datagram is received or @p deadline
     * passes, in which case @p error is set to `asio::error::timed_out`.
     *
     * @return The number of bytes received.
     */
    std::size_t receive_from(asio::mutable_buffer buffer,
            asio::ip::udp::endpoint& sender, clock_type::time_point deadline,
            error_code& error);
};

} // pmp

#include "impl/udp_transport.ipp"

#endif // PMPP_UDP_TRANSPORT_HEADER
