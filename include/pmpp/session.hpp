#ifndef PMPP_SESSION_HEADER
#define PMPP_SESSION_HEADER

#include "message.hpp"
#include "config.hpp"
#include "error.hpp"
#include "gateway.hpp"
#include "retry_scheduler.hpp"
#include "udp_transport.hpp"

#include <array>
#include <chrono>
#include <cstdint>

#include <asio/async_result.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

namespace pmp {

/**
 * @brief A client for a single NAT-PMP gateway.
 *
 * A session has at most one request outstanding. Sending a new request
 * abandons the previous one, so responses meant for it are never mistaken
 * for responses to the new one.
 *
 * Requests are sent with one of the `send_*` functions, which return as soon
 * as the request has been sent once. The response is then collected with
 * @ref read_response_or_retry, which also retransmits the request, per
 * RFC 6886, when it was not answered in time:
 * @code
 * pmp::session natpmp(pmp::blocking_udp_transport(), gateway);
 * natpmp.send_public_address_request();
 * pmp::error_code error;
 * pmp::response response;
 * do {
 *     response = natpmp.read_response_or_retry(error);
 * } while(error == asio::error::try_again);
 * @endcode
 *
 * @tparam Transport Either @ref blocking_udp_transport, which makes
 * @ref read_response_or_retry available, or @ref async_udp_transport, which
 * makes @ref async_read_response_or_retry available.
 *
 * @tparam Clock The clock against which retransmission deadlines are
 * measured. It must be the clock of the transport's deadlines.
 *
 * @par Thread Safety
 * @e Distinct @e objects: Safe.@n
 * @e Shared @e objects: Unsafe.
 */
template<typename Transport, typename Clock = std::chrono::steady_clock>
class basic_session
{
public:
    using transport_type = Transport;
    using clock_type = Clock;
    using duration = typename Clock::duration;

private:
    Transport transport_;
    session_config config_;
    asio::ip::address_v4 gateway_;
    retry_scheduler<Clock> scheduler_;

    // Larger than any valid response so that oversized datagrams are detected
    // instead of truncated into something that parses.
    std::array<uint8_t, 64> receive_buffer_;
    asio::ip::udp::endpoint sender_;

    // Set once a request went out through the current socket. Replies to it
    // may arrive at any later time, so the next request needs a new port.
    bool carried_request_ = false;

    // The epoch of the most recent response and when it arrived, to detect
    // gateway restarts.
    bool has_epoch_ = false;
    uint32_t last_epoch_ = 0;
    typename Clock::time_point last_epoch_time_;

public:
    /** Constructs a session that is not yet open. */
    explicit basic_session(Transport transport,
            const session_config& config = session_config());

    /**
     * Constructs a session and opens it with @p gateway.
     *
     * @throws asio::system_error if the transport could not be opened.
     */
    basic_session(Transport transport, const asio::ip::address_v4& gateway,
            const session_config& config = session_config());

    basic_session(basic_session&&) = default;

    /**
     * @brief Opens the transport, if it isn't already, and directs all further
     * requests to @p gateway.
     *
     * Any pending request is abandoned.
     */
    void open(const asio::ip::address_v4& gateway, error_code& error);
    void open(const asio::ip::address_v4& gateway);

    /** Abandons any pending request and releases the transport. */
    void close(error_code& error);
    void close();

    bool is_open() const { return transport_.is_open(); }

    const asio::ip::address_v4& gateway() const noexcept { return gateway_; }

    asio::ip::udp::endpoint gateway_endpoint() const
    {
        return asio::ip::udp::endpoint(gateway_, config_.gateway_port);
    }

    const session_config& config() const noexcept { return config_; }

    Transport& transport() noexcept { return transport_; }
    const retry_scheduler<Clock>& scheduler() const noexcept { return scheduler_; }

    bool has_pending_request() const noexcept { return scheduler_.is_pending(); }

    /**
     * @brief Requests the address of the WAN facing side of the gateway.
     *
     * Like every `send_*` function, this abandons the pending request, if
     * any. If an earlier request was sent, the transport is first reopened on
     * a new port, so that replies to earlier requests, even those still on
     * their way, are never taken for the reply to this one.
     *
     * @param error Set to indicate what error occurred, if any. If the request
     * could not be sent no request is pending afterwards.
     */
    void send_public_address_request(error_code& error);
    void send_public_address_request();

    /**
     * @brief Requests a port mapping to be made between this host and the
     * gateway.
     *
     * @param internal_port The port on which this host listens.
     *
     * @param external_port The port the gateway is asked to listen on. The
     * gateway is free to choose another one.
     *
     * @param lifetime How long the gateway should keep the mapping. Zero
     * requests the removal of the mapping.
     *
     * @param error Set to `error::client::invalid_argument` if @p lifetime
     * does not fit the wire format, otherwise to the error that prevented the
     * request from being sent, if any.
     */
    void send_port_mapping_request(protocol type, uint16_t internal_port,
            uint16_t external_port, std::chrono::seconds lifetime,
            error_code& error);
    void send_port_mapping_request(protocol type, uint16_t internal_port,
            uint16_t external_port, std::chrono::seconds lifetime);

    /**
     * @brief Requests the mapping of @p internal_port to be removed, or all
     * mappings of @p type if @p internal_port is 0.
     */
    void send_remove_mapping_request(protocol type, uint16_t internal_port,
            error_code& error);
    void send_remove_mapping_request(protocol type, uint16_t internal_port);

    /**
     * @brief Returns the time left until the pending request is to be
     * retransmitted, or zero if that time has already come.
     *
     * @param error Set to `error::client::no_pending_request` if there is no
     * pending request.
     */
    duration request_timeout(error_code& error) const;

    /**
     * @brief Waits for the response to the pending request until its
     * retransmission deadline, and retransmits it if none arrived.
     *
     * Datagrams that don't answer the pending request are dropped without
     * affecting the retransmission schedule.
     *
     * @param error Set to:
     * - `asio::error::try_again` if the request was retransmitted and this
     *   function should be called again;
     * - `error::client::timeout_exhausted` if the gateway didn't answer any
     *   of the retransmissions, in which case no request is pending anymore;
     * - the response's `result_code` if the gateway refused the request;
     * - `error::client::no_pending_request` if no request was sent;
     * - an IO error otherwise, in which case the request remains pending.
     *
     * @return The response if one was received, even if the gateway refused
     * the request. Otherwise a default constructed `response`.
     */
    response read_response_or_retry(error_code& error);

    /**
     * @brief The asynchronous counterpart of @ref read_response_or_retry.
     *
     * @param token The completion token, e.g. a handler whose signature must
     * be:
     * @code void handler(pmp::error_code, pmp::response); @endcode
     * The same outcomes as those of @ref read_response_or_retry are reported
     * through the handler's arguments. The handler is not invoked from within
     * this function.
     *
     * @note The session must not be moved or destroyed while the operation
     * is outstanding.
     */
    template<typename CompletionToken>
    auto async_read_response_or_retry(CompletionToken&& token)
    {
        return asio::async_initiate<CompletionToken, void(error_code, response)>(
                [this](auto handler) { async_poll(std::move(handler)); },
                token);
    }

private:
    void send_request(const request& req, error_code& error);
    void send_pending_request(error_code& error);

    /**
     * Acts on the outcome of a single receive. Returns false if the datagram
     * was dropped and the caller should receive again against the same
     * deadline, true if the poll is over and @p error and @p r hold its
     * outcome.
     */
    bool complete_poll(error_code& error, std::size_t num_received, response& r);

    template<typename Handler>
    void async_poll(Handler handler);

    void note_epoch(uint32_t epoch);
};

/** A session whose reads block the calling thread. */
using session = basic_session<blocking_udp_transport>;

/** A session driven by the caller's `asio::io_context`. */
using async_session = basic_session<async_udp_transport>;

/**
 * @brief Opens @p natpmp with the gateway that @p resolver supplies.
 *
 * @param error Set to the resolver's error if no gateway could be resolved,
 * in which case @p natpmp is left untouched.
 */
template<typename Transport, typename Clock>
void open_with_resolver(basic_session<Transport, Clock>& natpmp,
        gateway_resolver& resolver, error_code& error);

/** Opens @p natpmp with the host's default gateway. */
template<typename Transport, typename Clock>
void open_default(basic_session<Transport, Clock>& natpmp, error_code& error);

} // pmp

#include "impl/session.ipp"

#endif // PMPP_SESSION_HEADER
