#ifndef PMPP_RETRY_SCHEDULER_HEADER
#define PMPP_RETRY_SCHEDULER_HEADER

#include "message.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"

#include <array>
#include <chrono>
#include <cstdint>

#include <asio/buffer.hpp>

namespace pmp {

/**
 * @brief Drives a single request through RFC 6886's retransmission schedule and
 * matches incoming datagrams against it.
 *
 * The scheduler performs no IO itself: it holds the encoded request and the
 * retransmission deadline and tells its owner what to do when a datagram
 * arrives or the deadline passes. This lets the blocking and the asynchronous
 * session share one implementation of the protocol's timing rules.
 *
 * The timeout of attempt `k` (0-based) is `initial_timeout * 2^k`, and the
 * request is given up on once `max_attempts` sends went unanswered.
 */
template<typename Clock = std::chrono::steady_clock>
class retry_scheduler
{
public:
    using clock_type = Clock;
    using duration = typename Clock::duration;
    using time_point = typename Clock::time_point;

private:
    retry_policy policy_;

    std::array<uint8_t, max_request_size> request_buffer_;
    std::size_t request_size_ = 0;
    opcode opcode_ = opcode::public_address;
    // Only meaningful for mapping requests, used to reject stale responses.
    uint16_t internal_port_ = 0;

    bool pending_ = false;
    int attempt_ = 0;
    duration timeout_{0};
    time_point deadline_;

public:
    explicit retry_scheduler(const retry_policy& policy = retry_policy())
        : policy_(policy)
    {}

    /**
     * @brief Encodes @p req and arms the schedule for its first send, which
     * the caller is expected to perform right away.
     *
     * Any previously pending request is forgotten, even if @p error is set.
     */
    void start(const request& req, time_point now, error_code& error);

    /** Forgets the pending request, if any. */
    void clear() noexcept;

    bool is_pending() const noexcept { return pending_; }

    /** The encoded request to (re)send. Only valid while pending. */
    asio::const_buffer pending_request() const noexcept
    {
        return asio::buffer(request_buffer_.data(), request_size_);
    }

    opcode pending_opcode() const noexcept { return opcode_; }

    /** The 0-based index of the most recent send. */
    int attempt() const noexcept { return attempt_; }

    duration current_timeout() const noexcept { return timeout_; }

    time_point deadline() const noexcept { return deadline_; }

    const retry_policy& policy() const noexcept { return policy_; }

    /**
     * @brief Determines whether @p datagram answers the pending request.
     *
     * Datagrams that aren't NAT-PMP responses, or that answer a different
     * request, are rejected and leave the schedule untouched.
     *
     * @param out Set to the decoded response if the datagram matched.
     */
    bool match(asio::const_buffer datagram, response& out) const;

    /**
     * Whether the deadline passing should lead to another send, as opposed to
     * the request being given up on.
     */
    bool can_retransmit() const noexcept
    {
        return pending_ && attempt_ + 1 < policy_.max_attempts;
    }

    /**
     * @brief Advances the schedule to the next attempt once it was sent at
     * @p now, doubling the timeout.
     *
     * Must only be called after the send succeeded, so that a failed send
     * can be retried without skipping an attempt.
     */
    void on_retransmitted(time_point now);
};

} // pmp

#include "impl/retry_scheduler.ipp"

#endif // PMPP_RETRY_SCHEDULER_HEADER
