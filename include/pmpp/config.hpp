#ifndef PMPP_CONFIG_HEADER
#define PMPP_CONFIG_HEADER

#include "message.hpp"

#include <chrono>

namespace pmp {

/**
 * The retransmission schedule of a request.
 *
 * The defaults are those mandated by RFC 6886 §3.1: the first retransmission
 * timeout is 250ms and it is doubled after every unanswered attempt.
 */
struct retry_policy
{
    std::chrono::milliseconds initial_timeout{250};
    // Total number of times a request is sent, the first send included.
    int max_attempts = 9;
};

struct session_config
{
    unsigned short gateway_port = natpmp_port;
    retry_policy retry;
};

} // pmp

#endif // PMPP_CONFIG_HEADER
