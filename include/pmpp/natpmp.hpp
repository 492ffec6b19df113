#ifndef PMPP_NATPMP_HEADER
#define PMPP_NATPMP_HEADER

#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
#include "message.hpp"
#include "codec.hpp"
#include "gateway.hpp"
#include "retry_scheduler.hpp"
#include "udp_transport.hpp"
#include "session.hpp"

#endif // PMPP_NATPMP_HEADER
