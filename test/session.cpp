#include "../include/pmpp/session.hpp"
#include "fake_transport.hpp"

#include <stdexcept>

#include <catch2/catch.hpp>

using namespace pmp;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

using test_session = basic_session<fake_transport, manual_clock>;

const auto gateway_address = asio::ip::make_address_v4("192.168.1.1");
const asio::ip::udp::endpoint gateway_ep(gateway_address, natpmp_port);

struct session_fixture
{
    fake_transport transport;
    test_session natpmp;

    session_fixture() : natpmp(transport, gateway_address) {}

    fake_transport::state& io() { return *transport.s; }

    void reply(bytes b) { io().inbound.push_back({std::move(b), gateway_ep}); }
};

} // namespace

TEST_CASE_METHOD(session_fixture, "opening directs requests to the gateway", "[session]")
{
    CHECK(natpmp.is_open());
    CHECK(natpmp.gateway() == gateway_address);
    CHECK(natpmp.gateway_endpoint() == gateway_ep);
    CHECK_FALSE(natpmp.has_pending_request());

    natpmp.close();
    CHECK_FALSE(natpmp.is_open());
}

TEST_CASE_METHOD(session_fixture, "public address is read from the gateway's response", "[session]")
{
    error_code error;
    natpmp.send_public_address_request(error);
    REQUIRE(!error);
    REQUIRE(io().sent.size() == 1);
    CHECK(io().sent[0].data == bytes{0, 0});
    CHECK(io().sent[0].endpoint == gateway_ep);
    CHECK(natpmp.has_pending_request());

    reply(make_address_response(0, 100, 0xcb007105));
    const auto r = natpmp.read_response_or_retry(error);
    REQUIRE(!error);
    REQUIRE(std::holds_alternative<gateway_response>(r));
    CHECK(std::get<gateway_response>(r).external_address
            == asio::ip::make_address_v4("203.0.113.5"));
    CHECK(std::get<gateway_response>(r).epoch == 100);
    CHECK_FALSE(natpmp.has_pending_request());

    // Nothing left to read.
    natpmp.read_response_or_retry(error);
    CHECK(error == error::client::no_pending_request);
}

TEST_CASE_METHOD(session_fixture, "unanswered requests are retransmitted with doubling timeouts", "[session]")
{
    error_code error;
    const auto start = manual_clock::now();
    natpmp.send_port_mapping_request(protocol::udp, 4020, 4020, seconds(30), error);
    REQUIRE(!error);

    for(int poll = 1; poll <= 8; ++poll) {
        natpmp.read_response_or_retry(error);
        CHECK(error == asio::error::try_again);
        CHECK(io().sent.size() == std::size_t(poll + 1));
    }

    natpmp.read_response_or_retry(error);
    CHECK(error == error::client::timeout_exhausted);
    CHECK(io().sent.size() == 9);
    CHECK(manual_clock::now() - start == milliseconds(127750));
    CHECK_FALSE(natpmp.has_pending_request());

    // Each retransmission is sent when the previous timeout expires.
    for(std::size_t k = 1; k < io().send_times.size(); ++k) {
        CHECK(io().send_times[k] - io().send_times[k - 1] == milliseconds(250 << (k - 1)));
    }

    // All of them the same request.
    for(const auto& d : io().sent) {
        CHECK(d.data == bytes{0, 1, 0, 0, 0x0f, 0xb4, 0x0f, 0xb4, 0, 0, 0, 30});
    }

    natpmp.read_response_or_retry(error);
    CHECK(error == error::client::no_pending_request);
    CHECK(io().sent.size() == 9);
}

TEST_CASE_METHOD(session_fixture, "a failed retransmission is retried without skipping an attempt", "[session]")
{
    error_code error;
    const auto start = manual_clock::now();
    natpmp.send_public_address_request(error);
    REQUIRE(!error);

    io().send_error = asio::error::network_unreachable;
    natpmp.read_response_or_retry(error);
    CHECK(error == asio::error::network_unreachable);
    CHECK(natpmp.has_pending_request());
    CHECK(natpmp.scheduler().attempt() == 0);
    CHECK(natpmp.scheduler().deadline() == start + milliseconds(250));
    CHECK(io().sent.size() == 1);

    // The deadline has passed, so the next poll resends without waiting.
    io().send_error = error_code();
    natpmp.read_response_or_retry(error);
    CHECK(error == asio::error::try_again);
    CHECK(manual_clock::now() - start == milliseconds(250));
    REQUIRE(io().sent.size() == 2);
    CHECK(io().send_times[1] - start == milliseconds(250));
    CHECK(natpmp.scheduler().attempt() == 1);
    CHECK(natpmp.scheduler().current_timeout() == milliseconds(500));
    CHECK(natpmp.scheduler().deadline() == start + milliseconds(750));
}

TEST_CASE_METHOD(session_fixture, "a new request replaces the pending one", "[session]")
{
    error_code error;
    natpmp.send_public_address_request(error);
    REQUIRE(!error);
    natpmp.read_response_or_retry(error);
    REQUIRE(error == asio::error::try_again);
    REQUIRE(natpmp.scheduler().attempt() == 1);

    SECTION("replies already received are dropped")
    {
        reply(make_address_response(0, 10, 0x01010101));
        natpmp.send_public_address_request(error);
        REQUIRE(!error);
        CHECK(io().inbound.empty());
    }

    SECTION("replies still on their way are never received")
    {
        natpmp.send_public_address_request(error);
        REQUIRE(!error);
        // Answers to the first request, addressed to the port it was sent from.
        io().inbound.push_back({make_address_response(0, 10, 0x01010101), gateway_ep, 0});
        io().inbound.push_back({make_address_response(0, 10, 0x01010101), gateway_ep, 0});
    }

    CHECK(natpmp.scheduler().attempt() == 0);
    CHECK(natpmp.scheduler().current_timeout() == milliseconds(250));
    CHECK(io().sent.size() == 3);
    CHECK(io().sent.back().data == bytes{0, 0});
    CHECK(io().port == 1);

    reply(make_address_response(0, 11, 0x0a000001));
    const auto r = natpmp.read_response_or_retry(error);
    REQUIRE(!error);
    CHECK(std::get<gateway_response>(r).epoch == 11);
    CHECK(std::get<gateway_response>(r).external_address
            == asio::ip::make_address_v4("10.0.0.1"));
}

TEST_CASE_METHOD(session_fixture, "a removal is not answered by the grant it replaces", "[session]")
{
    error_code error;
    natpmp.send_port_mapping_request(protocol::udp, 4020, 4020, seconds(7200), error);
    REQUIRE(!error);
    natpmp.send_remove_mapping_request(protocol::udp, 4020, error);
    REQUIRE(!error);

    io().inbound.push_back({make_mapping_response(1, 0, 10, 4020, 4020, 7200), gateway_ep, 0});
    reply(make_mapping_response(1, 0, 10, 4020, 0, 0));
    const auto r = natpmp.read_response_or_retry(error);
    REQUIRE(!error);
    CHECK(std::get<udp_mapping_response>(r).lifetime == seconds(0));
}

TEST_CASE_METHOD(session_fixture, "the first request keeps the port", "[session]")
{
    natpmp.send_public_address_request();
    CHECK(io().port == 0);

    // Closing releases the port, so the next socket is a fresh one anyway.
    natpmp.close();
    natpmp.open(gateway_address);
    natpmp.send_public_address_request();
    CHECK(io().port == 0);
}

TEST_CASE_METHOD(session_fixture, "mapping request and response", "[session]")
{
    error_code error;
    natpmp.send_port_mapping_request(protocol::tcp, 22, 2222, seconds(3600), error);
    REQUIRE(!error);
    CHECK(io().sent.back().data
            == bytes{0, 2, 0, 0, 0, 22, 0x08, 0xae, 0, 0, 0x0e, 0x10});

    reply(make_mapping_response(2, 0, 50, 22, 2223, 1800));
    const auto r = natpmp.read_response_or_retry(error);
    REQUIRE(!error);
    REQUIRE(std::holds_alternative<tcp_mapping_response>(r));
    const auto& m = std::get<tcp_mapping_response>(r);
    CHECK(m.internal_port == 22);
    CHECK(m.external_port == 2223);
    CHECK(m.lifetime == seconds(1800));
}

TEST_CASE_METHOD(session_fixture, "refused requests report the result code", "[session]")
{
    error_code error;
    natpmp.send_port_mapping_request(protocol::udp, 4020, 4020, seconds(60), error);
    REQUIRE(!error);

    reply(make_mapping_response(1, 3, 999, 4020, 0, 0));
    const auto r = natpmp.read_response_or_retry(error);
    CHECK(error == result_code::network_failure);
    CHECK(response_epoch(r) == 999);
    CHECK(response_result(r) == result_code::network_failure);
    CHECK_FALSE(natpmp.has_pending_request());
}

TEST_CASE_METHOD(session_fixture, "stray datagrams don't consume retransmissions", "[session]")
{
    error_code error;
    natpmp.send_port_mapping_request(protocol::udp, 4020, 4020, seconds(60), error);
    REQUIRE(!error);

    reply(bytes{0xde, 0xad});
    reply(make_address_response(0, 1, 1));
    reply(make_address_response(0, 1, 1, 1));
    reply(make_mapping_response(2, 0, 1, 4020, 4020, 60));
    reply(make_mapping_response(1, 0, 1, 9999, 9999, 60));
    io().inbound.push_back({make_mapping_response(1, 0, 1, 4020, 4020, 60),
            asio::ip::udp::endpoint(asio::ip::make_address_v4("10.0.0.66"), natpmp_port)});
    reply(make_mapping_response(1, 0, 7, 4020, 4021, 60));

    const auto r = natpmp.read_response_or_retry(error);
    REQUIRE(!error);
    CHECK(std::get<udp_mapping_response>(r).external_port == 4021);
    CHECK(io().sent.size() == 1);
    CHECK(io().inbound.empty());
}

TEST_CASE_METHOD(session_fixture, "strays followed by silence still time out on schedule", "[session]")
{
    error_code error;
    const auto start = manual_clock::now();
    natpmp.send_public_address_request(error);
    reply(bytes{0, 0x81});
    natpmp.read_response_or_retry(error);
    CHECK(error == asio::error::try_again);
    CHECK(manual_clock::now() - start == milliseconds(250));
    CHECK(natpmp.scheduler().attempt() == 1);
    // Every receive of the same poll waits for the same deadline.
    REQUIRE(io().deadlines.size() == 2);
    CHECK(io().deadlines[0] == io().deadlines[1]);
}

TEST_CASE_METHOD(session_fixture, "send failures leave nothing pending", "[session]")
{
    io().send_error = asio::error::network_unreachable;
    error_code error;
    natpmp.send_public_address_request(error);
    CHECK(error == asio::error::network_unreachable);
    CHECK_FALSE(natpmp.has_pending_request());

    CHECK_THROWS_AS(natpmp.send_public_address_request(), asio::system_error);
}

TEST_CASE_METHOD(session_fixture, "receive errors keep the request pending", "[session]")
{
    error_code error;
    natpmp.send_public_address_request(error);
    REQUIRE(!error);

    io().receive_error = asio::error::connection_refused;
    natpmp.read_response_or_retry(error);
    CHECK(error == asio::error::connection_refused);
    CHECK(natpmp.has_pending_request());
    CHECK(natpmp.scheduler().attempt() == 0);

    io().receive_error = error_code();
    reply(make_address_response(0, 1, 1));
    natpmp.read_response_or_retry(error);
    CHECK(!error);
}

TEST_CASE_METHOD(session_fixture, "removing a mapping", "[session]")
{
    natpmp.send_remove_mapping_request(protocol::udp, 4020);
    CHECK(io().sent.back().data == bytes{0, 1, 0, 0, 0x0f, 0xb4, 0, 0, 0, 0, 0, 0});

    // Port 0 removes all mappings of the protocol.
    natpmp.send_remove_mapping_request(protocol::tcp, 0);
    CHECK(io().sent.back().data == bytes{0, 2, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0});

    error_code error;
    reply(make_mapping_response(2, 0, 3, 0, 0, 0));
    const auto r = natpmp.read_response_or_retry(error);
    REQUIRE(!error);
    CHECK(std::get<tcp_mapping_response>(r).lifetime == seconds(0));
}

TEST_CASE_METHOD(session_fixture, "time left until retransmission", "[session]")
{
    error_code error;
    natpmp.request_timeout(error);
    CHECK(error == error::client::no_pending_request);

    natpmp.send_public_address_request(error);
    CHECK(natpmp.request_timeout(error) == milliseconds(250));
    CHECK(!error);

    manual_clock::advance(milliseconds(100));
    CHECK(natpmp.request_timeout(error) == milliseconds(150));

    manual_clock::advance(milliseconds(500));
    CHECK(natpmp.request_timeout(error) == milliseconds(0));
    CHECK(!error);
}

TEST_CASE_METHOD(session_fixture, "invalid mapping requests are not sent", "[session]")
{
    error_code error;
    natpmp.send_port_mapping_request(protocol::udp, 1, 1, seconds(-1), error);
    CHECK(error == error::client::invalid_argument);
    CHECK(io().sent.empty());
    CHECK_FALSE(natpmp.has_pending_request());
}

TEST_CASE("gateway port is configurable", "[session]")
{
    fake_transport transport;
    session_config config;
    config.gateway_port = 15351;
    config.retry.max_attempts = 1;
    test_session natpmp(transport, gateway_address, config);

    natpmp.send_public_address_request();
    CHECK(transport.s->sent.back().endpoint.port() == 15351);

    error_code error;
    natpmp.read_response_or_retry(error);
    CHECK(error == error::client::timeout_exhausted);
    CHECK(transport.s->sent.size() == 1);
}

TEST_CASE("opening through a resolver", "[session]")
{
    fake_transport transport;
    test_session natpmp(transport);
    CHECK_FALSE(natpmp.is_open());

    error_code error;
    static_gateway_resolver resolver(asio::ip::make_address_v4("10.1.1.1"));
    open_with_resolver(natpmp, resolver, error);
    REQUIRE(!error);
    CHECK(natpmp.is_open());
    CHECK(natpmp.gateway() == asio::ip::make_address_v4("10.1.1.1"));

    SECTION("resolver failure leaves the session alone")
    {
        system_gateway_resolver missing("/nonexistent/route");
        open_with_resolver(natpmp, missing, error);
        CHECK(error);
        CHECK(natpmp.gateway() == asio::ip::make_address_v4("10.1.1.1"));
    }
}
