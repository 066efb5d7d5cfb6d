#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/PortProber.hpp"

using namespace vidscan;
using namespace vidscan::infra;

namespace {

uint16_t unusedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io,
                                     asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

} // namespace

TEST_CASE("PortProber on loopback", "[PortProber]") {
    AsioContext context(2);
    context.start();

    ProbeOptions options;
    options.connectTimeout = std::chrono::milliseconds(500);
    options.hostTimeout = std::chrono::milliseconds(2000);
    options.perHostConcurrency = 2;
    PortProber prober(context, options);

    // A listening socket completes the handshake from its backlog
    asio::io_context io;
    asio::ip::tcp::acceptor listener(io,
                                     asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    uint16_t openPort = listener.local_endpoint().port();
    uint16_t closedPort = unusedPort();

    SECTION("Open and refused ports") {
        auto results = prober.probeHost({"127.0.0.1", {openPort, closedPort}});
        REQUIRE(results.size() == 2);

        for (const auto& result : results) {
            REQUIRE(result.address == "127.0.0.1");
            if (result.port == openPort) {
                REQUIRE(result.outcome == core::ProbeOutcome::Open);
                REQUIRE_FALSE(result.tls);
            } else {
                REQUIRE(result.port == closedPort);
                REQUIRE(result.outcome == core::ProbeOutcome::Refused);
            }
        }
    }

    SECTION("Results come back sorted by port") {
        auto results = prober.probeHost({"127.0.0.1", {closedPort, openPort}});
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].port < results[1].port);
    }

    SECTION("Every port is reported beyond the per-host concurrency") {
        std::vector<uint16_t> ports = {openPort, unusedPort(), unusedPort(), unusedPort(),
                                       unusedPort()};
        auto results = prober.probeHost({"127.0.0.1", ports});
        REQUIRE(results.size() == ports.size());
    }

    SECTION("Profile built from real results") {
        auto results = prober.probeHost({"127.0.0.1", {openPort, closedPort}});
        auto profile = core::HostProfile::fromResults("127.0.0.1", results);
        REQUIRE(profile.has_value());
        REQUIRE(profile->openPorts == std::set<uint16_t>{openPort});
    }

    SECTION("Invalid address reports errors without connecting") {
        auto results = prober.probeHost({"999.1.1.1", {80, 443}});
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].outcome == core::ProbeOutcome::Error);
        REQUIRE(results[1].outcome == core::ProbeOutcome::Error);
    }

    SECTION("Empty port list completes immediately") {
        REQUIRE(prober.probeHost({"127.0.0.1", {}}).empty());
    }

    context.stop();
}

TEST_CASE("PortProber options", "[PortProber]") {
    AsioContext context(1);
    ProbeOptions options;
    options.perHostConcurrency = 0;
    PortProber prober(context, options);

    REQUIRE(prober.options().perHostConcurrency == 1);
    REQUIRE_THROWS_AS(prober.probeHost({"127.0.0.1", {80}}), std::runtime_error);
}
