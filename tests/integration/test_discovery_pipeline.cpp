#include <catch2/catch_test_macros.hpp>

#include "infrastructure/discovery/DiscoveryService.hpp"
#include "support/FakeServices.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>

using namespace vidscan;
using namespace vidscan::infra;
using vidscan::test::FakeHttpClient;
using vidscan::test::FakePortProber;
using vidscan::test::makeResponse;

namespace {

const char* CiscoPage = R"(<html><head><title>Cisco Webex Room Kit</title></head>
<body><div class="sw-version">RoomOS 11.4</div></body></html>)";

const char* CiscoStatus =
    "<Status><SystemUnit><ProductId>Cisco Webex Room Kit Pro</ProductId>"
    "<Software><DisplayName>RoomOS</DisplayName><Version>11.5.1.5</Version></Software>"
    "<Hardware><SerialNumber>FOC2233X0AB</SerialNumber></Hardware></SystemUnit>"
    "<Network><Ethernet><MacAddress>00:1B:D5:AA:BB:CC</MacAddress></Ethernet></Network>"
    "</Status>";

const char* PolycomPage = R"(<html><head><title>Polycom RealPresence Group 500</title></head>
<body><div class="software-version">6.2.2.1</div></body></html>)";

class DiscoveryFixture {
public:
    DiscoveryFixture()
        : service_(prober_, http_, [](const std::string& address) {
              return address == "172.17.20.72" ? std::string("boardroom.example.com") : address;
          }) {
        config_.maxConcurrency = 4;
    }

    FakePortProber& prober() { return prober_; }
    FakeHttpClient& http() { return http_; }
    core::DiscoveryConfig& config() { return config_; }
    DiscoveryService& service() { return service_; }

    core::DiscoveryReport run() {
        return service_.discover(config_, [this](const core::DiscoveryProgress& progress) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (progress.scannedHosts >= last_.scannedHosts) {
                last_ = progress;
            }
            ++progressEvents_;
        });
    }

    core::DiscoveryProgress lastProgress() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    int progressEvents() {
        std::lock_guard<std::mutex> lock(mutex_);
        return progressEvents_;
    }

private:
    FakePortProber prober_;
    FakeHttpClient http_;
    DiscoveryService service_;
    core::DiscoveryConfig config_;
    std::mutex mutex_;
    core::DiscoveryProgress last_;
    int progressEvents_{0};
};

const core::EndpointRecord* findRecord(const core::DiscoveryReport& report,
                                       const std::string& ip) {
    for (const auto& record : report.endpoints) {
        if (record.ip == ip) {
            return &record;
        }
    }
    return nullptr;
}

} // namespace

TEST_CASE("Discovery over an empty network", "[Discovery][Integration]") {
    DiscoveryFixture fixture;
    fixture.config().targetRange = "192.168.100.0/30";

    auto report = fixture.run();

    REQUIRE(report.endpoints.empty());
    REQUIRE(report.scannedHosts == 2);
    REQUIRE_FALSE(report.cancelled);
    REQUIRE(fixture.prober().probedHosts() == 2);
    REQUIRE(fixture.http().requests().empty());
    REQUIRE(fixture.progressEvents() == 2);
    REQUIRE(fixture.lastProgress().percentComplete() == 100.0);
}

TEST_CASE("Discovery of a single Cisco codec", "[Discovery][Integration]") {
    DiscoveryFixture fixture;
    fixture.config().targetRange = "172.17.20.72/32";
    fixture.prober().open("172.17.20.72", {80, 443, 5060}, {443});
    fixture.http().route("https://172.17.20.72/", makeResponse(401, "Unauthorized"), "ops");
    fixture.http().route("https://172.17.20.72/", makeResponse(200, CiscoPage), "admin");
    fixture.http().route("https://172.17.20.72/status.xml", makeResponse(200, CiscoStatus));

    SECTION("Default credentials and status.xml enrichment") {
        auto report = fixture.run();

        REQUIRE(report.endpoints.size() == 1);
        const auto& record = report.endpoints[0];
        REQUIRE(record.ip == "172.17.20.72");
        REQUIRE(record.hostname == "boardroom.example.com");
        REQUIRE(record.manufacturer == core::Manufacturer::Cisco);
        REQUIRE_FALSE(record.model.empty());
        REQUIRE(record.model == "Webex Room Kit Pro");
        REQUIRE(record.softwareVersion == "RoomOS 11.5.1.5");
        REQUIRE(record.serial == "FOC2233X0AB");
        REQUIRE(record.macAddress == "00:1B:D5:AA:BB:CC");
        REQUIRE(record.accessUri == "https://172.17.20.72");
        REQUIRE(record.openPorts == std::vector<uint16_t>{80, 443, 5060});
        REQUIRE(record.authenticatedAs == "admin");
        REQUIRE(record.source == core::EndpointSource::Probed);
    }

    SECTION("Operator credentials are tried first") {
        fixture.config().operatorCredentials = core::Credentials{"ops", "wrong"};
        auto report = fixture.run();

        auto requests = fixture.http().requests();
        REQUIRE(requests.size() >= 2);
        REQUIRE(requests[0].credentials->username == "ops");
        REQUIRE(requests[1].credentials->username == "admin");
        REQUIRE(report.endpoints[0].authenticatedAs == "admin");
    }

    SECTION("Codec realm on the operator challenge still lets the default pair in") {
        fixture.config().operatorCredentials = core::Credentials{"ops", "typo"};
        fixture.http().route(
            "https://172.17.20.72/",
            makeResponse(401, "", {{"www-authenticate", "Basic realm=\"Cisco Codec\""}}), "ops");
        auto report = fixture.run();

        REQUIRE(report.endpoints[0].authenticatedAs == "admin");
        REQUIRE(report.endpoints[0].manufacturer == core::Manufacturer::Cisco);
        REQUIRE(report.endpoints[0].model == "Webex Room Kit Pro");
    }

    SECTION("Enrichment disabled keeps the page details") {
        fixture.config().vendorApiEnrichment = false;
        auto report = fixture.run();

        REQUIRE(report.endpoints[0].model == "Webex Room Kit");
        REQUIRE(report.endpoints[0].softwareVersion == "RoomOS 11.4");
        REQUIRE(fixture.http().requestCount("https://172.17.20.72/status.xml") == 0);
    }

    SECTION("Hostname resolution disabled") {
        fixture.config().resolveHostnames = false;
        auto report = fixture.run();
        REQUIRE(report.endpoints[0].hostname == "172.17.20.72");
    }
}

TEST_CASE("Discovery of a mixed network", "[Discovery][Integration]") {
    DiscoveryFixture fixture;
    fixture.config().targetRange = "10.0.0.0/28";

    fixture.prober().open("10.0.0.2", {80, 1720});
    fixture.http().route("http://10.0.0.2/", makeResponse(200, PolycomPage));

    fixture.prober().open("10.0.0.3", {80});
    fixture.http().route("http://10.0.0.3/",
                         makeResponse(401, "", {{"www-authenticate", "Basic realm=\"TANDBERG\""}}));

    fixture.prober().open("10.0.0.11", {80});
    fixture.http().route("http://10.0.0.11/", makeResponse(200, "<title>Print Server</title>"));

    fixture.prober().open("10.0.0.12", {5060, 5061});

    auto report = fixture.run();

    REQUIRE(report.scannedHosts == 14);
    REQUIRE(report.endpoints.size() == 4);

    SECTION("Records are ordered by address") {
        REQUIRE(report.endpoints[0].ip == "10.0.0.2");
        REQUIRE(report.endpoints[1].ip == "10.0.0.3");
        REQUIRE(report.endpoints[2].ip == "10.0.0.11");
        REQUIRE(report.endpoints[3].ip == "10.0.0.12");
    }

    SECTION("Polycom identified from its page") {
        const auto* polycom = findRecord(report, "10.0.0.2");
        REQUIRE(polycom->manufacturer == core::Manufacturer::Polycom);
        REQUIRE(polycom->model == "RealPresence Group 500");
        REQUIRE(polycom->softwareVersion == "6.2.2.1");
    }

    SECTION("TANDBERG identified from its challenge") {
        const auto* tandberg = findRecord(report, "10.0.0.3");
        REQUIRE(tandberg->manufacturer == core::Manufacturer::Tandberg);
        REQUIRE(tandberg->authenticatedAs.empty());
    }

    SECTION("Unknown web device is Generic") {
        const auto* generic = findRecord(report, "10.0.0.11");
        REQUIRE(generic->manufacturer == core::Manufacturer::Generic);
        REQUIRE(generic->rawDetails.at("title") == "Print Server");
    }

    SECTION("Signalling-only host is reported without web details") {
        const auto* sip = findRecord(report, "10.0.0.12");
        REQUIRE(sip->manufacturer == core::Manufacturer::Generic);
        REQUIRE(sip->openPorts == std::vector<uint16_t>{5060, 5061});
        REQUIRE(sip->accessUri == "http://10.0.0.12");
        REQUIRE_FALSE(sip->complete());
    }
}

TEST_CASE("Forced endpoints", "[Discovery][Integration]") {
    DiscoveryFixture fixture;

    SECTION("Force without a range skips probing") {
        fixture.config().forceEndpoints = {"10.0.0.5"};
        auto report = fixture.run();

        REQUIRE(report.endpoints.size() == 1);
        REQUIRE(report.endpoints[0].ip == "10.0.0.5");
        REQUIRE(report.endpoints[0].source == core::EndpointSource::Forced);
        REQUIRE(report.endpoints[0].manufacturer == core::Manufacturer::Generic);
        REQUIRE(report.scannedHosts == 0);
        REQUIRE(fixture.prober().probedHosts() == 0);
    }

    SECTION("Forced record supersedes the probed one") {
        fixture.config().targetRange = "10.0.0.0/29";
        fixture.config().forceEndpoints = {"10.0.0.5", "10.0.0.200"};
        fixture.prober().open("10.0.0.5", {80});
        fixture.http().route("http://10.0.0.5/", makeResponse(200, CiscoPage));

        auto report = fixture.run();

        REQUIRE(report.endpoints.size() == 2);
        REQUIRE(report.endpoints[0].ip == "10.0.0.5");
        REQUIRE(report.endpoints[0].source == core::EndpointSource::Forced);
        REQUIRE(report.endpoints[0].model.empty());
        REQUIRE(report.endpoints[1].ip == "10.0.0.200");
    }

    SECTION("Malformed forced address is rejected") {
        fixture.config().forceEndpoints = {"10.0.0"};
        REQUIRE_THROWS_AS(fixture.run(), core::InvalidRangeError);
        REQUIRE_FALSE(fixture.service().isRunning());
    }
}

TEST_CASE("Discovery rejects a malformed range", "[Discovery][Integration]") {
    DiscoveryFixture fixture;
    fixture.config().targetRange = "10.0.0.0/33";

    REQUIRE_THROWS_AS(fixture.run(), core::InvalidRangeError);
    REQUIRE(fixture.prober().probedHosts() == 0);
}

TEST_CASE("Progress callbacks do not serialise the workers", "[Discovery][Integration]") {
    DiscoveryFixture fixture;
    fixture.config().targetRange = "10.0.0.0/28";

    std::mutex mutex;
    std::condition_variable cv;
    int inside = 0;
    bool overlapped = false;

    auto report = fixture.service().discover(fixture.config(),
                                             [&](const core::DiscoveryProgress&) {
        std::unique_lock<std::mutex> lock(mutex);
        ++inside;
        if (inside >= 2) {
            overlapped = true;
            cv.notify_all();
        }
        cv.wait_for(lock, std::chrono::seconds(2), [&] { return overlapped; });
        --inside;
    });

    REQUIRE(report.scannedHosts == 14);
    REQUIRE(overlapped);
}
