#include <catch2/catch_test_macros.hpp>

#include "core/classification/ManufacturerClassifier.hpp"

using namespace vidscan::core;

namespace {

HttpResponse page(const std::string& body, std::map<std::string, std::string> headers = {}) {
    HttpResponse response;
    response.statusCode = 200;
    response.success = true;
    response.body = body;
    response.headers = std::move(headers);
    return response;
}

} // namespace

TEST_CASE("ManufacturerClassifier recognises vendors", "[ManufacturerClassifier]") {
    SECTION("Cisco by title") {
        auto result = ManufacturerClassifier::classify(
            page("<html><head><title>Cisco Webex Room Kit</title></head></html>"));
        REQUIRE(result.manufacturer == Manufacturer::Cisco);
        REQUIRE(result.evidence == "title contains 'cisco'");
    }

    SECTION("Cisco by status.xml product id") {
        auto result = ManufacturerClassifier::classify(
            page("<Status><SystemUnit><ProductId>Cisco Codec Pro</ProductId></SystemUnit></Status>"));
        REQUIRE(result.manufacturer == Manufacturer::Cisco);
    }

    SECTION("Cisco by RoomOS body marker") {
        REQUIRE(ManufacturerClassifier::classify(page("<p>RoomOS 11.5</p>")).manufacturer ==
                Manufacturer::Cisco);
    }

    SECTION("Polycom by title") {
        auto result = ManufacturerClassifier::classify(
            page("<title>Polycom RealPresence Group 500</title>"));
        REQUIRE(result.manufacturer == Manufacturer::Polycom);
    }

    SECTION("Poly Studio body marker") {
        REQUIRE(ManufacturerClassifier::classify(page("<h1>Poly Studio X50</h1>")).manufacturer ==
                Manufacturer::Polycom);
    }

    SECTION("TANDBERG by title") {
        REQUIRE(ManufacturerClassifier::classify(page("<title>TANDBERG 990 MXP</title>"))
                    .manufacturer == Manufacturer::Tandberg);
    }

    SECTION("Header markers count") {
        auto result = ManufacturerClassifier::classify(
            page("", {{"www-authenticate", "Basic realm=\"TANDBERG\""}}));
        REQUIRE(result.manufacturer == Manufacturer::Tandberg);
        REQUIRE(result.evidence == "header contains 'tandberg'");
    }

    SECTION("Matching is case-insensitive") {
        REQUIRE(ManufacturerClassifier::classify(page("<TITLE>CISCO TELEPRESENCE</TITLE>"))
                    .manufacturer == Manufacturer::Cisco);
    }

    SECTION("No marker yields Generic") {
        auto result = ManufacturerClassifier::classify(
            page("<title>Printer Status</title>", {{"server", "lighttpd"}}));
        REQUIRE(result.manufacturer == Manufacturer::Generic);
        REQUIRE(result.evidence.empty());
        REQUIRE_FALSE(ManufacturerClassifier::hasDeviceMarkers(page("<title>Printer</title>")));
    }

    SECTION("Empty response yields Generic") {
        REQUIRE(ManufacturerClassifier::classify(HttpResponse{}).manufacturer ==
                Manufacturer::Generic);
    }
}

TEST_CASE("ManufacturerClassifier priority", "[ManufacturerClassifier]") {
    SECTION("Cisco wins over TANDBERG") {
        auto response = page("<title>TANDBERG Codec C90</title><p>Cisco TC7.3.6</p>");
        REQUIRE(ManufacturerClassifier::classify(response).manufacturer == Manufacturer::Cisco);
    }

    SECTION("Cisco wins over Polycom") {
        auto response = page("<p>Polycom interop test</p><p>Webex</p>");
        REQUIRE(ManufacturerClassifier::classify(response).manufacturer == Manufacturer::Cisco);
    }

    SECTION("Polycom wins over TANDBERG") {
        auto response = page("<title>Polycom gateway</title><p>tandberg interop</p>");
        REQUIRE(ManufacturerClassifier::classify(response).manufacturer == Manufacturer::Polycom);
    }

    SECTION("Classification is deterministic") {
        auto response = page("<title>Cisco TelePresence SX20</title>");
        REQUIRE(ManufacturerClassifier::classify(response) ==
                ManufacturerClassifier::classify(response));
    }
}

TEST_CASE("ManufacturerClassifier rule table order", "[ManufacturerClassifier]") {
    const auto& rules = ManufacturerClassifier::rules();
    REQUIRE_FALSE(rules.empty());
    REQUIRE(rules.front().manufacturer == Manufacturer::Cisco);
    REQUIRE(rules.back().manufacturer == Manufacturer::Tandberg);
}
