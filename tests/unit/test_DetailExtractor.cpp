#include <catch2/catch_test_macros.hpp>

#include "core/classification/DetailExtractor.hpp"

#include <string>
#include <vector>

using namespace vidscan::core;

namespace {

HttpResponse page(const std::string& body) {
    HttpResponse response;
    response.statusCode = 200;
    response.success = true;
    response.body = body;
    return response;
}

const char* CiscoRoomKit = R"(<html><head><title>Cisco Webex Room Kit</title></head>
<body>
  <div class="sw-version">RoomOS 11.5.1.5</div>
  <div class="serial-number">FOC2233X0AB</div>
  <div class="mac-address">00:1B:D5:AA:BB:CC</div>
</body></html>)";

const char* CiscoTelePresence = R"(<html><head><title>Cisco TelePresence SX20</title></head>
<body><table>
  <tr><td>Software Version:</td><td>TC7.3.6</td></tr>
  <tr><td>Serial Number:</td><td>FTT1234ABCD</td></tr>
</table></body></html>)";

const char* PolycomGroup = R"(<html><head><title>Polycom RealPresence Group 500</title></head>
<body>
  <div class="system-name">Boardroom</div>
  <div class="software-version">6.2.2.1</div>
  <table>
    <tr><td>Serial Number</td><td>8213450AB12C</td></tr>
    <tr><td>MAC Address</td><td>00:E0:DB:12:34:56</td></tr>
  </table>
</body></html>)";

const char* TandbergMxp = R"(<html><head><title>TANDBERG 990 MXP</title></head>
<body>
  <div id="product-id">TANDBERG 990</div>
  <div id="sw-version">F9.3.1 PAL</div>
  <p>Serial Number: 12A34567</p>
  <p>MAC Address: 00:50:60:AA:BB:CC</p>
</body></html>)";

const char* GenericDevice = R"(<html><head><title>Device Status</title></head>
<body>
  <table><tr><td>Model</td><td>VC-400</td></tr></table>
  <p>Firmware Version: 2.1.7</p>
  <p>Serial No: SN-0042</p>
</body></html>)";

} // namespace

TEST_CASE("Cisco detail extraction", "[DetailExtractor]") {
    const auto& extractor = extractorFor(Manufacturer::Cisco);
    REQUIRE(extractor.manufacturer() == Manufacturer::Cisco);

    SECTION("RoomOS page") {
        auto details = extractor.extract(page(CiscoRoomKit));
        REQUIRE(details.model == "Webex Room Kit");
        REQUIRE(details.softwareVersion == "RoomOS 11.5.1.5");
        REQUIRE(details.serial == "FOC2233X0AB");
        REQUIRE(details.macAddress == "00:1B:D5:AA:BB:CC");
        REQUIRE(details.extra.at("title") == "Cisco Webex Room Kit");
    }

    SECTION("TelePresence table layout keeps the product line in the model") {
        auto details = extractor.extract(page(CiscoTelePresence));
        REQUIRE(details.model == "TelePresence SX20");
        REQUIRE(details.softwareVersion == "TC7.3.6");
        REQUIRE(details.serial == "FTT1234ABCD");
        REQUIRE_FALSE(details.macAddress.has_value());
    }
}

TEST_CASE("Polycom detail extraction", "[DetailExtractor]") {
    auto details = extractorFor(Manufacturer::Polycom).extract(page(PolycomGroup));
    REQUIRE(details.model == "RealPresence Group 500");
    REQUIRE(details.softwareVersion == "6.2.2.1");
    REQUIRE(details.serial == "8213450AB12C");
    REQUIRE(details.macAddress == "00:E0:DB:12:34:56");
    REQUIRE(details.extra.at("system_name") == "Boardroom");
}

TEST_CASE("TANDBERG detail extraction", "[DetailExtractor]") {
    auto details = extractorFor(Manufacturer::Tandberg).extract(page(TandbergMxp));
    REQUIRE(details.model == "990 MXP");
    REQUIRE(details.softwareVersion == "F9.3.1 PAL");
    REQUIRE(details.serial == "12A34567");
    REQUIRE(details.macAddress == "00:50:60:AA:BB:CC");
    REQUIRE(details.extra.at("product_id") == "TANDBERG 990");
}

TEST_CASE("Generic detail extraction", "[DetailExtractor]") {
    auto details = extractorFor(Manufacturer::Generic).extract(page(GenericDevice));
    REQUIRE(details.model == "VC-400");
    REQUIRE(details.softwareVersion == "2.1.7");
    REQUIRE(details.serial == "SN-0042");
    REQUIRE(details.extra.at("title") == "Device Status");
}

TEST_CASE("Extraction degrades on poor input", "[DetailExtractor]") {
    SECTION("Empty body yields empty details") {
        for (auto manufacturer : {Manufacturer::Cisco, Manufacturer::Polycom,
                                  Manufacturer::Tandberg, Manufacturer::Generic}) {
            REQUIRE(extractorFor(manufacturer).extract(page("")).empty());
        }
    }

    SECTION("Truncated markup does not throw") {
        auto details = extractorFor(Manufacturer::Cisco).extract(page("<html><title>Cisco We"));
        REQUIRE_FALSE(details.model.has_value());
    }

    SECTION("Entities are decoded and whitespace collapsed") {
        auto details = extractorFor(Manufacturer::Generic)
                           .extract(page("<td>Model</td><td>  Room&nbsp;&amp;  Board </td>"));
        REQUIRE(details.model == "Room & Board");
    }
}

TEST_CASE("Extraction survives single-line pages larger than the scan window",
          "[DetailExtractor]") {
    const std::string filler(70000, 'a');
    const std::vector<std::string> bodies = {
        "<p> Version: " + filler,
        "<html><script>var s = ' Version: " + filler + "';</script></html>",
        "<title>" + filler + "</title>",
        "<td>Software Version:</td><td>" + filler,
        "<td class=\"label\">Serial" + std::string(70000, ' ') + "Number</td>",
        "<span" + std::string(70000, ' ') + "class=\"info-label\">MAC Address</span>",
    };

    for (auto manufacturer : {Manufacturer::Cisco, Manufacturer::Polycom,
                              Manufacturer::Tandberg, Manufacturer::Generic}) {
        for (const auto& body : bodies) {
            auto details = extractorFor(manufacturer).extract(page(body));
            if (details.softwareVersion) {
                REQUIRE(details.softwareVersion->size() <= 256);
            }
            REQUIRE_FALSE(details.serial.has_value());
        }
    }

    SECTION("A long label value is cut rather than dropped") {
        auto details = extractorFor(Manufacturer::Generic).extract(page(bodies.front()));
        REQUIRE(details.softwareVersion == std::string(256, 'a'));
    }
}
