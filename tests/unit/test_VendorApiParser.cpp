#include <catch2/catch_test_macros.hpp>

#include "core/classification/VendorApiParser.hpp"

using namespace vidscan::core;

namespace {

const char* StatusXml = R"(<?xml version="1.0"?>
<Status>
  <SystemUnit>
    <ProductId>Cisco Webex Room Kit</ProductId>
    <ProductType>Cisco Codec</ProductType>
    <Software>
      <DisplayName>RoomOS</DisplayName>
      <Version>ce11.5.1.5</Version>
    </Software>
    <Hardware>
      <SerialNumber>FOC2233X0AB</SerialNumber>
    </Hardware>
  </SystemUnit>
  <Network>
    <Ethernet><MacAddress>00:1B:D5:AA:BB:CC</MacAddress></Ethernet>
    <IPv4><Address>10.0.0.5</Address><Gateway>10.0.0.1</Gateway></IPv4>
  </Network>
  <SIP><Registration><Status>Registered</Status></Registration></SIP>
  <Cameras><Camera/><Camera/></Cameras>
</Status>)";

const char* ConfigXml = R"(<Configuration>
  <SystemUnit>
    <Name>Boardroom</Name>
    <ContactInfo><Name>Facilities</Name><ContactNumber>4321</ContactNumber></ContactInfo>
  </SystemUnit>
  <SIP><URI>boardroom@example.com</URI></SIP>
</Configuration>)";

} // namespace

TEST_CASE("Cisco status.xml parsing", "[VendorApiParser]") {
    SECTION("Full document") {
        auto details = CiscoXmlParser::parseStatus(StatusXml);
        REQUIRE(details.model == "Webex Room Kit");
        REQUIRE(details.softwareVersion == "RoomOS ce11.5.1.5");
        REQUIRE(details.serial == "FOC2233X0AB");
        REQUIRE(details.macAddress == "00:1B:D5:AA:BB:CC");
        REQUIRE(details.extra.at("product_type") == "Cisco Codec");
        REQUIRE(details.extra.at("ip_address") == "10.0.0.5");
        REQUIRE(details.extra.at("gateway") == "10.0.0.1");
        REQUIRE(details.extra.at("sip_status") == "Registered");
        REQUIRE(details.extra.at("cameras") == "2");
    }

    SECTION("Version without display name") {
        auto details = CiscoXmlParser::parseStatus(
            "<Status><SystemUnit><Software><Version>TC7.3.6</Version></Software>"
            "</SystemUnit></Status>");
        REQUIRE(details.softwareVersion == "TC7.3.6");
        REQUIRE_FALSE(details.model.has_value());
    }

    SECTION("Malformed or foreign documents yield nothing") {
        REQUIRE(CiscoXmlParser::parseStatus("<Status><SystemUnit>").empty());
        REQUIRE(CiscoXmlParser::parseStatus("<html><body>Login</body></html>").empty());
        REQUIRE(CiscoXmlParser::parseStatus("").empty());
    }
}

TEST_CASE("Cisco config.xml parsing", "[VendorApiParser]") {
    auto details = CiscoXmlParser::parseConfig(ConfigXml);
    REQUIRE(details.extra.at("system_name") == "Boardroom");
    REQUIRE(details.extra.at("sip_uri") == "boardroom@example.com");
    REQUIRE(details.extra.at("contact_info") == "Facilities (4321)");
    REQUIRE_FALSE(details.model.has_value());

    SECTION("Abbreviated name element") {
        auto abbreviated =
            CiscoXmlParser::parseConfig("<Configuration><SystemUnit><n>Lab</n></SystemUnit></Configuration>");
        REQUIRE(abbreviated.extra.at("system_name") == "Lab");
    }

    REQUIRE(CiscoXmlParser::paths() == std::vector<std::string>{"/status.xml", "/config.xml"});
}

TEST_CASE("Polycom REST parsing", "[VendorApiParser]") {
    SECTION("Poly Studio device document") {
        auto details = PolycomApiParser::parse(
            R"({"device":{"model":"Studio X50","version":"3.14.0","serial":"8L1234","mac":"00:E0:DB:01:02:03"}})");
        REQUIRE(details.model == "Studio X50");
        REQUIRE(details.softwareVersion == "3.14.0");
        REQUIRE(details.serial == "8L1234");
        REQUIRE(details.macAddress == "00:E0:DB:01:02:03");
    }

    SECTION("RealPresence Group status document") {
        auto details = PolycomApiParser::parse(
            R"({"Status":{"SystemInfo":{"Product":"RealPresence Group 700","Software":{"Version":"6.2.2"},"SerialNumber":"82A1","Hardware":{"MAC":"00:E0:DB:AA:00:01"}}}})");
        REQUIRE(details.model == "RealPresence Group 700");
        REQUIRE(details.softwareVersion == "6.2.2");
        REQUIRE(details.serial == "82A1");
        REQUIRE(details.macAddress == "00:E0:DB:AA:00:01");
    }

    SECTION("Flat system reply") {
        auto details = PolycomApiParser::parse(
            R"({"model":"Group 300","softwareVersion":"6.1.0","serialNumber":"X1","systemName":"Huddle"})");
        REQUIRE(details.model == "Group 300");
        REQUIRE(details.softwareVersion == "6.1.0");
        REQUIRE(details.serial == "X1");
        REQUIRE(details.extra.at("system_name") == "Huddle");
    }

    SECTION("systeminfo document falls back to name") {
        auto details = PolycomApiParser::parse(
            R"({"systeminfo":{"name":"G7500","softwareInfo":{"current":{"version":"4.0.1"}}}})");
        REQUIRE(details.model == "G7500");
        REQUIRE(details.softwareVersion == "4.0.1");
    }

    SECTION("Non-JSON and unknown shapes yield nothing") {
        REQUIRE(PolycomApiParser::parse("<html>Login</html>").empty());
        REQUIRE(PolycomApiParser::parse("[1, 2, 3]").empty());
        REQUIRE(PolycomApiParser::parse(R"({"unexpected":true})").empty());
        REQUIRE(PolycomApiParser::parse(R"({"device":{"model":42}})").empty());
    }
}
