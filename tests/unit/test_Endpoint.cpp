#include <catch2/catch_test_macros.hpp>

#include "core/types/Endpoint.hpp"

using namespace vidscan::core;

TEST_CASE("PartialDetails merge", "[Endpoint]") {
    PartialDetails base;
    base.model = "Room Kit";
    base.serial = "FOC123";
    base.extra["title"] = "Cisco Room Kit";

    SECTION("Present fields override, absent fields are kept") {
        PartialDetails api;
        api.model = "Room Kit Pro";
        api.softwareVersion = "RoomOS 11.5";
        api.extra["sip_uri"] = "room@example.com";

        base.merge(api);
        REQUIRE(base.model == "Room Kit Pro");
        REQUIRE(base.softwareVersion == "RoomOS 11.5");
        REQUIRE(base.serial == "FOC123");
        REQUIRE(base.extra.at("title") == "Cisco Room Kit");
        REQUIRE(base.extra.at("sip_uri") == "room@example.com");
    }

    SECTION("Empty strings do not erase values") {
        PartialDetails blank;
        blank.model = "";
        base.merge(blank);
        REQUIRE(base.model == "Room Kit");
    }

    SECTION("Emptiness") {
        REQUIRE(PartialDetails{}.empty());
        REQUIRE_FALSE(base.empty());
    }
}

TEST_CASE("EndpointRecord behavior", "[Endpoint]") {
    SECTION("Forced record is a bare Generic entry") {
        auto record = EndpointRecord::forced("10.0.0.5");
        REQUIRE(record.ip == "10.0.0.5");
        REQUIRE(record.hostname == "10.0.0.5");
        REQUIRE(record.manufacturer == Manufacturer::Generic);
        REQUIRE(record.source == EndpointSource::Forced);
        REQUIRE(record.accessUri.empty());
        REQUIRE_FALSE(record.complete());
        REQUIRE(record.sourceToString() == "forced");
    }

    SECTION("applyDetails fills identity fields") {
        EndpointRecord record;
        PartialDetails details;
        details.model = "RealPresence Group 500";
        details.macAddress = "00:E0:DB:11:22:33";
        details.extra["system_name"] = "Boardroom";

        record.applyDetails(details);
        REQUIRE(record.model == "RealPresence Group 500");
        REQUIRE(record.macAddress == "00:E0:DB:11:22:33");
        REQUIRE(record.softwareVersion.empty());
        REQUIRE(record.rawDetails.at("system_name") == "Boardroom");
        REQUIRE(record.complete());
    }
}

TEST_CASE("Manufacturer names", "[Endpoint]") {
    REQUIRE(manufacturerToString(Manufacturer::Cisco) == "Cisco");
    REQUIRE(manufacturerToString(Manufacturer::Polycom) == "Polycom");
    REQUIRE(manufacturerToString(Manufacturer::Tandberg) == "TANDBERG");
    REQUIRE(manufacturerToString(Manufacturer::Generic) == "Generic");

    REQUIRE(manufacturerFromString("tandberg") == Manufacturer::Tandberg);
    REQUIRE(manufacturerFromString("CISCO") == Manufacturer::Cisco);
    REQUIRE(manufacturerFromString("Lifesize") == Manufacturer::Generic);
}
