#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/HttpAuth.hpp"

using namespace vidscan;
using namespace vidscan::infra;

TEST_CASE("Basic authorization header", "[HttpAuth]") {
    REQUIRE(HttpAuth::basic({"Aladdin", "open sesame"}) == "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    REQUIRE(HttpAuth::basic({"admin", "TANDBERG"}) == "Basic YWRtaW46VEFOREJFUkc=");
    REQUIRE(HttpAuth::basic({"admin", ""}) == "Basic YWRtaW46");
}

TEST_CASE("Digest challenge parsing", "[HttpAuth]") {
    SECTION("Quoted parameters and qop list") {
        auto challenge = HttpAuth::parseDigestChallenge(
            R"(Digest realm="testrealm@host.com", qop="auth,auth-int", )"
            R"(nonce="dcd98b7102dd2f0e8b11d0f600bfb0c093", opaque="5ccc069c403ebaf9f0171e9517f40e41")");
        REQUIRE(challenge.has_value());
        REQUIRE(challenge->realm == "testrealm@host.com");
        REQUIRE(challenge->nonce == "dcd98b7102dd2f0e8b11d0f600bfb0c093");
        REQUIRE(challenge->opaque == "5ccc069c403ebaf9f0171e9517f40e41");
        REQUIRE(challenge->algorithm == "MD5");
        REQUIRE(challenge->qopAuth);
    }

    SECTION("Unquoted algorithm, no qop") {
        auto challenge =
            HttpAuth::parseDigestChallenge(R"(digest realm="codec", nonce="abc", algorithm=MD5-sess)");
        REQUIRE(challenge.has_value());
        REQUIRE(challenge->algorithm == "MD5-sess");
        REQUIRE_FALSE(challenge->qopAuth);
    }

    SECTION("Digest offered after Basic") {
        auto challenge =
            HttpAuth::parseDigestChallenge(R"(Basic realm="x", Digest realm="y", nonce="n1")");
        REQUIRE(challenge.has_value());
        REQUIRE(challenge->realm == "y");
        REQUIRE(challenge->nonce == "n1");
    }

    SECTION("Not a usable Digest challenge") {
        REQUIRE_FALSE(HttpAuth::parseDigestChallenge(R"(Basic realm="TANDBERG")").has_value());
        REQUIRE_FALSE(HttpAuth::parseDigestChallenge(R"(Digest realm="no nonce")").has_value());
        REQUIRE_FALSE(HttpAuth::parseDigestChallenge("").has_value());
    }
}

TEST_CASE("Digest response computation", "[HttpAuth]") {
    DigestChallenge challenge;
    challenge.realm = "testrealm@host.com";
    challenge.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
    challenge.opaque = "5ccc069c403ebaf9f0171e9517f40e41";
    challenge.qopAuth = true;

    SECTION("Reference example with qop=auth") {
        auto header =
            HttpAuth::digest(challenge, {"Mufasa", "Circle Of Life"}, "/dir/index.html", "0a4f113b");
        REQUIRE(header.rfind("Digest username=\"Mufasa\"", 0) == 0);
        REQUIRE(header.find("response=\"6629fae49393a05397450978507c4ef1\"") != std::string::npos);
        REQUIRE(header.find("uri=\"/dir/index.html\"") != std::string::npos);
        REQUIRE(header.find("opaque=\"5ccc069c403ebaf9f0171e9517f40e41\"") != std::string::npos);
        REQUIRE(header.find("qop=auth, nc=00000001, cnonce=\"0a4f113b\"") != std::string::npos);
    }

    SECTION("Nonce count is hex encoded") {
        auto header = HttpAuth::digest(challenge, {"Mufasa", "Circle Of Life"}, "/dir/index.html",
                                       "0a4f113b", 26);
        REQUIRE(header.find("nc=0000001a") != std::string::npos);
    }

    SECTION("Legacy challenge without qop omits nc and cnonce") {
        challenge.qopAuth = false;
        challenge.opaque.clear();
        auto header = HttpAuth::digest(challenge, {"admin", "TANDBERG"}, "/", "0a4f113b");
        REQUIRE_FALSE(header.empty());
        REQUIRE(header.find("cnonce") == std::string::npos);
        REQUIRE(header.find("opaque") == std::string::npos);
    }

    SECTION("Unsupported algorithm yields no header") {
        challenge.algorithm = "SHA-256";
        REQUIRE(HttpAuth::digest(challenge, {"admin", "TANDBERG"}, "/", "0a4f113b").empty());
    }
}

TEST_CASE("Digest helpers", "[HttpAuth]") {
    REQUIRE(HttpAuth::md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(HttpAuth::md5Hex("abc") == "900150983cd24fb0d6963f7d28e17f72");

    auto first = HttpAuth::makeCnonce();
    auto second = HttpAuth::makeCnonce();
    REQUIRE(first.size() == 16);
    REQUIRE(first.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(first != second);
}
