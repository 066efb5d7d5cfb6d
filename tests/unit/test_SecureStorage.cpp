#include <catch2/catch_test_macros.hpp>

#include "infrastructure/crypto/SecureStorage.hpp"

#include <filesystem>

using namespace vidscan::infra;

namespace {

std::filesystem::path freshKeyPath() {
    auto dir = std::filesystem::temp_directory_path() / "vidscan_secure_storage_test";
    std::filesystem::remove_all(dir);
    return dir / ".key";
}

} // namespace

TEST_CASE("SecureStorage key handling", "[SecureStorage]") {
    auto keyPath = freshKeyPath();

    SECTION("Creates an owner-only key file") {
        SecureStorage storage(keyPath);
        REQUIRE(storage.ready());
        REQUIRE(std::filesystem::exists(keyPath));

        auto perms = std::filesystem::status(keyPath).permissions();
        REQUIRE((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
        REQUIRE((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);
    }

    SECTION("Reuses the key across instances") {
        std::optional<std::string> sealed;
        {
            SecureStorage storage(keyPath);
            sealed = storage.encrypt("TANDBERG");
        }
        REQUIRE(sealed.has_value());

        SecureStorage reopened(keyPath);
        REQUIRE(reopened.decrypt(*sealed) == std::optional<std::string>("TANDBERG"));
    }

    std::filesystem::remove_all(keyPath.parent_path());
}

TEST_CASE("SecureStorage sealing", "[SecureStorage]") {
    auto keyPath = freshKeyPath();
    SecureStorage storage(keyPath);

    SECTION("Each seal uses a fresh nonce") {
        auto first = storage.encrypt("secret");
        auto second = storage.encrypt("secret");
        REQUIRE(first.has_value());
        REQUIRE(*first != *second);
        REQUIRE(storage.decrypt(*first) == std::optional<std::string>("secret"));
    }

    SECTION("Empty secret") {
        auto sealed = storage.encrypt("");
        REQUIRE(storage.decrypt(*sealed) == std::optional<std::string>(""));
    }

    SECTION("Tampered or foreign data is rejected") {
        auto sealed = *storage.encrypt("secret");
        sealed[sealed.size() / 2] = sealed[sealed.size() / 2] == 'A' ? 'B' : 'A';
        REQUIRE_FALSE(storage.decrypt(sealed).has_value());
        REQUIRE_FALSE(storage.decrypt("not base64!").has_value());
        REQUIRE_FALSE(storage.decrypt("c2hvcnQ=").has_value());
    }

    std::filesystem::remove_all(keyPath.parent_path());
}

TEST_CASE("Base64 helpers", "[SecureStorage]") {
    REQUIRE(base64Encode("admin:TANDBERG") == "YWRtaW46VEFOREJFUkc=");
    REQUIRE(base64Encode("").empty());
    REQUIRE(base64Decode("YWRtaW46VEFOREJFUkc=") == std::optional<std::string>("admin:TANDBERG"));
    REQUIRE(base64Decode("") == std::optional<std::string>(""));
    REQUIRE_FALSE(base64Decode("%%%").has_value());
}
