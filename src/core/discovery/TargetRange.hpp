/**
 * @file TargetRange.hpp
 * @brief Expansion of a CIDR range or single address into probe targets.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief Thrown when a target specification is not a valid IPv4 CIDR or address.
 */
class InvalidRangeError : public std::invalid_argument {
public:
    explicit InvalidRangeError(const std::string& spec, const std::string& reason)
        : std::invalid_argument("Invalid target range '" + spec + "': " + reason), spec_(spec) {}

    [[nodiscard]] const std::string& spec() const noexcept { return spec_; }

private:
    std::string spec_;
};

/**
 * @brief A host address together with the ports to probe on it.
 */
struct Target {
    std::string address;
    std::vector<uint16_t> ports;

    bool operator==(const Target& other) const = default;
};

/**
 * @brief Finite, restartable sequence of host addresses in an IPv4 network.
 *
 * Follows the usual host convention: for prefixes up to /30 the network and
 * broadcast addresses are skipped, /31 yields both addresses and /32 (or a
 * bare address) yields exactly one. Host bits set in the specification are
 * masked off, so "10.0.0.7/24" denotes 10.0.0.0/24.
 *
 * Addresses are computed on demand; iterating never materialises the range.
 */
class TargetRange {
public:
    /**
     * @brief Forward iterator over the host addresses of a range.
     */
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = std::string;

        Iterator() = default;
        Iterator(const TargetRange* range, uint64_t index) : range_(range), index_(index) {}

        std::string operator*() const { return range_->at(index_); }

        Iterator& operator++() {
            ++index_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const Iterator& other) const { return index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return index_ != other.index_; }

    private:
        const TargetRange* range_{nullptr};
        uint64_t index_{0};
    };

    /**
     * @brief Parses a CIDR string ("a.b.c.d/p") or a bare IPv4 address.
     * @param spec Target specification; surrounding whitespace is ignored.
     * @return The parsed range.
     * @throws InvalidRangeError on malformed address or prefix.
     */
    static TargetRange parse(const std::string& spec);

    /**
     * @brief Number of host addresses in the range.
     */
    [[nodiscard]] uint64_t size() const { return count_; }

    /**
     * @brief Returns the host address at a zero-based position.
     * @param index Position, must be less than size().
     * @throws std::out_of_range when index is past the end.
     */
    [[nodiscard]] std::string at(uint64_t index) const;

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, count_); }

    /**
     * @brief Checks whether an address is one of the range's hosts.
     */
    [[nodiscard]] bool contains(const std::string& address) const;

    /**
     * @brief Returns the canonical network notation, e.g. "192.168.1.0/24".
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] uint8_t prefixLength() const { return prefix_; }

    /**
     * @brief Parses a dotted-quad IPv4 address.
     * @return Address in host byte order, or nullopt if malformed.
     */
    static std::optional<uint32_t> parseAddress(const std::string& address);

    static std::string formatAddress(uint32_t address);

private:
    TargetRange(uint32_t network, uint8_t prefix);

    uint32_t network_{0};
    uint32_t firstHost_{0};
    uint64_t count_{0};
    uint8_t prefix_{32};
};

} // namespace vidscan::core
