/**
 * @file ManufacturerClassifier.hpp
 * @brief Fingerprint based attribution of device responses to manufacturers.
 */

#pragma once

#include "core/types/Endpoint.hpp"
#include "core/types/HttpResponse.hpp"

#include <string>
#include <vector>

namespace vidscan::core {

/**
 * @brief Part of a response a fingerprint rule inspects.
 */
enum class FingerprintLocation : int {
    Header = 0, ///< Any response header value (Server, WWW-Authenticate, ...)
    Title = 1,  ///< The HTML <title> element
    Body = 2    ///< Anywhere in the body, including XML element names and text
};

/**
 * @brief A single case-insensitive token match attributed to a manufacturer.
 */
struct FingerprintRule {
    Manufacturer manufacturer{Manufacturer::Generic};
    FingerprintLocation location{FingerprintLocation::Body};
    std::string token; ///< Lower-case token
};

/**
 * @brief Result of classifying a response.
 */
struct Classification {
    Manufacturer manufacturer{Manufacturer::Generic};
    std::string evidence; ///< Description of the rule that matched; empty for Generic

    bool operator==(const Classification& other) const = default;
};

/**
 * @brief Pure, deterministic manufacturer classifier.
 *
 * Rules are evaluated in a fixed order and the first match wins:
 * all Cisco rules, then Polycom, then TANDBERG. Within a manufacturer,
 * header rules come before title rules before body rules. No match yields
 * Generic. Cisco is checked before TANDBERG because TANDBERG-lineage codecs
 * running Cisco firmware mention both names.
 */
class ManufacturerClassifier {
public:
    /**
     * @brief Classifies a device response.
     * @param response Authenticated response, or the unauthenticated one.
     * @return Manufacturer and the evidence that decided it.
     */
    static Classification classify(const HttpResponse& response);

    /**
     * @brief Returns the ordered rule table.
     */
    static const std::vector<FingerprintRule>& rules();

    /**
     * @brief Checks whether a response carries any known manufacturer marker.
     *
     * Used to accept identity leaked in a 401 challenge.
     */
    static bool hasDeviceMarkers(const HttpResponse& response);
};

} // namespace vidscan::core
