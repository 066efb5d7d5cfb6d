/**
 * @file DetailExtractor.hpp
 * @brief Manufacturer specific extraction of device identity from responses.
 */

#pragma once

#include "core/types/Endpoint.hpp"
#include "core/types/HttpResponse.hpp"

namespace vidscan::core {

/**
 * @brief Base class of the per-manufacturer detail extractors.
 *
 * Each manufacturer variant parses its own page layout. extract() never
 * throws: a missing field is simply absent, and a malformed or truncated
 * response degrades to empty details.
 */
class DetailExtractor {
public:
    virtual ~DetailExtractor() = default;

    /**
     * @brief Extracts identity details from a response body.
     * @param response Response of the device's management page.
     * @return Sparse details; empty when nothing could be extracted.
     */
    PartialDetails extract(const HttpResponse& response) const noexcept;

    /**
     * @brief Returns the manufacturer this extractor handles.
     */
    virtual Manufacturer manufacturer() const = 0;

protected:
    virtual PartialDetails parse(const std::string& body) const = 0;
};

/**
 * @brief Returns the extractor bound to a manufacturer variant.
 * @param manufacturer Classifier decision.
 * @return Reference to a stateless extractor with static lifetime.
 */
const DetailExtractor& extractorFor(Manufacturer manufacturer);

} // namespace vidscan::core
