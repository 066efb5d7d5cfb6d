#pragma once

#include "core/classification/DetailExtractor.hpp"

namespace vidscan::core {

/**
 * @brief Extracts details from legacy TANDBERG (MXP, C-series TC) pages.
 *
 * The model is the page title without its "TANDBERG" prefix; the software
 * version sits in div#sw-version or in a "Software:" table row.
 */
class TandbergDetailExtractor : public DetailExtractor {
public:
    Manufacturer manufacturer() const override { return Manufacturer::Tandberg; }

protected:
    PartialDetails parse(const std::string& body) const override;
};

} // namespace vidscan::core
