#pragma once

#include "core/classification/DetailExtractor.hpp"

namespace vidscan::core {

/**
 * @brief Best-effort extractor for unclassified devices.
 *
 * Assumes no page structure: it only looks for common labels such as
 * "Model:", "Version:", "Serial Number:" and "MAC Address:". The page title
 * is kept as a raw detail but never used as the model.
 */
class GenericDetailExtractor : public DetailExtractor {
public:
    Manufacturer manufacturer() const override { return Manufacturer::Generic; }

protected:
    PartialDetails parse(const std::string& body) const override;
};

} // namespace vidscan::core
