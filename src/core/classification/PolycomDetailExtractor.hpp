#pragma once

#include "core/classification/DetailExtractor.hpp"

namespace vidscan::core {

class PolycomDetailExtractor : public DetailExtractor {
public:
    Manufacturer manufacturer() const override { return Manufacturer::Polycom; }

protected:
    PartialDetails parse(const std::string& body) const override;
};

} // namespace vidscan::core
