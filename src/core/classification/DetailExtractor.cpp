#include "core/classification/DetailExtractor.hpp"

#include "core/classification/CiscoDetailExtractor.hpp"
#include "core/classification/GenericDetailExtractor.hpp"
#include "core/classification/PolycomDetailExtractor.hpp"
#include "core/classification/TandbergDetailExtractor.hpp"

#include <exception>

namespace vidscan::core {

PartialDetails DetailExtractor::extract(const HttpResponse& response) const noexcept {
    if (response.body.empty()) {
        return {};
    }

    try {
        return parse(response.body);
    } catch (const std::exception&) {
        // std::regex_error on pathological markup, std::bad_alloc on huge pages
        return {};
    }
}

const DetailExtractor& extractorFor(Manufacturer manufacturer) {
    static const CiscoDetailExtractor cisco;
    static const PolycomDetailExtractor polycom;
    static const TandbergDetailExtractor tandberg;
    static const GenericDetailExtractor generic;

    switch (manufacturer) {
    case Manufacturer::Cisco:
        return cisco;
    case Manufacturer::Polycom:
        return polycom;
    case Manufacturer::Tandberg:
        return tandberg;
    case Manufacturer::Generic:
        return generic;
    }
    return generic;
}

} // namespace vidscan::core
