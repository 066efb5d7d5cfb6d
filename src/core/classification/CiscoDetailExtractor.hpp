#pragma once

#include "core/classification/DetailExtractor.hpp"

namespace vidscan::core {

/**
 * @brief Extracts details from Cisco / Webex web interface pages.
 *
 * The model comes from the page title with the "Cisco" prefix removed;
 * Room series names get a "Webex " prefix unless they are TelePresence
 * units or already carry it. Version, serial and MAC are looked up through
 * the layouts seen across RoomOS/CE generations: dedicated class names,
 * label/value table rows, info-label spans and plain paragraphs.
 */
class CiscoDetailExtractor : public DetailExtractor {
public:
    Manufacturer manufacturer() const override { return Manufacturer::Cisco; }

protected:
    PartialDetails parse(const std::string& body) const override;
};

} // namespace vidscan::core
