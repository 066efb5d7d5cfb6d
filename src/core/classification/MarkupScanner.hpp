#pragma once

#include <optional>
#include <regex>
#include <string>

namespace vidscan::core {

/**
 * @brief Regex helpers for pulling values out of loosely structured device pages.
 *
 * Device web UIs ship anything from XHTML to hand-written markup, so the
 * extractors scan text instead of building a DOM. Every helper returns
 * trimmed, entity-decoded, tag-free text or nullopt.
 */
class MarkupScanner {
public:
    /// Bytes of a response scanned by the helpers; the rest is ignored.
    static constexpr size_t MaxScanBytes = 64 * 1024;

    explicit MarkupScanner(const std::string& markup);

    /**
     * @brief Returns capture group 1 of the first match of @p pattern.
     *
     * Every repetition in @p pattern must carry an upper bound ({0,256} rather
     * than *); libstdc++ matches recursively, one frame per repeated character.
     * @return Cleaned capture, or nullopt when absent or empty after cleaning.
     */
    [[nodiscard]] std::optional<std::string> capture(const std::regex& pattern) const;

    /**
     * @brief Returns the contents of the page's <title> element.
     */
    [[nodiscard]] std::optional<std::string> title() const;

    /**
     * @brief Finds "Label: value" text, or a label cell/span followed by a value cell/span.
     * @param label Regex fragment matching the label text (without the colon).
     */
    [[nodiscard]] std::optional<std::string> labelledValue(const std::string& label) const;

    [[nodiscard]] const std::string& text() const { return markup_; }

    /**
     * @brief Strips tags, decodes the common entities and trims whitespace.
     */
    static std::string clean(const std::string& fragment);

    static std::string toLower(std::string str);

private:
    std::string markup_;
};

} // namespace vidscan::core
