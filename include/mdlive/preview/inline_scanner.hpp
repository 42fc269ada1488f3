#pragma once

#include "mdlive/preview/document.hpp"
#include "mdlive/preview/element.hpp"
#include "mdlive/preview/reference_table.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace mdlive::preview
{

// True when the character at pos is preceded by an odd run of backslashes.
bool isEscaped(std::string_view text, std::size_t pos) noexcept;

class InlineScanner
{
public:
    // Line-level structure (heading, quotation, list item, horizontal rule)
    // followed by the inline constructs of one line.
    std::vector<Element> scanLine(const DocumentLine &line, const ReferenceTable &references) const;

    std::vector<Element> scanStructure(const DocumentLine &line, bool &isRule) const;
    std::vector<Element> scanInline(std::string_view text, std::size_t lineFrom, int lineNumber,
                                    const ReferenceTable &references) const;
};

} // namespace mdlive::preview
