#ifndef TAGMEND_MARKUP_HPP_INCLUDED
#define TAGMEND_MARKUP_HPP_INCLUDED

#include "StrippedText.hpp"
#include "TagTable.hpp"

#include <boost/utility/string_ref.hpp>

#include <vector>

namespace tagmend {

enum class MarkupDialect {
    xml,
    html // Case-insensitive names, void elements, script/style content.
};

// Its content is text, but markup written into it would be literal.
struct CdataSection {
    unsigned openStart;
    unsigned openEnd;
    unsigned closeStart;
    unsigned closeEnd;
};

struct ParsedMarkup {
    TagTable tags;
    StrippedText stripped;
    std::vector<CdataSection> cdataSections; // In document order.
};

// Throws std::runtime_error on malformed markup, e.g. mismatched or unclosed
// elements.
ParsedMarkup parseMarkup(boost::string_ref text, MarkupDialect dialect);

bool isInlineElement(boost::string_ref name, MarkupDialect dialect);

} // namespace tagmend

#endif // TAGMEND_MARKUP_HPP_INCLUDED
