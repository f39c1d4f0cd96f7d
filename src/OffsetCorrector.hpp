#ifndef TAGMEND_OFFSET_CORRECTOR_HPP_INCLUDED
#define TAGMEND_OFFSET_CORRECTOR_HPP_INCLUDED

#include "TagTable.hpp"

#include <boost/optional/optional.hpp>
#include <boost/utility/string_ref.hpp>

namespace tagmend {

struct Span {
    unsigned begin;
    unsigned end;
};

inline bool operator== (Span const& lhs, Span const& rhs)
{
    return lhs.begin == rhs.begin && lhs.end == rhs.end;
}

inline bool operator!= (Span const& lhs, Span const& rhs)
{
    return !(lhs == rhs);
}

bool isMarkupWhitespace(char c);

// Widens spans over the original document text so that they do not split
// markup. Both the text and the tag table are borrowed and must outlive the
// corrector.
class OffsetCorrector {
public:
    OffsetCorrector(boost::string_ref docText, TagTable const& tags);

    // The left offset is pulled left over whitespace and open tags, the right
    // offset right over whitespace and close tags, until both lie in the same
    // tag. Returns boost::none if that would cross non-whitespace text.
    boost::optional<Span> correctPair(
        unsigned leftOffset, unsigned rightOffset) const;

    // If rightOffset points just past a '>', e.g. "foo</tag>|", moves it back
    // to the '<' ("foo|</tag>"). The result stays greater than leftOffset.
    unsigned snapBackCloseTag(unsigned leftOffset, unsigned rightOffset) const;

    bool hasNonWhitespace(unsigned begin, unsigned end) const;

    boost::string_ref text() const noexcept { return m_text; }
    TagTable const& tags() const noexcept { return m_tags; }

private:
    boost::string_ref m_text;
    TagTable const& m_tags;
};

} // namespace tagmend

#endif // TAGMEND_OFFSET_CORRECTOR_HPP_INCLUDED
