#include "OffsetCorrector.hpp"

#include <boost/assert.hpp>

using namespace tagmend;

bool tagmend::isMarkupWhitespace(char c)
{
    switch (c) {
        case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
        case '\x1c': case '\x1d': case '\x1e': case '\x1f':
            return true;
        default:
            return false;
    }
}

OffsetCorrector::OffsetCorrector(boost::string_ref docText, TagTable const& tags)
    : m_text(docText)
    , m_tags(tags)
{ }

boost::optional<Span> OffsetCorrector::correctPair(
    unsigned leftOffset, unsigned rightOffset) const
{
    BOOST_ASSERT(leftOffset <= rightOffset);
    BOOST_ASSERT(rightOffset <= m_text.size());

    rightOffset = snapBackCloseTag(leftOffset, rightOffset);

    TagId const startTag = m_tags.lookupEnclosingTag(leftOffset);
    TagId const endTag = m_tags.lookupEnclosingTag(rightOffset);

    // Find the tag enclosing both offsets, bumping out the left offset on
    // the way up.
    TagId tag = startTag;
    for (; !m_tags.encloses(tag, rightOffset); tag = m_tags.parent(tag)) {
        if (hasNonWhitespace(m_tags.openEnd(tag), leftOffset))
            return boost::none;
        leftOffset = m_tags.openStart(tag);
    }
    TagId const ancestor = tag;

    for (tag = endTag; tag != ancestor; tag = m_tags.parent(tag)) {
        BOOST_ASSERT(tag != kRootTag); // The root encloses everything.
        if (hasNonWhitespace(rightOffset, m_tags.closeStart(tag)))
            return boost::none;
        rightOffset = m_tags.closeEnd(tag);
    }

    return Span{leftOffset, rightOffset};
}

unsigned OffsetCorrector::snapBackCloseTag(
    unsigned leftOffset, unsigned rightOffset) const
{
    if (rightOffset < 2 || m_text[rightOffset - 1] != '>')
        return rightOffset;
    auto lt = m_text.substr(0, rightOffset - 1).rfind('<');
    if (lt == boost::string_ref::npos || lt <= leftOffset)
        return rightOffset;
    return static_cast<unsigned>(lt);
}

bool OffsetCorrector::hasNonWhitespace(unsigned begin, unsigned end) const
{
    BOOST_ASSERT(end <= m_text.size());
    for (unsigned i = begin; i < end; ++i) {
        if (!isMarkupWhitespace(m_text[i]))
            return true;
    }
    return false;
}
