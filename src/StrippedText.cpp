#include "StrippedText.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <iterator>

using namespace tagmend;

void StrippedText::replace(unsigned originalLen, boost::string_ref replacement)
{
    m_text.append(replacement.data(), replacement.size());
    long diff = static_cast<long>(originalLen)
        - static_cast<long>(replacement.size());
    if (diff == 0)
        return;

    unsigned offset = static_cast<unsigned>(m_text.size());
    long cumulative = m_corrections.empty() ? 0 : m_corrections.back().diff;
    if (!m_corrections.empty() && m_corrections.back().offset == offset) {
        // Only removals can share an offset with the previous correction.
        BOOST_ASSERT(replacement.empty());
        m_corrections.back().diff = cumulative + diff;
    } else {
        // A replacement is part of a span ending after it, removed markup is
        // not.
        long endDiff = replacement.empty() ? cumulative : cumulative + diff;
        m_corrections.push_back({offset, cumulative + diff, endDiff});
    }
}

StrippedText::Correction const* StrippedText::correctionAt(
    unsigned strippedOffset) const
{
    BOOST_ASSERT(strippedOffset <= m_text.size());
    auto it = std::upper_bound(
        m_corrections.begin(), m_corrections.end(), strippedOffset,
        [] (unsigned off, Correction const& c) { return off < c.offset; });
    return it == m_corrections.begin() ? nullptr : &*std::prev(it);
}

unsigned StrippedText::toOriginal(unsigned strippedOffset) const
{
    Correction const* c = correctionAt(strippedOffset);
    if (!c)
        return strippedOffset;
    long r = static_cast<long>(strippedOffset) + c->diff;
    BOOST_ASSERT(r >= 0);
    return static_cast<unsigned>(r);
}

unsigned StrippedText::toOriginalEnd(unsigned strippedOffset) const
{
    Correction const* c = correctionAt(strippedOffset);
    if (!c)
        return strippedOffset;
    long r = static_cast<long>(strippedOffset)
        + (c->offset == strippedOffset ? c->endDiff : c->diff);
    BOOST_ASSERT(r >= 0);
    return static_cast<unsigned>(r);
}
