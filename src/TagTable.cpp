#include "TagTable.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

using namespace tagmend;

TagTable::TagTable()
    : m_current(kRootTag)
{ }

TagTable::TagTable(std::size_t sizeHint)
    : m_current(kRootTag)
{
    m_tags.reserve(sizeHint);
    m_parentChanges.reserve(sizeHint * 2);
}

static unsigned lastChangeOffset(std::vector<ParentChange> const& changes)
{
    return changes.empty() ? 0 : changes.back().offset;
}

TagId TagTable::openTag(unsigned openStart, unsigned openEnd)
{
    if (openStart >= openEnd) {
        throw std::logic_error(
            "Empty or inverted open delimiter at offset "
            + std::to_string(openStart));
    }
    if (openStart < lastChangeOffset(m_parentChanges)) {
        throw std::logic_error(
            "Tag opened out of document order at offset "
            + std::to_string(openStart));
    }

    TagId id = static_cast<TagId>(m_tags.size());
    m_tags.push_back({m_current, openStart, openEnd, 0, 0});
    m_current = id;
    recordParentChange(openStart, id);
    return id;
}

void TagTable::closeTag(unsigned closeStart, unsigned closeEnd)
{
    if (m_current == kRootTag) {
        throw std::logic_error(
            "Close delimiter without open tag at offset "
            + std::to_string(closeStart));
    }
    TagInfo& tag = m_tags[static_cast<std::size_t>(m_current)];
    if (closeStart < tag.openEnd || closeStart >= closeEnd
        || closeStart < lastChangeOffset(m_parentChanges)
    ) {
        throw std::logic_error(
            "Bad close delimiter at offset " + std::to_string(closeStart)
            + " for tag opened at " + std::to_string(tag.openStart));
    }
    tag.closeStart = closeStart;
    tag.closeEnd = closeEnd;
    m_current = tag.parent;
    recordParentChange(closeEnd, m_current);
}

void TagTable::finish() const
{
    if (m_current != kRootTag) {
        throw std::logic_error(
            "Tag opened at offset " + std::to_string(openStart(m_current))
            + " was never closed");
    }
}

void TagTable::recordParentChange(unsigned offset, TagId tag)
{
    // E.g. "</a><b>": the later change wins.
    if (!m_parentChanges.empty() && m_parentChanges.back().offset == offset)
        m_parentChanges.back().tag = tag;
    else
        m_parentChanges.push_back({offset, tag});
}

bool TagTable::encloses(TagId tag, unsigned offset) const
{
    if (tag == kRootTag)
        return true;
    TagInfo const& info = at(tag);
    return offset >= info.openStart && offset < info.closeEnd;
}

TagId TagTable::lookupEnclosingTag(unsigned offset) const
{
    auto it = std::upper_bound(
        m_parentChanges.begin(), m_parentChanges.end(), offset,
        [] (unsigned off, ParentChange const& change) {
            return off < change.offset;
        });
    if (it == m_parentChanges.begin())
        return kRootTag;
    return std::prev(it)->tag;
}
