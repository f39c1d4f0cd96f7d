#ifndef TAGMEND_TAG_TABLE_HPP_INCLUDED
#define TAGMEND_TAG_TABLE_HPP_INCLUDED

#include <boost/assert.hpp>

#include <cstddef>
#include <vector>

namespace tagmend {

using TagId = int;

// Parent of all top-level tags. Its virtual extent is the whole document.
TagId const kRootTag = -1;

struct TagInfo {
    TagId parent;
    unsigned openStart;
    unsigned openEnd;
    unsigned closeStart;
    unsigned closeEnd;
};

struct ParentChange {
    unsigned offset;
    TagId tag; // Innermost enclosing tag from offset on.
};

// Tags are IDed sequentially from 0 in the order their open delimiters were
// registered, so a parent always has a smaller ID than its children.
class TagTable {
public:
    TagTable();
    explicit TagTable(std::size_t sizeHint);

    // Registers a child of the currently open tag.
    TagId openTag(unsigned openStart, unsigned openEnd);

    // Completes the innermost open tag.
    void closeTag(unsigned closeStart, unsigned closeEnd);

    // Throws std::logic_error if a tag is still open.
    void finish() const;

    TagId openedTag() const noexcept { return m_current; }

    std::size_t size() const noexcept { return m_tags.size(); }
    bool empty() const noexcept { return m_tags.empty(); }

    TagInfo const& at(TagId tag) const
    {
        BOOST_ASSERT(tag >= 0 && static_cast<std::size_t>(tag) < m_tags.size());
        return m_tags[static_cast<std::size_t>(tag)];
    }

    TagId parent(TagId tag) const { return at(tag).parent; }
    unsigned openStart(TagId tag) const { return at(tag).openStart; }
    unsigned openEnd(TagId tag) const { return at(tag).openEnd; }
    unsigned closeStart(TagId tag) const { return at(tag).closeStart; }
    unsigned closeEnd(TagId tag) const { return at(tag).closeEnd; }

    // Always true for kRootTag.
    bool encloses(TagId tag, unsigned offset) const;

    // The innermost tag whose [openStart, closeEnd) contains offset, or
    // kRootTag. O(log n) in the number of parent changes.
    TagId lookupEnclosingTag(unsigned offset) const;

    std::vector<ParentChange> const& parentChanges() const noexcept
    {
        return m_parentChanges;
    }

private:
    void recordParentChange(unsigned offset, TagId tag);

    std::vector<TagInfo> m_tags;
    std::vector<ParentChange> m_parentChanges; // Strictly ascending offsets.
    TagId m_current;
};

} // namespace tagmend

#endif // TAGMEND_TAG_TABLE_HPP_INCLUDED
