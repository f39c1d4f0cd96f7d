#ifndef TAGMEND_STRIPPED_TEXT_HPP_INCLUDED
#define TAGMEND_STRIPPED_TEXT_HPP_INCLUDED

#include <boost/utility/string_ref.hpp>

#include <string>
#include <vector>

namespace tagmend {

// Document text with markup removed, plus the corrections needed to map
// offsets in it back to the original text.
class StrippedText {
public:
    // Appends text copied unchanged from the original.
    void append(boost::string_ref s) { m_text.append(s.data(), s.size()); }

    // Records that originalLen bytes of the original were replaced by
    // replacement (possibly empty).
    void replace(unsigned originalLen, boost::string_ref replacement);

    // Offsets directly after a replaced region map to its end in the
    // original, i.e. past removed markup. Use for span starts.
    unsigned toOriginal(unsigned strippedOffset) const;

    // Like toOriginal(), but offsets directly after removed (not replaced)
    // markup map to where that markup starts. Use for span ends, so that
    // "word<!-- -->" ends before the comment.
    unsigned toOriginalEnd(unsigned strippedOffset) const;

    std::string const& str() const noexcept { return m_text; }
    std::size_t size() const noexcept { return m_text.size(); }

private:
    struct Correction {
        unsigned offset;
        long diff; // Cumulative: original = offset + diff.
        long endDiff; // diff before the markup removed at offset.
    };

    Correction const* correctionAt(unsigned strippedOffset) const;

    std::string m_text;
    std::vector<Correction> m_corrections;
};

} // namespace tagmend

#endif // TAGMEND_STRIPPED_TEXT_HPP_INCLUDED
