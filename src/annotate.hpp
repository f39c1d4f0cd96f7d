#ifndef TAGMEND_ANNOTATE_HPP_INCLUDED
#define TAGMEND_ANNOTATE_HPP_INCLUDED

#include "markup.hpp"

#include <boost/utility/string_ref.hpp>

#include <cstddef>
#include <iosfwd>
#include <vector>

namespace tagmend {

class PhraseMatcher;

struct TaggedSpan {
    unsigned begin;
    unsigned end;
    std::size_t nameIdx;
};

struct AnnotationStats {
    std::size_t nCandidates;
    std::size_t nCorrected;
    std::size_t nUnalignable;

    AnnotationStats& operator+= (AnnotationStats const& other);
};

struct TaggedDocument {
    std::vector<TaggedSpan> spans; // Sorted, see sortSpans().
    AnnotationStats stats;
};

// ORDER BY begin ASC, end DESC, nameIdx ASC
void sortSpans(std::vector<TaggedSpan>& spans);

// Tags the stripped text of the markup document text and corrects each
// candidate to original offsets. If verboseLog is non-null, every
// unalignable candidate is reported there.
TaggedDocument annotateDocument(
    boost::string_ref text,
    MarkupDialect dialect,
    PhraseMatcher const& matcher,
    std::ostream* verboseLog = nullptr);

} // namespace tagmend

#endif // TAGMEND_ANNOTATE_HPP_INCLUDED
