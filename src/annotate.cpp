#include "annotate.hpp"

#include "OffsetCorrector.hpp"
#include "PhraseMatcher.hpp"

#include <boost/optional/optional.hpp>

#include <algorithm>
#include <ostream>
#include <vector>

using namespace tagmend;

AnnotationStats& AnnotationStats::operator+= (AnnotationStats const& other)
{
    nCandidates += other.nCandidates;
    nCorrected += other.nCorrected;
    nUnalignable += other.nUnalignable;
    return *this;
}

void tagmend::sortSpans(std::vector<TaggedSpan>& spans)
{
    std::sort(
        spans.begin(), spans.end(),
        [] (TaggedSpan const& lhs, TaggedSpan const& rhs) {
            if (lhs.begin != rhs.begin)
                return lhs.begin < rhs.begin;
            if (lhs.end != rhs.end)
                return lhs.end > rhs.end;
            return lhs.nameIdx < rhs.nameIdx;
        });
}

static bool sameSpan(TaggedSpan const& lhs, TaggedSpan const& rhs)
{
    return lhs.begin == rhs.begin
        && lhs.end == rhs.end
        && lhs.nameIdx == rhs.nameIdx;
}

static void writeCandidate(
    std::ostream& out, boost::string_ref text, unsigned beg, unsigned end)
{
    out << beg << '-' << end << " \"";
    out.write(text.data() + beg, end - beg);
    out << '"';
}

// The section whose content contains offset, if any.
static CdataSection const* cdataAt(
    std::vector<CdataSection> const& sections, unsigned offset)
{
    auto it = std::upper_bound(
        sections.begin(), sections.end(), offset,
        [] (unsigned off, CdataSection const& s) { return off < s.openEnd; });
    if (it == sections.begin())
        return nullptr;
    --it;
    return offset <= it->closeStart ? &*it : nullptr;
}

// Markup written inside a CDATA section would be literal text, so boundaries
// there are moved out over its delimiters, skipping only whitespace.
static boost::optional<Span> leaveCdata(
    Span span,
    std::vector<CdataSection> const& sections,
    OffsetCorrector const& corrector)
{
    if (CdataSection const* s = cdataAt(sections, span.begin)) {
        if (corrector.hasNonWhitespace(s->openEnd, span.begin))
            return boost::none;
        span.begin = s->openStart;
    }
    if (CdataSection const* s = cdataAt(sections, span.end)) {
        if (corrector.hasNonWhitespace(span.end, s->closeStart))
            return boost::none;
        span.end = s->closeEnd;
    }
    return span;
}

TaggedDocument tagmend::annotateDocument(
    boost::string_ref text,
    MarkupDialect dialect,
    PhraseMatcher const& matcher,
    std::ostream* verboseLog)
{
    ParsedMarkup markup = parseMarkup(text, dialect);
    OffsetCorrector corrector(text, markup.tags);
    StrippedText const& stripped = markup.stripped;

    TaggedDocument r = {};
    for (PhraseMatch const& m : matcher.findMatches(stripped.str())) {
        ++r.stats.nCandidates;
        unsigned beg = stripped.toOriginal(m.begin);
        unsigned end = stripped.toOriginalEnd(m.end);
        auto corrected = corrector.correctPair(beg, end);
        if (corrected)
            corrected = leaveCdata(*corrected, markup.cdataSections, corrector);
        if (!corrected) {
            ++r.stats.nUnalignable;
            if (verboseLog) {
                *verboseLog << "Unalignable: ";
                writeCandidate(*verboseLog, text, beg, end);
                *verboseLog << " (" << matcher.name(m.nameIdx) << ")\n";
            }
            continue;
        }
        ++r.stats.nCorrected;
        r.spans.push_back({corrected->begin, corrected->end, m.nameIdx});
    }

    sortSpans(r.spans);
    r.spans.erase(
        std::unique(r.spans.begin(), r.spans.end(), &sameSpan),
        r.spans.end());
    return r;
}
