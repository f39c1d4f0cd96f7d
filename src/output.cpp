#include "output.hpp"

#include "PhraseMatcher.hpp"
#include "SimpleTemplate.hpp"

#include <boost/assert.hpp>
#include <boost/variant/variant.hpp>

#include <ostream>

using namespace tagmend;

char const tagmend::kDefaultListingTemplate[] =
    "@@file@@\t@@start@@\t@@end@@\t@@name@@\t@@text@@\n";

static boost::string_ref htmlEscape(char const& c, bool inAttr)
{
    switch (c) {
        case '<':
            return "&lt;";
        // Note: '>' does not need to be escaped.
        case '&':
            return "&amp;";
        case '"':
            if (inAttr)
                return "&quot;";
            break;
    }
    return boost::string_ref(&c, 1);
}

std::string tagmend::htmlEscape(boost::string_ref s, bool inAttr)
{
    std::string r;
    r.reserve(s.size());
    for (char const& c : s) {
        boost::string_ref escaped = ::htmlEscape(c, inAttr);
        r.append(escaped.data(), escaped.size());
    }
    return r;
}

namespace {

class AnnotatedWriter {
public:
    AnnotatedWriter(
        std::ostream& out,
        boost::string_ref text,
        PhraseMatcher const& matcher,
        boost::string_ref element)
        : m_out(out)
        , m_text(text)
        , m_matcher(matcher)
        , m_element(element)
        , m_pos(0)
    { }

    void copyUntil(unsigned offset)
    {
        BOOST_ASSERT(offset >= m_pos && offset <= m_text.size());
        m_out.write(m_text.data() + m_pos, offset - m_pos);
        m_pos = offset;
    }

    void begin(TaggedSpan const& span)
    {
        copyUntil(span.begin);
        m_out << '<' << m_element << " title=\""
              << htmlEscape(m_matcher.name(span.nameIdx), true) << "\">";
    }

    void end(TaggedSpan const& span)
    {
        copyUntil(span.end);
        m_out << "</" << m_element << '>';
    }

    void finish() { copyUntil(static_cast<unsigned>(m_text.size())); }

private:
    std::ostream& m_out;
    boost::string_ref m_text;
    PhraseMatcher const& m_matcher;
    boost::string_ref m_element;
    unsigned m_pos;
};

} // anonymous namespace

std::size_t tagmend::writeAnnotated(
    std::ostream& out,
    boost::string_ref text,
    TaggedDocument const& doc,
    PhraseMatcher const& matcher,
    boost::string_ref element,
    std::ostream& log)
{
    AnnotatedWriter writer(out, text, matcher, element);
    std::vector<TaggedSpan const*> activeSpans;
    std::size_t nWritten = 0;
    for (auto const& span : doc.spans) {
        while (!activeSpans.empty()
            && span.begin >= activeSpans.back()->end
        ) {
            writer.end(*activeSpans.back());
            activeSpans.pop_back();
        }
        if (!activeSpans.empty() && span.end > activeSpans.back()->end) {
            log << "Skipping span " << span.begin << '-' << span.end
                << " (" << matcher.name(span.nameIdx)
                << "): overlaps " << activeSpans.back()->begin << '-'
                << activeSpans.back()->end << '\n';
            continue;
        }
        writer.begin(span);
        activeSpans.push_back(&span);
        ++nWritten;
    }
    for (auto rit = activeSpans.rbegin(); rit != activeSpans.rend(); ++rit)
        writer.end(**rit);
    writer.finish();
    return nWritten;
}

std::vector<std::string> const& tagmend::listingPlaceholders()
{
    static std::vector<std::string> const keys {
        "file", "start", "end", "name", "text"
    };
    return keys;
}

void tagmend::writeSpanListing(
    std::ostream& out,
    SimpleTemplate const& tpl,
    std::string const& fname,
    boost::string_ref text,
    TaggedDocument const& doc,
    PhraseMatcher const& matcher)
{
    SimpleTemplate::Context ctx;
    ctx["file"] = fname;
    for (auto const& span : doc.spans) {
        ctx["start"] = std::to_string(span.begin);
        ctx["end"] = std::to_string(span.end);
        ctx["name"] = matcher.name(span.nameIdx);
        ctx["text"] = SimpleTemplate::ValCallback(
            [text, &span] (std::ostream& o) {
                o.write(text.data() + span.begin, span.end - span.begin);
            });
        tpl.writeTo(out, ctx);
    }
}
