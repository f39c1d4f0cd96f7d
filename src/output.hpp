#ifndef TAGMEND_OUTPUT_HPP_INCLUDED
#define TAGMEND_OUTPUT_HPP_INCLUDED

#include "annotate.hpp"

#include <boost/utility/string_ref.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace tagmend {

class PhraseMatcher;
class SimpleTemplate;

std::string htmlEscape(boost::string_ref s, bool inAttr);

// Copies text to out, wrapping each span of doc as <element title="name">.
// A span that partially overlaps an earlier one would make the output
// ill-formed, so it is skipped and reported to log.
// Returns the number of spans written.
std::size_t writeAnnotated(
    std::ostream& out,
    boost::string_ref text,
    TaggedDocument const& doc,
    PhraseMatcher const& matcher,
    boost::string_ref element,
    std::ostream& log);

extern char const kDefaultListingTemplate[];

// Placeholders a listing template may use.
std::vector<std::string> const& listingPlaceholders();

// Renders tpl once per span of doc.
void writeSpanListing(
    std::ostream& out,
    SimpleTemplate const& tpl,
    std::string const& fname,
    boost::string_ref text,
    TaggedDocument const& doc,
    PhraseMatcher const& matcher);

} // namespace tagmend

#endif // TAGMEND_OUTPUT_HPP_INCLUDED
