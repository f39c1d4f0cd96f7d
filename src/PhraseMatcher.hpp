#ifndef TAGMEND_PHRASE_MATCHER_HPP_INCLUDED
#define TAGMEND_PHRASE_MATCHER_HPP_INCLUDED

#include <boost/utility/string_ref.hpp>

#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagmend {

struct Token {
    unsigned begin;
    unsigned end;
};

// Tokens are maximal runs of ASCII alphanumerics and non-ASCII bytes.
std::vector<Token> tokenize(boost::string_ref text);

struct PhraseMatch {
    unsigned begin;
    unsigned end;
    std::size_t nameIdx; // See PhraseMatcher::name().
};

// Finds dictionary names in text, compared token by token after ASCII
// lower-casing. Immutable once loaded, so matching is thread safe.
class PhraseMatcher {
public:
    PhraseMatcher();

    // Returns false if name contains no tokens or is already present.
    bool addName(boost::string_ref name);

    // One name per line. Blank lines and lines starting with '#' are skipped.
    // Returns the number of names added.
    std::size_t loadDictionary(std::istream& in);

    std::size_t size() const noexcept { return m_names.size(); }
    std::string const& name(std::size_t idx) const { return m_names.at(idx); }

    // All occurrences at token boundaries, overlapping ones included, ordered
    // by begin ascending and end descending.
    std::vector<PhraseMatch> findMatches(boost::string_ref text) const;

private:
    struct Node {
        std::unordered_map<std::string, std::size_t> children;
        std::size_t nameIdx; // npos if no name ends here.
    };

    std::vector<Node> m_nodes; // m_nodes[0] is the root.
    std::vector<std::string> m_names;
};

} // namespace tagmend

#endif // TAGMEND_PHRASE_MATCHER_HPP_INCLUDED
