#include "markup.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/assert.hpp>

#include <algorithm>
#include <climits>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tagmend;

static char const* const kVoidElements[] = {
    "area", "base", "br", "col", "embed", "hr", "img", "input", "link",
    "meta", "param", "source", "track", "wbr"
};

static char const* const kInlineElements[] = {
    "a", "abbr", "b", "bdi", "bdo", "cite", "code", "data", "dfn", "em",
    "font", "i", "kbd", "mark", "q", "s", "samp", "small", "span", "strike",
    "strong", "sub", "sup", "time", "tt", "u", "var"
};

// Their content is not text and never taggable.
static char const* const kRawTextElements[] = { "script", "style" };

template <std::size_t N>
static bool containsName(char const* const (&names)[N], boost::string_ref name)
{
    return std::any_of(
        std::begin(names), std::end(names),
        [name] (char const* n) { return boost::algorithm::iequals(name, n); });
}

bool tagmend::isInlineElement(boost::string_ref name, MarkupDialect dialect)
{
    return dialect == MarkupDialect::html
        && containsName(kInlineElements, name);
}

static bool isNameStartChar(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
        || c == '_' || c == ':' || static_cast<unsigned char>(c) >= 0x80;
}

static bool isNameChar(char c)
{
    return isNameStartChar(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

static bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

static void appendUtf8(std::string& out, unsigned long cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Returns false if ref is not a reference we know how to decode.
static bool decodeCharRef(
    boost::string_ref ref, MarkupDialect dialect, std::string& out)
{
    out.clear();
    if (ref.empty())
        return false;
    if (ref[0] == '#') {
        ref.remove_prefix(1);
        int base = 10;
        if (!ref.empty() && (ref[0] == 'x' || ref[0] == 'X')) {
            base = 16;
            ref.remove_prefix(1);
        }
        if (ref.empty() || ref.size() > 8)
            return false;
        unsigned long cp = 0;
        for (char c : ref) {
            int digit;
            if (c >= '0' && c <= '9')
                digit = c - '0';
            else if (base == 16 && c >= 'a' && c <= 'f')
                digit = c - 'a' + 10;
            else if (base == 16 && c >= 'A' && c <= 'F')
                digit = c - 'A' + 10;
            else
                return false;
            cp = cp * base + digit;
        }
        if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        appendUtf8(out, cp);
        return true;
    }

    if (ref == "lt")
        out = "<";
    else if (ref == "gt")
        out = ">";
    else if (ref == "amp")
        out = "&";
    else if (ref == "quot")
        out = "\"";
    else if (ref == "apos")
        out = "'";
    else if (ref == "nbsp" && dialect == MarkupDialect::html)
        out = " "; // Must stay a word break for the tokenizer.
    else
        return false;
    return true;
}

namespace {

struct OpenElement {
    boost::string_ref name;
    TagId id;
};

struct ScanState {
    boost::string_ref text;
    MarkupDialect dialect;
    ParsedMarkup& out;
    std::size_t pos;
    std::size_t textBegin; // Start of text not yet copied to out.stripped.
    std::vector<OpenElement> openElements;
};

} // anonymous namespace

[[noreturn]] static void throwAt(std::size_t offset, std::string const& msg)
{
    throw std::runtime_error(msg + " at offset " + std::to_string(offset));
}

static bool lookingAt(ScanState const& state, boost::string_ref s)
{
    return state.text.substr(state.pos).starts_with(s);
}

static std::size_t findFrom(
    boost::string_ref text, std::size_t from, boost::string_ref s)
{
    auto r = text.substr(from).find(s);
    return r == boost::string_ref::npos ? r : from + r;
}

static void flushText(ScanState& state, std::size_t upTo)
{
    BOOST_ASSERT(upTo >= state.textBegin);
    state.out.stripped.append(
        state.text.substr(state.textBegin, upTo - state.textBegin));
}

// Replaces [state.pos, end) of the original by replacement in the stripped
// text and continues scanning at end.
static void replaceUntil(
    ScanState& state, std::size_t end, boost::string_ref replacement)
{
    flushText(state, state.pos);
    state.out.stripped.replace(
        static_cast<unsigned>(end - state.pos), replacement);
    state.pos = state.textBegin = end;
}

static boost::string_ref wordBreakFor(
    ScanState const& state, boost::string_ref name)
{
    return isInlineElement(name, state.dialect) ? "" : "\n";
}

static std::size_t skipName(boost::string_ref text, std::size_t pos)
{
    while (pos < text.size() && isNameChar(text[pos]))
        ++pos;
    return pos;
}

// Returns the offset after the '>' ending the tag that starts at pos, or npos.
static std::size_t findTagEnd(boost::string_ref text, std::size_t pos)
{
    char quote = '\0';
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (quote) {
            if (c == quote)
                quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return pos + 1;
        }
    }
    return boost::string_ref::npos;
}

// True for "<a/>", "<a />" and "<a b='c'/>", but not for "<a href=x/>",
// where the slash belongs to an unquoted attribute value.
static bool isSelfClosing(
    boost::string_ref text, std::size_t nameEnd, std::size_t tagEnd)
{
    std::size_t slash = tagEnd - 2;
    if (slash < nameEnd || text[slash] != '/')
        return false;
    char before = text[slash - 1];
    return slash == nameEnd
        || isSpace(before) || before == '"' || before == '\'';
}

static bool sameName(
    boost::string_ref a, boost::string_ref b, MarkupDialect dialect)
{
    return dialect == MarkupDialect::html
        ? boost::algorithm::iequals(a, b) : a == b;
}

static std::size_t findRawTextEnd(
    boost::string_ref text, std::size_t from, boost::string_ref name)
{
    for (;;) {
        std::size_t lt = findFrom(text, from, "</");
        if (lt == boost::string_ref::npos)
            return lt;
        std::size_t nameEnd = skipName(text, lt + 2);
        if (boost::algorithm::iequals(
                text.substr(lt + 2, nameEnd - lt - 2), name)) {
            return lt;
        }
        from = lt + 2;
    }
}

static void skipDelimited(
    ScanState& state, std::size_t bodyOffset, boost::string_ref endDelim,
    char const* what)
{
    std::size_t end = findFrom(state.text, bodyOffset, endDelim);
    if (end == boost::string_ref::npos)
        throwAt(state.pos, std::string("Unterminated ") + what);
    replaceUntil(state, end + endDelim.size(), "");
}

static void scanCdata(ScanState& state)
{
    static boost::string_ref const kOpen("<![CDATA[");
    static boost::string_ref const kClose("]]>");
    std::size_t bodyBegin = state.pos + kOpen.size();
    std::size_t bodyEnd = findFrom(state.text, bodyBegin, kClose);
    if (bodyEnd == boost::string_ref::npos)
        throwAt(state.pos, "Unterminated CDATA section");
    state.out.cdataSections.push_back({
        static_cast<unsigned>(state.pos),
        static_cast<unsigned>(bodyBegin),
        static_cast<unsigned>(bodyEnd),
        static_cast<unsigned>(bodyEnd + kClose.size())});
    replaceUntil(state, bodyBegin, "");
    state.pos = bodyEnd;
    replaceUntil(state, bodyEnd + kClose.size(), "");
}

static void scanCloseTag(ScanState& state)
{
    std::size_t nameBegin = state.pos + 2;
    std::size_t nameEnd = skipName(state.text, nameBegin);
    if (nameEnd == nameBegin || !isNameStartChar(state.text[nameBegin])) {
        if (state.dialect == MarkupDialect::html) {
            ++state.pos;
            return;
        }
        throwAt(state.pos, "Malformed closing tag");
    }
    boost::string_ref name = state.text.substr(nameBegin, nameEnd - nameBegin);
    std::size_t end = nameEnd;
    while (end < state.text.size() && isSpace(state.text[end]))
        ++end;
    if (end >= state.text.size() || state.text[end] != '>')
        throwAt(state.pos, "Malformed closing tag </" + name.to_string());
    ++end;

    if (state.openElements.empty()) {
        throwAt(state.pos,
            "Closing tag </" + name.to_string() + "> without open element");
    }
    OpenElement const& open = state.openElements.back();
    if (!sameName(open.name, name, state.dialect)) {
        throwAt(state.pos,
            "Closing tag </" + name.to_string() + "> does not match <"
            + open.name.to_string() + ">");
    }
    state.out.tags.closeTag(
        static_cast<unsigned>(state.pos), static_cast<unsigned>(end));
    state.openElements.pop_back();
    replaceUntil(state, end, wordBreakFor(state, name));
}

static void scanOpenTag(ScanState& state)
{
    std::size_t nameBegin = state.pos + 1;
    std::size_t nameEnd = skipName(state.text, nameBegin);
    boost::string_ref name = state.text.substr(nameBegin, nameEnd - nameBegin);
    std::size_t end = findTagEnd(state.text, nameEnd);
    if (end == boost::string_ref::npos)
        throwAt(state.pos, "Unterminated tag <" + name.to_string());

    bool isHtml = state.dialect == MarkupDialect::html;
    if (isSelfClosing(state.text, nameEnd, end)
        || (isHtml && containsName(kVoidElements, name))
    ) {
        // Cannot enclose text, so no tag is registered.
        replaceUntil(state, end, wordBreakFor(state, name));
        return;
    }

    TagId id = state.out.tags.openTag(
        static_cast<unsigned>(state.pos), static_cast<unsigned>(end));
    state.openElements.push_back({name, id});
    replaceUntil(state, end, wordBreakFor(state, name));

    if (isHtml && containsName(kRawTextElements, name)) {
        std::size_t contentEnd = findRawTextEnd(state.text, end, name);
        if (contentEnd == boost::string_ref::npos)
            throwAt(end, "Unterminated <" + name.to_string() + "> content");
        replaceUntil(state, contentEnd, "");
    }
}

static void scanMarkup(ScanState& state)
{
    BOOST_ASSERT(state.text[state.pos] == '<');
    if (lookingAt(state, "<!--")) {
        skipDelimited(state, state.pos + 4, "-->", "comment");
    } else if (lookingAt(state, "<![CDATA[")) {
        scanCdata(state);
    } else if (lookingAt(state, "<!")) {
        skipDelimited(state, state.pos + 2, ">", "declaration");
    } else if (lookingAt(state, "<?")) {
        skipDelimited(state, state.pos + 2, "?>", "processing instruction");
    } else if (lookingAt(state, "</")) {
        scanCloseTag(state);
    } else if (state.pos + 1 < state.text.size()
        && isNameStartChar(state.text[state.pos + 1])
    ) {
        scanOpenTag(state);
    } else if (state.dialect == MarkupDialect::html) {
        ++state.pos; // Literal '<'.
    } else {
        throwAt(state.pos, "Unescaped '<'");
    }
}

static void scanCharRef(ScanState& state)
{
    BOOST_ASSERT(state.text[state.pos] == '&');
    static std::size_t const kMaxRefLen = 32;
    boost::string_ref rest = state.text.substr(state.pos + 1, kMaxRefLen);
    auto semi = rest.find(';');
    std::string decoded;
    if (semi == boost::string_ref::npos
        || !decodeCharRef(rest.substr(0, semi), state.dialect, decoded)
    ) {
        ++state.pos; // Kept literally.
        return;
    }
    replaceUntil(state, state.pos + semi + 2, decoded);
}

ParsedMarkup tagmend::parseMarkup(boost::string_ref text, MarkupDialect dialect)
{
    if (text.size() >= UINT_MAX)
        throw std::runtime_error("Document too large");

    ParsedMarkup r{TagTable(std::max<std::size_t>(text.size() / 20, 4)), {}, {}};
    ScanState state {text, dialect, r, 0, 0, {}};
    while (state.pos < text.size()) {
        switch (text[state.pos]) {
            case '<':
                scanMarkup(state);
                break;
            case '&':
                scanCharRef(state);
                break;
            default:
                ++state.pos;
                break;
        }
    }
    flushText(state, text.size());

    if (!state.openElements.empty()) {
        OpenElement const& open = state.openElements.back();
        throwAt(r.tags.openStart(open.id),
            "Element <" + open.name.to_string() + "> not closed");
    }
    r.tags.finish();
    return r;
}
