#include "PhraseMatcher.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <istream>
#include <locale>

using namespace tagmend;

static bool isTokenChar(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
        || (c >= '0' && c <= '9') || static_cast<unsigned char>(c) >= 0x80;
}

std::vector<Token> tagmend::tokenize(boost::string_ref text)
{
    std::vector<Token> r;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isTokenChar(text[i])) {
            ++i;
            continue;
        }
        std::size_t beg = i;
        while (i < text.size() && isTokenChar(text[i]))
            ++i;
        r.push_back({static_cast<unsigned>(beg), static_cast<unsigned>(i)});
    }
    return r;
}

static std::string tokenKey(boost::string_ref text, Token const& tok)
{
    return boost::algorithm::to_lower_copy(
        text.substr(tok.begin, tok.end - tok.begin).to_string(),
        std::locale::classic());
}

PhraseMatcher::PhraseMatcher()
    : m_nodes(1, Node{{}, std::string::npos})
{ }

bool PhraseMatcher::addName(boost::string_ref name)
{
    std::vector<Token> tokens = tokenize(name);
    if (tokens.empty())
        return false;
    std::size_t node = 0;
    for (Token const& tok : tokens) {
        std::string key = tokenKey(name, tok);
        auto it = m_nodes[node].children.find(key);
        if (it != m_nodes[node].children.end()) {
            node = it->second;
        } else {
            std::size_t child = m_nodes.size();
            // Insert before push_back: push_back invalidates m_nodes[node].
            m_nodes[node].children.insert({std::move(key), child});
            m_nodes.push_back({{}, std::string::npos});
            node = child;
        }
    }
    if (m_nodes[node].nameIdx != std::string::npos)
        return false;
    m_nodes[node].nameIdx = m_names.size();
    m_names.push_back(name.to_string());
    return true;
}

std::size_t PhraseMatcher::loadDictionary(std::istream& in)
{
    std::size_t nAdded = 0;
    std::string line;
    while (std::getline(in, line)) {
        boost::algorithm::trim(line, std::locale::classic());
        if (line.empty() || line[0] == '#')
            continue;
        if (addName(line))
            ++nAdded;
    }
    return nAdded;
}

std::vector<PhraseMatch> PhraseMatcher::findMatches(
    boost::string_ref text) const
{
    std::vector<Token> tokens = tokenize(text);
    std::vector<std::string> keys;
    keys.reserve(tokens.size());
    for (Token const& tok : tokens)
        keys.push_back(tokenKey(text, tok));

    std::vector<PhraseMatch> r;
    std::vector<PhraseMatch> fromHere;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        fromHere.clear();
        std::size_t node = 0;
        for (std::size_t j = i; j < tokens.size(); ++j) {
            auto it = m_nodes[node].children.find(keys[j]);
            if (it == m_nodes[node].children.end())
                break;
            node = it->second;
            if (m_nodes[node].nameIdx != std::string::npos) {
                fromHere.push_back(
                    {tokens[i].begin, tokens[j].end, m_nodes[node].nameIdx});
            }
        }
        // Longest first.
        r.insert(r.end(), fromHere.rbegin(), fromHere.rend());
    }
    return r;
}
