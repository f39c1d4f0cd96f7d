#include "SimpleTemplate.hpp"

#include <boost/assert.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/variant.hpp>

#include <algorithm>
#include <ostream>
#include <stdexcept>

using namespace tagmend;

SimpleTemplate::SimpleTemplate(boost::string_ref text)
{
    static char const rawMarker[] = "@@";
    static boost::string_ref const marker(rawMarker, sizeof(rawMarker) - 1);

    std::string literal;
    auto beg = text.find(marker);
    while (beg != boost::string_ref::npos) {
        literal.append(text.data(), beg);
        text.remove_prefix(beg + marker.size());
        auto end = text.find(marker);
        if (end == boost::string_ref::npos) {
            literal.append(marker.data(), marker.size());
            break;
        }
        m_literals.push_back(std::move(literal));
        literal.clear();
        m_insertionKeys.emplace_back(text.data(), end);
        text.remove_prefix(end + marker.size());
        beg = text.find(marker);
    }
    literal.append(text.data(), text.size());
    m_literals.push_back(std::move(literal));
    BOOST_ASSERT(m_literals.size() == m_insertionKeys.size() + 1);
}

void SimpleTemplate::checkPlaceholders(
    std::vector<std::string> const& knownKeys) const
{
    for (auto const& key : m_insertionKeys) {
        if (std::find(knownKeys.begin(), knownKeys.end(), key)
            == knownKeys.end()
        ) {
            throw std::runtime_error(
                "Unknown template placeholder @@" + key + "@@.");
        }
    }
}

namespace {

// Writes one placeholder value: strings verbatim, callbacks write themselves.
class ValWriter: public boost::static_visitor<> {
public:
    explicit ValWriter(std::ostream& out)
        : m_out(out)
    { }

    void operator()(std::string const& s) const { m_out << s; }
    void operator()(SimpleTemplate::ValCallback const& cb) const
    {
        BOOST_ASSERT(cb);
        cb(m_out);
    }

private:
    std::ostream& m_out;
};

} // anonymous namespace

void SimpleTemplate::writeTo(
    std::ostream& out,
    SimpleTemplate::Context const& ctx) const
{
    ValWriter const writer(out);
    out << m_literals.front();
    for (std::size_t i = 0; i < m_insertionKeys.size(); ++i) {
        std::string const& key = m_insertionKeys[i];
        auto it = ctx.find(key);
        if (it == ctx.end()) {
            // checkPlaceholders() would have caught an unknown key.
            throw std::runtime_error(
                "No value for known placeholder @@" + key + "@@.");
        }
        boost::apply_visitor(writer, it->second);
        out << m_literals[i + 1];
    }
}
