#ifndef TAGMEND_SIMPLETEMPLATE_HPP_INCLUDED
#define TAGMEND_SIMPLETEMPLATE_HPP_INCLUDED

#include <boost/utility/string_ref.hpp>
#include <boost/variant/variant_fwd.hpp>

#include <functional>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagmend {

// Text with @@key@@ placeholders. An unterminated @@ is literal text.
class SimpleTemplate {
public:
    explicit SimpleTemplate(boost::string_ref text);

    using ValCallback = std::function<void(std::ostream&)>;
    using Val = boost::variant<std::string, ValCallback>;
    using Context = std::unordered_map<std::string, Val>;

    std::vector<std::string> const& placeholders() const noexcept
    {
        return m_insertionKeys;
    }

    // Throws std::runtime_error naming the first placeholder that is not in
    // knownKeys.
    void checkPlaceholders(std::vector<std::string> const& knownKeys) const;

    void writeTo(std::ostream& out, Context const& ctx) const;

private:
    std::vector<std::string> m_literals;
    std::vector<std::string> m_insertionKeys;
};

} // namespace tagmend

#endif // TAGMEND_SIMPLETEMPLATE_HPP_INCLUDED
