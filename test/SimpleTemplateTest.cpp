#include "SimpleTemplate.hpp"

#include <boost/variant/variant.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tagmend;

namespace {

std::string render(SimpleTemplate const& tpl, SimpleTemplate::Context const& ctx)
{
    std::ostringstream out;
    tpl.writeTo(out, ctx);
    return out.str();
}

} // anonymous namespace

TEST(SimpleTemplateTest, SubstitutesPlaceholders) {
    SimpleTemplate tpl("Hello @@name@@, @@name@@@@punct@@");
    EXPECT_EQ(tpl.placeholders(),
        (std::vector<std::string>{"name", "name", "punct"}));
    SimpleTemplate::Context ctx;
    ctx["name"] = std::string("Ada");
    ctx["punct"] = std::string("!");
    EXPECT_EQ(render(tpl, ctx), "Hello Ada, Ada!");
}

TEST(SimpleTemplateTest, NoPlaceholders) {
    SimpleTemplate tpl("plain text");
    EXPECT_TRUE(tpl.placeholders().empty());
    EXPECT_EQ(render(tpl, {}), "plain text");
}

TEST(SimpleTemplateTest, UnterminatedMarkerIsLiteral) {
    SimpleTemplate tpl("a @@b@@ c @@d");
    EXPECT_EQ(tpl.placeholders(), (std::vector<std::string>{"b"}));
    SimpleTemplate::Context ctx;
    ctx["b"] = std::string("B");
    EXPECT_EQ(render(tpl, ctx), "a B c @@d");
}

TEST(SimpleTemplateTest, CallbackValues) {
    SimpleTemplate tpl("[@@x@@]");
    SimpleTemplate::Context ctx;
    ctx["x"] = SimpleTemplate::ValCallback(
        [] (std::ostream& o) { o << 42; });
    EXPECT_EQ(render(tpl, ctx), "[42]");
}

TEST(SimpleTemplateTest, MissingValueThrows) {
    SimpleTemplate tpl("a @@x@@ b");
    std::ostringstream out;
    try {
        tpl.writeTo(out, {});
        FAIL() << "Missing value accepted";
    } catch (std::runtime_error const& e) {
        EXPECT_STREQ(e.what(), "No value for known placeholder @@x@@.");
    }
    EXPECT_EQ(out.str(), "a ");
}

TEST(SimpleTemplateTest, CheckPlaceholdersNamesUnknownKey) {
    SimpleTemplate tpl("@@file@@ @@bogus@@");
    try {
        tpl.checkPlaceholders({"file", "name"});
        FAIL() << "Unknown placeholder accepted";
    } catch (std::runtime_error const& e) {
        EXPECT_STREQ(e.what(), "Unknown template placeholder @@bogus@@.");
    }
    EXPECT_NO_THROW(tpl.checkPlaceholders({"bogus", "file"}));
}
