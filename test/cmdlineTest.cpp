#include "cmdline.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tagmend;

namespace {

class CmdLineTest : public ::testing::Test {
protected:
    CmdLineArgs parse(std::initializer_list<char const*> args)
    {
        argv.assign(1, "tagmend");
        argv.insert(argv.end(), args.begin(), args.end());
        argv.push_back(nullptr);
        return CmdLineArgs::parse(static_cast<int>(argv.size() - 1), argv.data());
    }

    // Expects a parse error whose message contains expectedMsg.
    void expectError(
        std::initializer_list<char const*> args, std::string const& expectedMsg)
    {
        try {
            parse(args);
            ADD_FAILURE() << "Accepted bad command line";
        } catch (std::runtime_error const& e) {
            EXPECT_NE(std::string(e.what()).find(expectedMsg), std::string::npos)
                << e.what();
        }
    }

    std::vector<char const*> argv;
};

} // anonymous namespace

TEST_F(CmdLineTest, Defaults) {
    CmdLineArgs args = parse({"-d", "names.txt", "in.xml"});
    ASSERT_EQ(args.dictionaryFiles.size(), 1u);
    EXPECT_STREQ(args.dictionaryFiles[0], "names.txt");
    ASSERT_EQ(args.inputFiles.size(), 1u);
    EXPECT_STREQ(args.inputFiles[0], "in.xml");
    EXPECT_STREQ(args.outDir, ".");
    EXPECT_STREQ(args.markElement, "mark");
    EXPECT_EQ(args.templateFile, nullptr);
    EXPECT_GE(args.nThreads, 1u);
    EXPECT_FALSE(args.html);
    EXPECT_FALSE(args.list);
    EXPECT_FALSE(args.verbose);
}

TEST_F(CmdLineTest, AllAnnotationOptions) {
    CmdLineArgs args = parse({
        "-d", "a.txt", "a.html", "-d", "b.txt", "-o", "out", "--html",
        "--mark", "span", "-j", "3", "-v", "b.html"});
    EXPECT_EQ(args.dictionaryFiles.size(), 2u);
    EXPECT_EQ(args.inputFiles.size(), 2u);
    EXPECT_STREQ(args.outDir, "out");
    EXPECT_STREQ(args.markElement, "span");
    EXPECT_EQ(args.nThreads, 3u);
    EXPECT_TRUE(args.html);
    EXPECT_TRUE(args.verbose);
}

TEST_F(CmdLineTest, ListingOptions) {
    CmdLineArgs args = parse({"--list", "-t", "tpl.txt", "-d", "n", "in"});
    EXPECT_TRUE(args.list);
    EXPECT_STREQ(args.templateFile, "tpl.txt");
}

TEST_F(CmdLineTest, DoubleDashEndsOptions) {
    CmdLineArgs args = parse({"-d", "n", "--", "-odd.xml", "--html"});
    ASSERT_EQ(args.inputFiles.size(), 2u);
    EXPECT_STREQ(args.inputFiles[0], "-odd.xml");
    EXPECT_STREQ(args.inputFiles[1], "--html");
    EXPECT_FALSE(args.html);
}

TEST_F(CmdLineTest, RejectsBadCommandLines) {
    expectError({}, "Too few arguments");
    expectError({"in.xml"}, "Missing dictionary");
    expectError({"-d", "n"}, "Missing input files");
    expectError({"-d"}, "Missing value for -d");
    expectError({"-d", "n", "-t", "tpl", "in"}, "-t is only valid with --list");
    expectError({"--list", "-o", "out", "-d", "n", "in"}, "not valid with --list");
    expectError({"-d", "n", "-o", "a", "-o", "b", "in"}, "Duplicate option -o");
    expectError({"-d", "n", "--html", "--html", "in"}, "Duplicate option --html");
    expectError({"-d", "n", "-j", "x", "in"}, "Integer expected for -j");
    expectError({"-d", "n", "-j", "-1", "in"}, "must not be negative");
    expectError({"-d", "n", "--bogus", "in"}, "Bad argument --bogus");
    expectError({"-d", "n", "--mark", "1x", "in"}, "Invalid element name");
    expectError({"-d", "n", "--mark", "a b", "in"}, "Invalid element name");
}
