#include "cmdline.hpp"

#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

using namespace tagmend;

char const tagmend::kUsage[] =
    "Usage: tagmend -d DICT [-d DICT...] [-o OUTDIR] [--html] [--mark NAME]\n"
    "               [--list [-t TEMPLATE]] [-j N] [-v] INPUT...\n";

static char const* getOptVal(char const* const* opt)
{
    if (!opt[1])
        throw std::runtime_error("Missing value for " + std::string(opt[0]));
    return opt[1];
}

static void getOptVal(char const* const* opt, char const*& out)
{
    if (out)
        throw std::runtime_error("Duplicate option " + std::string(opt[0]));
    out = getOptVal(opt);
}

static unsigned getUintOptVal(char const* const* opt)
{
    char const* nStr = getOptVal(opt);
    int n;
    try {
        n = std::stoi(nStr);
    } catch (std::exception const& e) {
        throw std::runtime_error(
            std::string("Integer expected for ") + opt[0] + ": " + e.what());
    }
    if (n < 0) {
        throw std::runtime_error(
            std::string("Value for ") + opt[0] + " must not be negative.");
    }
    return static_cast<unsigned>(n);
}

static void setFlag(char const* opt, bool& flag)
{
    if (flag)
        throw std::runtime_error("Duplicate option " + std::string(opt));
    flag = true;
}

static bool isValidElementName(char const* name)
{
    if (!*name)
        return false;
    for (char const* p = name; *p; ++p) {
        char c = *p;
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        bool other = (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!alpha && (p == name || !other))
            return false;
    }
    return true;
}

CmdLineArgs CmdLineArgs::parse(int argc, char const* const* argv)
{
    if (argc < 2)
        throw std::runtime_error("Too few arguments.");
    CmdLineArgs r = {};
    bool nThreadsFound = false;
    for (int i = 1; i < argc; ++i) {
        if (argv[i][0] != '-') {
            r.inputFiles.push_back(argv[i]);
        } else if (!std::strcmp(argv[i], "-d")) {
            r.dictionaryFiles.push_back(getOptVal(argv + i++));
        } else if (!std::strcmp(argv[i], "-o")) {
            getOptVal(argv + i++, r.outDir);
        } else if (!std::strcmp(argv[i], "-t")) {
            getOptVal(argv + i++, r.templateFile);
        } else if (!std::strcmp(argv[i], "--mark")) {
            getOptVal(argv + i++, r.markElement);
        } else if (!std::strcmp(argv[i], "-j")) {
            if (nThreadsFound)
                throw std::runtime_error("Duplicate option -j.");
            r.nThreads = getUintOptVal(argv + i++);
            nThreadsFound = true;
        } else if (!std::strcmp(argv[i], "--html")) {
            setFlag(argv[i], r.html);
        } else if (!std::strcmp(argv[i], "--list")) {
            setFlag(argv[i], r.list);
        } else if (!std::strcmp(argv[i], "-v")) {
            setFlag(argv[i], r.verbose);
        } else if (!std::strcmp(argv[i], "--")) {
            r.inputFiles.insert(r.inputFiles.end(), argv + i + 1, argv + argc);
            break;
        } else {
            throw std::runtime_error(std::string("Bad argument ") + argv[i]);
        }
    }

    if (r.dictionaryFiles.empty())
        throw std::runtime_error("Missing dictionary (-d).");
    if (r.inputFiles.empty())
        throw std::runtime_error("Missing input files.");
    if (r.templateFile && !r.list)
        throw std::runtime_error("-t is only valid with --list.");
    if (r.list && (r.outDir || r.markElement))
        throw std::runtime_error("-o and --mark are not valid with --list.");

    if (!r.outDir)
        r.outDir = ".";
    if (!r.markElement)
        r.markElement = "mark";
    else if (!isValidElementName(r.markElement))
        throw std::runtime_error(
            std::string("Invalid element name for --mark: ") + r.markElement);
    if (r.nThreads == 0)
        r.nThreads = std::thread::hardware_concurrency();
    if (r.nThreads == 0)
        r.nThreads = 1;

    return r;
}
