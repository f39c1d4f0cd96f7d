#ifndef TAGMEND_CMDLINE_HPP_INCLUDED
#define TAGMEND_CMDLINE_HPP_INCLUDED

#include <vector>

namespace tagmend {

struct CmdLineArgs {
    std::vector<char const*> inputFiles;
    std::vector<char const*> dictionaryFiles;
    char const* outDir;
    char const* templateFile;
    char const* markElement;

    unsigned nThreads;

    bool html;
    bool list;
    bool verbose;

    static CmdLineArgs parse(int argc, char const* const* argv);
};

extern char const kUsage[];

} // namespace tagmend

#endif // TAGMEND_CMDLINE_HPP_INCLUDED
