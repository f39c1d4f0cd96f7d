#include "BatchProcessor.hpp"
#include "PhraseMatcher.hpp"
#include "SimpleTemplate.hpp"
#include "cmdline.hpp"
#include "output.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tagmend;

static PhraseMatcher loadDictionaries(std::vector<char const*> const& fnames)
{
    PhraseMatcher matcher;
    for (char const* fname : fnames) {
        fs::ifstream in(fname);
        if (!in)
            throw std::runtime_error(std::string("Could not open ") + fname);
        std::size_t n = matcher.loadDictionary(in);
        if (in.bad())
            throw std::runtime_error(std::string("Error reading ") + fname);
        std::clog << "Loaded " << n << " names from " << fname << ".\n";
    }
    if (matcher.size() == 0)
        throw std::runtime_error("Dictionaries contain no names.");
    return matcher;
}

static void processAll(
    BatchProcessor& processor,
    std::vector<char const*> const& inputFiles,
    unsigned nThreads)
{
    unsigned const nFiles = static_cast<unsigned>(inputFiles.size());
    if (nThreads > nFiles)
        nThreads = nFiles;

    std::atomic_uint sharedFileIdx(0);
    std::atomic_bool cancel(false);
    auto const worker = [&]() {
        while (!cancel) {
            unsigned fileIdx = sharedFileIdx++;
            if (fileIdx >= nFiles)
                return;
            processor.processFile(
                inputFiles[fileIdx],
                static_cast<float>(fileIdx) / nFiles * 100);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(nThreads - 1);
    if (nThreads > 1)
        std::clog << "Using " << nThreads << " threads.\n";
    try {
        for (unsigned i = 0; i < nThreads - 1; ++i)
            threads.emplace_back(worker);
        worker();
    } catch (...) {
        cancel = true;
        for (auto& th : threads)
            th.join();
        throw;
    }
    for (auto& th : threads)
        th.join();
}

static int executeCmdLine(CmdLineArgs const& args)
{
    SimpleTemplate tpl(kDefaultListingTemplate);
    if (args.templateFile)
        tpl = SimpleTemplate(getFileContents(args.templateFile));
    tpl.checkPlaceholders(listingPlaceholders());

    PhraseMatcher matcher = loadDictionaries(args.dictionaryFiles);

    BatchOptions opts {
        /*dialect=*/ args.html ? MarkupDialect::html : MarkupDialect::xml,
        /*outDir=*/ args.outDir,
        /*markElement=*/ args.markElement,
        /*list=*/ args.list,
        /*verbose=*/ args.verbose};
    if (!args.list)
        fs::create_directories(opts.outDir);

    BatchProcessor processor(matcher, tpl, opts, std::cout, std::clog);
    processor.checkDistinctOutputs(
        std::vector<fs::path>(args.inputFiles.begin(), args.inputFiles.end()));
    processAll(processor, args.inputFiles, args.nThreads);
    processor.writeSummary(static_cast<unsigned>(args.inputFiles.size()));
    return processor.nFailed() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    CmdLineArgs args = {};
    try {
        args = CmdLineArgs::parse(argc, argv);
    } catch (std::runtime_error const& e) {
        std::cerr << e.what() << '\n' << kUsage;
        return EXIT_FAILURE;
    }
    try {
        return executeCmdLine(args);
    } catch (std::exception const& e) {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
