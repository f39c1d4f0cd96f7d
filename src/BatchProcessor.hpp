#ifndef TAGMEND_BATCH_PROCESSOR_HPP_INCLUDED
#define TAGMEND_BATCH_PROCESSOR_HPP_INCLUDED

#include "PhraseMatcher.hpp"
#include "SimpleTemplate.hpp"
#include "annotate.hpp"

#include <boost/filesystem/path.hpp>

#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace tagmend {

namespace fs = boost::filesystem;

struct BatchOptions {
    MarkupDialect dialect;
    fs::path outDir;
    std::string markElement;
    bool list; // Write a span listing instead of annotated documents.
    bool verbose;
};

// Shared by all worker threads. The dictionary and options are read-only
// while processing; output and statistics are guarded by a mutex.
class BatchProcessor {
public:
    BatchProcessor(
        PhraseMatcher const& matcher,
        SimpleTemplate const& listingTpl,
        BatchOptions const& opts,
        std::ostream& listingOut,
        std::ostream& log);

    // Threadsafe. Returns false if the file could not be read, parsed or
    // written; the error has then been logged.
    bool processFile(fs::path const& fname, float pct);

    // outDir followed by fname's normalized relative path, plus ".tagged".
    fs::path dstPath(fs::path const& fname) const;

    // Throws std::runtime_error if two inputs share a destination. Call
    // before processing.
    void checkDistinctOutputs(std::vector<fs::path> const& fnames) const;

    AnnotationStats stats() const;
    unsigned nFailed() const;

    // Not threadsafe!
    void writeSummary(unsigned nFiles) const;

private:
    void processText(
        fs::path const& fname, std::string const& text, std::ostream& diag);

    PhraseMatcher const& m_matcher;
    SimpleTemplate const& m_listingTpl;
    BatchOptions m_opts;
    std::ostream& m_listingOut;
    std::ostream& m_log;

    mutable std::mutex m_mut;
    AnnotationStats m_stats;
    unsigned m_nFailed;
};

// Reads the whole file; throws std::runtime_error on failure.
std::string getFileContents(fs::path const& fname);

} // namespace tagmend

#endif // TAGMEND_BATCH_PROCESSOR_HPP_INCLUDED
