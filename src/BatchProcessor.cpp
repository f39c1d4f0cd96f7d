#include "BatchProcessor.hpp"

#include "output.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/io/ios_state.hpp>

#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

using namespace tagmend;

std::string tagmend::getFileContents(fs::path const& fname)
{
    fs::ifstream in(fname, std::ios::in | std::ios::binary);
    if (!in)
        throw std::runtime_error("Could not open " + fname.string());
    in.exceptions(std::ios::badbit);
    std::ostringstream contents;
    try {
        contents << in.rdbuf();
    } catch (std::ios::failure const& e) {
        throw std::runtime_error(
            "Error reading " + fname.string() + ": " + e.what());
    }
    return contents.str();
}

BatchProcessor::BatchProcessor(
    PhraseMatcher const& matcher,
    SimpleTemplate const& listingTpl,
    BatchOptions const& opts,
    std::ostream& listingOut,
    std::ostream& log)
    : m_matcher(matcher)
    , m_listingTpl(listingTpl)
    , m_opts(opts)
    , m_listingOut(listingOut)
    , m_log(log)
    , m_stats()
    , m_nFailed(0)
{ }

fs::path BatchProcessor::dstPath(fs::path const& fname) const
{
    // Keep the directory structure so that "a/doc.xml" and "b/doc.xml" do
    // not collide. ".." must not leave outDir.
    fs::path r = m_opts.outDir;
    for (fs::path const& part : fname.lexically_normal().relative_path()) {
        if (part.string() == "..")
            r /= "__";
        else if (part.string() != ".")
            r /= part;
    }
    r += ".tagged";
    return r;
}

void BatchProcessor::checkDistinctOutputs(
    std::vector<fs::path> const& fnames) const
{
    if (m_opts.list)
        return;
    std::unordered_map<std::string, fs::path const*> seen;
    for (fs::path const& fname : fnames) {
        auto inserted = seen.insert({dstPath(fname).string(), &fname});
        if (!inserted.second) {
            throw std::runtime_error(
                "Inputs " + inserted.first->second->string() + " and "
                + fname.string() + " would both be written to "
                + inserted.first->first);
        }
    }
}

bool BatchProcessor::processFile(fs::path const& fname, float pct)
{
    {
        std::lock_guard<std::mutex> lock(m_mut);
        boost::io::ios_all_saver saver(m_log);
        m_log.flags(m_log.flags() | std::ios::fixed);
        m_log.precision(2);
        m_log << '[' << std::setw(6) << pct << "%]: " << fname.string()
              << "...\n";
    }

    // Collected separately so that lines of concurrently processed files do
    // not interleave.
    std::ostringstream diag;
    bool ok = true;
    try {
        processText(fname, getFileContents(fname), diag);
    } catch (std::runtime_error const& e) {
        diag << "Error processing " << fname.string() << ": " << e.what()
             << '\n';
        ok = false;
    }

    std::lock_guard<std::mutex> lock(m_mut);
    m_log << diag.str();
    if (!ok)
        ++m_nFailed;
    return ok;
}

void BatchProcessor::processText(
    fs::path const& fname, std::string const& text, std::ostream& diag)
{
    TaggedDocument doc = annotateDocument(
        text, m_opts.dialect, m_matcher, m_opts.verbose ? &diag : nullptr);

    if (m_opts.list) {
        std::ostringstream listing;
        writeSpanListing(
            listing, m_listingTpl, fname.string(), text, doc, m_matcher);
        std::lock_guard<std::mutex> lock(m_mut);
        m_listingOut << listing.str();
        m_stats += doc.stats;
        return;
    }

    fs::path dst = dstPath(fname);
    fs::ofstream outfile;
    try {
        fs::create_directories(dst.parent_path());
        outfile.exceptions(std::ios::badbit | std::ios::failbit);
        outfile.open(dst, std::ios::binary);
        writeAnnotated(
            outfile, text, doc, m_matcher, m_opts.markElement, diag);
    } catch (std::ios::failure const& e) {
        throw std::runtime_error(
            "Error writing to or opening " + dst.string() + ": " + e.what());
    }
    std::lock_guard<std::mutex> lock(m_mut);
    m_stats += doc.stats;
}

AnnotationStats BatchProcessor::stats() const
{
    std::lock_guard<std::mutex> lock(m_mut);
    return m_stats;
}

unsigned BatchProcessor::nFailed() const
{
    std::lock_guard<std::mutex> lock(m_mut);
    return m_nFailed;
}

void BatchProcessor::writeSummary(unsigned nFiles) const
{
    boost::io::ios_all_saver saver(m_log);
    m_log << "Processed " << nFiles << " files";
    if (m_nFailed != 0)
        m_log << " (" << m_nFailed << " failed)";
    m_log << ": " << m_stats.nCandidates << " candidates, "
          << m_stats.nCorrected << " corrected, "
          << m_stats.nUnalignable << " unalignable";
    if (m_stats.nCandidates != 0) {
        m_log.flags(m_log.flags() | std::ios::fixed);
        m_log.precision(1);
        m_log << " (" << 100.0 * m_stats.nCorrected / m_stats.nCandidates
              << "% aligned)";
    }
    m_log << ".\n";
}
