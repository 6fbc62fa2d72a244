/**
 * Sequence providers: in-memory FASTA and faidx-indexed FASTA
 */

#include "varnote.hpp"
#include "file_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <mutex>
#include <cstdlib>
#include <zlib.h>

// Indexed FASTA support via htslib (optional - compile with -DHAVE_HTSLIB)
#ifdef HAVE_HTSLIB
#include <htslib/faidx.h>
#endif

namespace varnote {

// ============================================================================
// ReferenceGenome implementation
// ============================================================================

struct ReferenceGenome::Impl {
    std::unordered_map<std::string, std::string> sequences;
    std::string fasta_path;

    void add(const std::string& name, std::string seq) {
        if (name.empty()) return;
        std::transform(seq.begin(), seq.end(), seq.begin(), ::toupper);
        sequences[normalize_chrom(name)] = std::move(seq);
    }

    // Header line up to the first whitespace, without '>'
    static std::string header_name(const std::string& line) {
        size_t end = line.find_first_of(" \t");
        return line.substr(1, end == std::string::npos ? std::string::npos : end - 1);
    }
};

ReferenceGenome::ReferenceGenome(InMemory) : pimpl_(std::make_unique<Impl>()) {}

ReferenceGenome::ReferenceGenome(const std::string& fasta_path)
    : pimpl_(std::make_unique<Impl>()) {

    pimpl_->fasta_path = fasta_path;

    log(LogLevel::INFO, "Loading reference genome from: " + fasta_path);

    // gzopen reads plain files transparently
    gzFile gz = gzopen(fasta_path.c_str(), "rb");
    if (!gz) {
        throw std::runtime_error("Cannot open FASTA file: " + fasta_path);
    }

    std::string current_chrom;
    std::string current_seq;
    std::string line;
    char buffer[8192];

    while (gzgets(gz, buffer, sizeof(buffer)) != nullptr) {
        line = buffer;
        // Lines longer than the buffer arrive in pieces
        while (!line.empty() && line.back() != '\n' && !gzeof(gz)) {
            if (gzgets(gz, buffer, sizeof(buffer)) == nullptr) break;
            line += buffer;
        }
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }

        if (line.empty()) continue;

        if (line[0] == '>') {
            pimpl_->add(current_chrom, std::move(current_seq));
            current_chrom = Impl::header_name(line);
            current_seq.clear();
        } else {
            current_seq += line;
        }
    }

    pimpl_->add(current_chrom, std::move(current_seq));
    gzclose(gz);

    if (pimpl_->sequences.empty()) {
        throw std::runtime_error("No sequences found in FASTA file: " + fasta_path);
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(pimpl_->sequences.size()) + " sequences");
}

std::unique_ptr<ReferenceGenome> ReferenceGenome::from_sequences(
    const std::vector<std::pair<std::string, std::string>>& sequences) {

    auto genome = std::make_unique<ReferenceGenome>(InMemory{});
    for (const auto& [name, seq] : sequences) {
        genome->pimpl_->add(name, seq);
    }
    return genome;
}

ReferenceGenome::~ReferenceGenome() = default;

std::string ReferenceGenome::fetch(const std::string& region, int start, int end) const {
    auto it = pimpl_->sequences.find(normalize_chrom(region));
    if (it == pimpl_->sequences.end()) {
        throw CoordinateError("Unknown sequence region: " + region);
    }

    const std::string& seq = it->second;
    if (start < 1 || end < start || end > static_cast<int>(seq.length())) {
        throw CoordinateError("Cannot fetch " + region + ":" + std::to_string(start) + "-" +
                              std::to_string(end) + " (region length " +
                              std::to_string(seq.length()) + ")");
    }

    return seq.substr(start - 1, end - start + 1);
}

bool ReferenceGenome::has_region(const std::string& region) const {
    return pimpl_->sequences.count(normalize_chrom(region)) > 0;
}

int ReferenceGenome::region_length(const std::string& region) const {
    auto it = pimpl_->sequences.find(normalize_chrom(region));
    return (it != pimpl_->sequences.end()) ? static_cast<int>(it->second.length()) : 0;
}

size_t ReferenceGenome::region_count() const {
    return pimpl_->sequences.size();
}

// ============================================================================
// IndexedFastaReader implementation
// ============================================================================

#ifdef HAVE_HTSLIB

struct IndexedFastaReader::Impl {
    faidx_t* fai = nullptr;
    // faidx shares one file handle between queries
    mutable std::mutex mutex;
    std::string fasta_path;

    ~Impl() {
        if (fai) fai_destroy(fai);
    }

    // Try the name as given, then with/without "chr"
    std::string resolve(const std::string& region) const {
        if (faidx_has_seq(fai, region.c_str())) return region;
        std::string stripped = normalize_chrom(region);
        if (faidx_has_seq(fai, stripped.c_str())) return stripped;
        std::string prefixed = "chr" + stripped;
        if (faidx_has_seq(fai, prefixed.c_str())) return prefixed;
        return "";
    }
};

IndexedFastaReader::IndexedFastaReader(const std::string& fasta_path)
    : pimpl_(std::make_unique<Impl>()) {

    pimpl_->fasta_path = fasta_path;

    // Builds the .fai (and .gzi) index when missing
    pimpl_->fai = fai_load(fasta_path.c_str());
    if (!pimpl_->fai) {
        log(LogLevel::ERROR, "Cannot load or build faidx index for: " + fasta_path);
        return;
    }

    log(LogLevel::INFO, "Opened indexed FASTA: " + fasta_path + " (" +
        std::to_string(faidx_nseq(pimpl_->fai)) + " sequences)");
}

IndexedFastaReader::~IndexedFastaReader() = default;

std::string IndexedFastaReader::fetch(const std::string& region, int start, int end) const {
    if (!pimpl_->fai) {
        throw CoordinateError("Indexed FASTA not available: " + pimpl_->fasta_path);
    }

    std::lock_guard<std::mutex> lock(pimpl_->mutex);

    std::string name = pimpl_->resolve(region);
    if (name.empty()) {
        throw CoordinateError("Unknown sequence region: " + region);
    }

    int length = faidx_seq_len(pimpl_->fai, name.c_str());
    if (start < 1 || end < start || end > length) {
        throw CoordinateError("Cannot fetch " + region + ":" + std::to_string(start) + "-" +
                              std::to_string(end) + " (region length " +
                              std::to_string(length) + ")");
    }

    hts_pos_t fetched = 0;
    char* seq = faidx_fetch_seq64(pimpl_->fai, name.c_str(), start - 1, end - 1, &fetched);
    if (!seq || fetched != end - start + 1) {
        free(seq);
        throw CoordinateError("faidx fetch failed for " + region + ":" +
                              std::to_string(start) + "-" + std::to_string(end));
    }

    std::string result(seq, fetched);
    free(seq);
    return to_upper(result);
}

bool IndexedFastaReader::has_region(const std::string& region) const {
    if (!pimpl_->fai) return false;
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->resolve(region).empty();
}

int IndexedFastaReader::region_length(const std::string& region) const {
    if (!pimpl_->fai) return 0;
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    std::string name = pimpl_->resolve(region);
    if (name.empty()) return 0;
    int length = faidx_seq_len(pimpl_->fai, name.c_str());
    return length < 0 ? 0 : length;
}

bool IndexedFastaReader::is_valid() const {
    return pimpl_->fai != nullptr;
}

#else  // No HTSLIB

struct IndexedFastaReader::Impl {
    std::string fasta_path;
};

IndexedFastaReader::IndexedFastaReader(const std::string& fasta_path)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->fasta_path = fasta_path;
    log(LogLevel::WARNING, "IndexedFastaReader requires htslib. Build with -DHAVE_HTSLIB");
}

IndexedFastaReader::~IndexedFastaReader() = default;

std::string IndexedFastaReader::fetch(const std::string& region, int start, int end) const {
    throw CoordinateError("Indexed FASTA not available (built without htslib): " +
                          region + ":" + std::to_string(start) + "-" + std::to_string(end));
}

bool IndexedFastaReader::has_region(const std::string&) const { return false; }
int IndexedFastaReader::region_length(const std::string&) const { return 0; }
bool IndexedFastaReader::is_valid() const { return false; }

#endif  // HAVE_HTSLIB

} // namespace varnote
