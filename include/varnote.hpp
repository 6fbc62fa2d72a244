/**
 * varnote - Variant Notation and QC Library
 *
 * Core types shared by every component: variants, reference frames,
 * sequence providers, error types and logging.
 *
 * Required data files (CLI only):
 * - FASTA reference genome file (plain, gzipped, or faidx-indexed)
 * - Optional: transcript table and per-transcript consequence table
 */

#ifndef VARNOTE_HPP
#define VARNOTE_HPP

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

namespace varnote {

// ============================================================================
// Errors
// ============================================================================

/**
 * Base class for all library errors
 */
class VarnoteError : public std::runtime_error {
public:
    explicit VarnoteError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Sequence could not be retrieved for a span, or a position lies outside
 * the feature it is being described against.
 */
class CoordinateError : public VarnoteError {
public:
    explicit CoordinateError(const std::string& message) : VarnoteError(message) {}
};

/**
 * Position upstream or downstream of every exon of a transcript
 */
class OutOfTranscriptBoundsError : public CoordinateError {
public:
    explicit OutOfTranscriptBoundsError(const std::string& message) : CoordinateError(message) {}
};

/**
 * Reference frame that notation cannot be produced in (protein)
 */
class UnsupportedFrameError : public VarnoteError {
public:
    explicit UnsupportedFrameError(const std::string& message) : VarnoteError(message) {}
};

/**
 * Allele text that is not clean nucleotide sequence where one is required
 */
class MalformedAlleleError : public VarnoteError {
public:
    explicit MalformedAlleleError(const std::string& message) : VarnoteError(message) {}
};

// ============================================================================
// Variant
// ============================================================================

/**
 * A sequence change on a genomic region.
 *
 * Coordinates are 1-based and inclusive. An insertion between two bases is
 * represented with end = start - 1.
 */
struct Variant {
    std::string seq_region;         // Sequence region (chromosome) name
    int start = 0;
    int end = 0;
    int strand = 1;                 // +1 or -1
    std::string allele_string;      // e.g. "A/T", "-/CA", "G/A/C"
    std::string name;
    std::string source;
    std::string validation_code;    // Comma-joined validation state names, e.g. "cluster,hapmap"

    /**
     * Split allele string into individual alleles (reference first)
     */
    std::vector<std::string> alleles() const;

    /**
     * Get the reference allele, always the first one.
     * Accepts '/', '|' and '\' as separators.
     */
    std::string ref_allele_string() const;

    bool is_insertion() const { return static_cast<long long>(end) == static_cast<long long>(start) - 1; }

    /**
     * end >= start - 1 and strand is +1 or -1
     */
    bool has_valid_coordinates() const;

    /**
     * Identifier for log messages: name if set, otherwise region:start-end
     */
    std::string display_id() const;
};

/**
 * Coordinate space a notation is expressed in
 */
enum class ReferenceFrame {
    GENOMIC,    // g.
    CDNA,       // c. (or unprefixed for non-coding transcripts)
    PROTEIN     // p. - recognised but not supported
};

/**
 * Parse a numbering scheme letter ("g", "c", "p")
 * @throws UnsupportedFrameError for anything else
 */
ReferenceFrame parse_reference_frame(const std::string& scheme);

/**
 * Get numbering scheme letter for a frame
 */
std::string reference_frame_to_string(ReferenceFrame frame);

// ============================================================================
// Sequence utilities
// ============================================================================

/**
 * Complement a single IUPAC nucleotide, preserving case.
 * Characters without a complement ('-', 'N', digits) are returned unchanged.
 */
char complement_base(char base);

/**
 * Reverse complement a nucleotide string (IUPAC aware, gaps preserved)
 */
std::string reverse_complement(const std::string& seq);

/**
 * Upper-case copy of a string
 */
std::string to_upper(const std::string& str);

// ============================================================================
// Sequence providers
// ============================================================================

/**
 * Source of reference sequence.
 *
 * Implementations must be safe for concurrent calls to fetch() once
 * constructed.
 */
class SequenceProvider {
public:
    virtual ~SequenceProvider() = default;

    /**
     * Get forward-strand sequence
     * @param region Sequence region name
     * @param start 1-based start position
     * @param end 1-based end position (inclusive)
     * @return Uppercase sequence string of length end - start + 1
     * @throws CoordinateError if the region is unknown or the range invalid
     */
    virtual std::string fetch(const std::string& region, int start, int end) const = 0;

    /**
     * Check if a region exists
     */
    virtual bool has_region(const std::string& region) const = 0;

    /**
     * Get region length, 0 if unknown
     */
    virtual int region_length(const std::string& region) const = 0;
};

/**
 * FASTA reference genome held in memory
 */
class ReferenceGenome : public SequenceProvider {
    // Restricts the empty constructor to from_sequences()
    struct InMemory { explicit InMemory() = default; };

public:
    /**
     * Load reference genome from FASTA file
     * @param fasta_path Path to .fa or .fa.gz file
     */
    explicit ReferenceGenome(const std::string& fasta_path);

    /**
     * Build from named sequences already in memory
     */
    static std::unique_ptr<ReferenceGenome> from_sequences(
        const std::vector<std::pair<std::string, std::string>>& sequences);

    explicit ReferenceGenome(InMemory);
    ~ReferenceGenome() override;

    std::string fetch(const std::string& region, int start, int end) const override;
    bool has_region(const std::string& region) const override;
    int region_length(const std::string& region) const override;

    /**
     * Number of sequences loaded
     */
    size_t region_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * faidx-indexed FASTA reader for on-disk queries.
 * Requires htslib; without it is_valid() is always false.
 */
class IndexedFastaReader : public SequenceProvider {
public:
    /**
     * Open a FASTA file, building the .fai index if missing
     * @param fasta_path Path to .fa or bgzipped .fa.gz file
     */
    explicit IndexedFastaReader(const std::string& fasta_path);
    ~IndexedFastaReader() override;

    IndexedFastaReader(const IndexedFastaReader&) = delete;
    IndexedFastaReader& operator=(const IndexedFastaReader&) = delete;

    std::string fetch(const std::string& region, int start, int end) const override;
    bool has_region(const std::string& region) const override;
    int region_length(const std::string& region) const override;

    bool is_valid() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

} // namespace varnote

#endif // VARNOTE_HPP
