/**
 * File Format Parsers
 *
 * Line-level readers for the tool's input files:
 * - LineReader: plain or gzip-compressed text, one line at a time
 * - Ensembl default variant format: CHR START END ALLELES STRAND [NAME] [SOURCE]
 * - Transcript table: transcript_id gene_id seq_region strand exon_starts
 *   exon_ends coding_start coding_end
 * - Consequence table: variant_name transcript_id gene_id TAG[,TAG...]
 */

#ifndef FILE_PARSERS_HPP
#define FILE_PARSERS_HPP

#include "varnote.hpp"
#include "coordinate_mapper.hpp"
#include "consequence.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace varnote {

/**
 * Normalize chromosome name (remove "chr" prefix for consistency)
 */
inline std::string normalize_chrom(const std::string& chrom) {
    if (chrom.length() > 3 && chrom.substr(0, 3) == "chr") {
        return chrom.substr(3);
    }
    return chrom;
}

// ============================================================================
// Line reader
// ============================================================================

/**
 * Reads text files line by line. gzip input is detected from the file
 * content, so plain files work too.
 */
class LineReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit LineReader(const std::string& path);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * Read the next line without its line terminator
     * @return false at end of file
     */
    bool next(std::string& line);

    /**
     * 1-based number of the last line returned
     */
    size_t line_number() const { return line_number_; }

    const std::string& path() const { return path_; }

private:
    void* gz_;  // gzFile
    std::string path_;
    size_t line_number_ = 0;
};

// ============================================================================
// Record parsers
// ============================================================================

/**
 * Result of parsing one variant line
 */
struct VariantParseResult {
    bool valid = false;
    std::string error_message;
    Variant variant;
};

/**
 * Parse Ensembl default format line
 * Format: CHR START END ALLELES STRAND [NAME] [SOURCE] [VALIDATION]
 * START must be at least 1.
 * Examples:
 *   1 100 100 A/T +
 *   7 140753336 140753336 A/T 1 rs113488022
 *   X 101 100 -/CA -1 PC_12 PhenCode
 *   2 5 5 G/C 1 rs42 dbSNP cluster,hapmap
 */
VariantParseResult parse_variant_line(const std::string& line);

/**
 * Parse a strand field: "1", "+1", "+" or "-1", "-"
 */
std::optional<int> parse_strand(const std::string& field);

/**
 * Result of parsing one transcript table line
 */
struct TranscriptParseResult {
    bool valid = false;
    std::string error_message;
    TranscriptModel transcript;
};

/**
 * Parse a tab-separated transcript table line. Exon starts and ends are
 * comma-separated lists; "." marks an absent coding bound.
 */
TranscriptParseResult parse_transcript_line(const std::string& line);

/**
 * Result of parsing one consequence table line
 */
struct ConsequenceParseResult {
    bool valid = false;
    std::string error_message;
    std::string variant_name;
    TranscriptConsequence consequence;
};

/**
 * Parse a tab-separated consequence table line
 */
ConsequenceParseResult parse_consequence_line(const std::string& line);

/**
 * Per-transcript consequences keyed by variant name
 */
using ConsequenceTable = std::unordered_map<std::string, std::vector<TranscriptConsequence>>;

/**
 * Load a consequence table file. Malformed lines are logged and skipped.
 * @throws std::runtime_error if the file cannot be opened
 */
ConsequenceTable load_consequence_table(const std::string& path);

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Parse a line into fields by delimiter
 */
std::vector<std::string> split_line(const std::string& line, char delim = '\t');

/**
 * Split on runs of spaces and tabs
 */
std::vector<std::string> split_whitespace(const std::string& line);

/**
 * Parse a whole field as an integer
 */
std::optional<int> parse_int(const std::string& field);

/**
 * Check if a file exists
 */
bool file_exists(const std::string& path);

} // namespace varnote

#endif // FILE_PARSERS_HPP
