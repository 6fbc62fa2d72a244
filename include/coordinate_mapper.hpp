/**
 * Coordinate Mapper
 *
 * Converts genomic positions to transcript cDNA coordinates:
 * - exonic positions count along the spliced transcript
 * - intronic positions are anchored on the nearest exon boundary with
 *   a signed offset ("45+3", "46-2")
 * - coding transcripts are rebased on the start codon, with "*" numbering
 *   past the stop codon and no position 0
 */

#ifndef COORDINATE_MAPPER_HPP
#define COORDINATE_MAPPER_HPP

#include <string>
#include <vector>
#include <optional>

namespace varnote {

/**
 * Exon interval, 1-based inclusive genomic coordinates
 */
struct Exon {
    int start;
    int end;

    int length() const { return end - start + 1; }
};

/**
 * Exon structure of a transcript.
 *
 * Exons are kept in ascending genomic order whatever the strand. Coding
 * bounds are in raw cDNA numbering (first transcript base is 1) and are
 * absent for non-coding transcripts.
 */
struct ExonMap {
    std::vector<Exon> exons;
    int strand = 1;
    std::optional<int> coding_start;
    std::optional<int> coding_end;

    bool is_coding() const { return coding_start.has_value(); }

    /**
     * Sort exons by genomic start
     */
    void sort_exons();

    /**
     * Genomic span covered by the exons (first exon start, last exon end)
     */
    int span_start() const;
    int span_end() const;

    /**
     * Length of the spliced transcript
     */
    int cdna_length() const;

    /**
     * Raw cDNA start/end of every exon, indexed like exons
     */
    std::vector<std::pair<int, int>> exon_cdna_ranges() const;
};

/**
 * Transcript model consumed from the transcript table
 */
struct TranscriptModel {
    std::string id;
    std::string gene_id;
    std::string seq_region;
    ExonMap exon_map;

    int strand() const { return exon_map.strand; }

    /**
     * Check if a genomic interval overlaps the transcript span.
     * Insertions (end = start - 1) overlap when the insertion point is
     * inside or on the edge of the span.
     */
    bool overlaps(int start, int end) const;
};

/**
 * Position in cDNA numbering
 */
struct CdnaPosition {
    int coordinate = 0;             // Rebased; negative in the 5' UTR
    bool three_prime_utr = false;   // Rendered with a leading '*'
    int intron_offset = 0;          // + downstream / - upstream of the anchor exon base
    int transcript_position = 0;    // Raw cDNA position of the anchor, for ordering

    /**
     * Render as "76", "-12", "*8", "45+3", "46-2", "*3+1"
     */
    std::string to_string() const;

    /**
     * Order along the transcript
     */
    bool operator<(const CdnaPosition& other) const;
    bool operator==(const CdnaPosition& other) const;
};

/**
 * Map a genomic position to cDNA numbering
 *
 * @param genomic_position 1-based genomic position
 * @param exon_map Exon structure, ascending by genomic start
 * @return Rebased cDNA position
 * @throws OutOfTranscriptBoundsError if the position lies before the first
 *         or after the last exon
 */
CdnaPosition to_cdna(int genomic_position, const ExonMap& exon_map);

} // namespace varnote

#endif // COORDINATE_MAPPER_HPP
