/**
 * HGVS Notation Builder
 *
 * Describes each allele of a variant as an HGVS string relative to a
 * reference feature:
 * - genomic numbering (g.) on the variant's sequence region
 * - cDNA numbering (c.) on a transcript, unprefixed for non-coding ones
 *
 * Supported change types: substitution, insertion, duplication, deletion,
 * deletion-insertion.
 */

#ifndef HGVS_NOTATION_HPP
#define HGVS_NOTATION_HPP

#include "varnote.hpp"
#include "coordinate_mapper.hpp"
#include <string>
#include <vector>
#include <optional>

namespace varnote {

enum class HgvsChangeType {
    SUBSTITUTION,       // A>T
    INSERTION,          // insCA
    DELETION,           // delCA
    DELETION_INSERTION, // delCAinsT
    DUPLICATION         // dupCA
};

/**
 * Get change type name ("substitution", "deletion-insertion", ...)
 */
std::string hgvs_change_type_to_string(HgvsChangeType type);

/**
 * Difference between an allele and the reference, in display coordinates
 */
struct VariantChange {
    HgvsChangeType type = HgvsChangeType::SUBSTITUTION;
    int start = 0;
    int end = 0;
    std::string ref;
    std::string alt;
};

/**
 * Describe how an allele differs from the reference
 *
 * ref_sequence holds the reference bases at [ref_start, ref_end] (1-based
 * within ref_sequence) preceded by upstream context used for duplication
 * detection. An insertion has ref_end = ref_start - 1.
 *
 * @param alt Allele sequence; '-' characters are ignored
 * @param ref_sequence Upstream context followed by the reference bases
 * @param ref_start Start of the reference bases within ref_sequence
 * @param ref_end End of the reference bases within ref_sequence
 * @param display_start First position reported for the reference bases
 * @param display_end Last position reported for the reference bases
 * @return Change description, or nullopt if the allele equals the reference
 * @throws std::invalid_argument if the display and reference intervals
 *         differ in length
 */
std::optional<VariantChange> describe_change(
    const std::string& alt,
    const std::string& ref_sequence,
    int ref_start,
    int ref_end,
    int display_start,
    int display_end
);

/**
 * Single HGVS description of one allele
 */
struct HgvsNotation {
    std::string reference_name;
    std::string numbering;      // "g", "c" or "" for non-coding transcripts
    std::string start;          // Rendered position, e.g. "100", "45+3", "*8"
    std::string end;
    HgvsChangeType type = HgvsChangeType::SUBSTITUTION;
    std::string ref;
    std::string alt;
    std::string allele;         // Allele in reference-feature orientation
    std::string hgvs;
};

/**
 * Render "{name}:{numbering}.{start}[_{end}]{body}".
 * The "." is dropped with an empty numbering, "_{end}" when end equals start.
 */
std::string render_hgvs(
    const std::string& reference_name,
    const std::string& numbering,
    const std::string& start,
    const std::string& end,
    HgvsChangeType type,
    const std::string& ref,
    const std::string& alt
);

/**
 * Notations for all alleles of a variant
 */
struct NotationResult {
    std::vector<HgvsNotation> notations;    // One per distinct allele, input order
    std::vector<std::string> skipped;       // Reasons for alleles that were not described
    std::string error_message;              // Set when the variant cannot be described at all

    bool ok() const { return error_message.empty(); }

    /**
     * Just the HGVS strings
     */
    std::vector<std::string> strings() const;
};

/**
 * Build HGVS notations for every distinct allele of a variant
 *
 * Variants outside the reference feature yield no notations and an
 * error_message rather than an exception.
 *
 * @param variant Variant to describe
 * @param frame GENOMIC or CDNA
 * @param reference_name Name printed before the ':'
 * @param provider Reference sequence source
 * @param transcript Transcript for CDNA numbering
 * @throws UnsupportedFrameError for PROTEIN, or CDNA without a transcript
 */
NotationResult build_notations(
    const Variant& variant,
    ReferenceFrame frame,
    const std::string& reference_name,
    const SequenceProvider& provider,
    const TranscriptModel* transcript = nullptr
);

} // namespace varnote

#endif // HGVS_NOTATION_HPP
