/**
 * Variant Annotator
 *
 * Batch pipeline over a variant file:
 *   prepare (strand + long allele normalization)
 *   -> QC classification
 *   -> genomic and per-transcript cDNA HGVS notation
 *   -> consequence resolution
 *   -> validation states
 *   -> tab-separated QC report
 */

#ifndef VARIANT_ANNOTATOR_HPP
#define VARIANT_ANNOTATOR_HPP

#include "varnote.hpp"
#include "allele_normalizer.hpp"
#include "coordinate_mapper.hpp"
#include "consequence.hpp"
#include "file_parsers.hpp"
#include "hgvs_notation.hpp"
#include "qc_classifier.hpp"
#include "validation_state.hpp"
#include <memory>
#include <string>
#include <vector>

namespace varnote {

/**
 * Transcript table loaded into memory and indexed by sequence region
 */
class TranscriptDatabase {
    // Restricts the empty constructor to from_transcripts()
    struct InMemory { explicit InMemory() = default; };

public:
    /**
     * Load transcripts from a transcript table file
     * @param path Path to .tsv or .tsv.gz file
     */
    explicit TranscriptDatabase(const std::string& path);

    /**
     * Build from transcript models already in memory
     */
    static std::unique_ptr<TranscriptDatabase> from_transcripts(std::vector<TranscriptModel> transcripts);

    explicit TranscriptDatabase(InMemory);
    ~TranscriptDatabase();

    TranscriptDatabase(const TranscriptDatabase&) = delete;
    TranscriptDatabase& operator=(const TranscriptDatabase&) = delete;

    /**
     * Get all transcripts overlapping a region. Insertions (end = start - 1)
     * are matched on their insertion point.
     */
    std::vector<const TranscriptModel*> get_transcripts_in_region(
        const std::string& seq_region, int start, int end) const;

    /**
     * Get transcript by ID
     */
    const TranscriptModel* get_transcript(const std::string& transcript_id) const;

    size_t transcript_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * Annotator settings
 */
struct AnnotatorConfig {
    size_t max_allele_length = DEFAULT_MAX_ALLELE_LENGTH;
    bool cdna_notation = true;          // Add c. notation for overlapping transcripts
    bool run_qc = true;
    bool skip_duplicate_names = true;   // Drop names seen more than once in the input
    std::string reference_name;         // g. reference name; seq_region when empty
};

/**
 * Annotation result for one variant
 */
struct AnnotatedVariant {
    Variant variant;                        // After prepare()
    bool qc_checked = false;
    QcFailureSet qc;
    std::vector<HgvsNotation> notations;    // Genomic first, then per transcript
    std::vector<std::string> notation_errors;
    bool consequences_resolved = false;
    ConsequenceSet consequences;
    ValidationStateSet validation_states;   // From the input code, plus "failed" on QC failure

    /**
     * HGVS strings joined with ','
     */
    std::string hgvs_string() const;
};

/**
 * Totals for a batch run
 */
struct AnnotationSummary {
    size_t lines_read = 0;
    size_t malformed_lines = 0;
    size_t duplicate_names = 0;     // Variants dropped because their name repeats
    size_t annotated = 0;
    size_t qc_failed = 0;
};

class VariantAnnotator {
public:
    /**
     * @param provider Reference sequence, must outlive the annotator
     * @param transcripts Optional transcript database for c. notation
     */
    VariantAnnotator(const SequenceProvider& provider,
                     const TranscriptDatabase* transcripts = nullptr,
                     AnnotatorConfig config = AnnotatorConfig());

    /**
     * Normalize a variant as stored: alleles on the forward strand, strand +1,
     * alleles longer than the configured limit in symbolic form
     */
    Variant prepare(const Variant& variant) const;

    /**
     * Annotate a variant
     * @param variant Variant as read from input
     * @param consequences Per-transcript consequences, or nullptr to skip resolution
     */
    AnnotatedVariant annotate(const Variant& variant,
                              const std::vector<TranscriptConsequence>* consequences = nullptr) const;

    const AnnotatorConfig& config() const { return config_; }

private:
    const SequenceProvider& provider_;
    const TranscriptDatabase* transcripts_;
    AnnotatorConfig config_;
};

/**
 * Column header of the QC report
 */
std::string annotation_header();

/**
 * Format one report line (no trailing newline)
 */
std::string format_annotation(const AnnotatedVariant& annotated);

/**
 * Annotate a variant file and write the QC report
 *
 * @param input_path Variant file in Ensembl default format (.gz allowed)
 * @param output_path Report path
 * @param annotator Configured annotator
 * @param consequences Optional consequence table keyed by variant name
 * @return Run totals
 * @throws std::runtime_error if a file cannot be opened
 */
AnnotationSummary annotate_variant_file(
    const std::string& input_path,
    const std::string& output_path,
    const VariantAnnotator& annotator,
    const ConsequenceTable* consequences = nullptr
);

} // namespace varnote

#endif // VARIANT_ANNOTATOR_HPP
