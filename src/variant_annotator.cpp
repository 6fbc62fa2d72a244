/**
 * Variant annotation pipeline and transcript database
 */

#include "variant_annotator.hpp"
#include "reference_checker.hpp"
#include <algorithm>
#include <fstream>
#include <tuple>
#include <unordered_map>

namespace varnote {

// ============================================================================
// TranscriptDatabase implementation
// ============================================================================

struct TranscriptDatabase::Impl {
    std::vector<TranscriptModel> transcripts;
    std::unordered_map<std::string, size_t> by_id;

    // Spatial index: seq_region -> sorted list of (span start, span end, index)
    std::unordered_map<std::string, std::vector<std::tuple<int, int, size_t>>> region_index;

    void add(TranscriptModel transcript) {
        if (by_id.count(transcript.id)) {
            log(LogLevel::WARNING, "Duplicate transcript " + transcript.id + " ignored");
            return;
        }
        by_id[transcript.id] = transcripts.size();
        transcripts.push_back(std::move(transcript));
    }

    void build_index() {
        for (size_t i = 0; i < transcripts.size(); ++i) {
            const auto& tr = transcripts[i];
            region_index[normalize_chrom(tr.seq_region)].emplace_back(
                tr.exon_map.span_start(), tr.exon_map.span_end(), i
            );
        }

        // Sort by start position
        for (auto& [region, entries] : region_index) {
            std::sort(entries.begin(), entries.end());
        }
    }
};

TranscriptDatabase::TranscriptDatabase(InMemory) : pimpl_(std::make_unique<Impl>()) {}

TranscriptDatabase::TranscriptDatabase(const std::string& path)
    : pimpl_(std::make_unique<Impl>()) {

    log(LogLevel::INFO, "Loading transcripts from: " + path);

    LineReader reader(path);
    std::string line;

    while (reader.next(line)) {
        if (line.empty() || line[0] == '#') continue;

        auto parsed = parse_transcript_line(line);
        if (!parsed.valid) {
            log(LogLevel::WARNING, path + ":" + std::to_string(reader.line_number()) + ": " +
                parsed.error_message);
            continue;
        }
        pimpl_->add(std::move(parsed.transcript));
    }

    pimpl_->build_index();

    log(LogLevel::INFO, "Loaded " + std::to_string(pimpl_->transcripts.size()) + " transcripts");
}

std::unique_ptr<TranscriptDatabase> TranscriptDatabase::from_transcripts(
    std::vector<TranscriptModel> transcripts) {

    auto db = std::make_unique<TranscriptDatabase>(InMemory{});
    for (auto& tr : transcripts) {
        tr.exon_map.sort_exons();
        db->pimpl_->add(std::move(tr));
    }
    db->pimpl_->build_index();
    return db;
}

TranscriptDatabase::~TranscriptDatabase() = default;

std::vector<const TranscriptModel*> TranscriptDatabase::get_transcripts_in_region(
    const std::string& seq_region, int start, int end) const {

    std::vector<const TranscriptModel*> results;

    auto it = pimpl_->region_index.find(normalize_chrom(seq_region));
    if (it == pimpl_->region_index.end()) {
        return results;
    }

    int last = std::max(start, end);
    for (const auto& [span_start, span_end, index] : it->second) {
        // Since sorted by start, can break early
        if (span_start > last) break;
        const TranscriptModel& tr = pimpl_->transcripts[index];
        if (tr.overlaps(start, end)) {
            results.push_back(&tr);
        }
    }

    return results;
}

const TranscriptModel* TranscriptDatabase::get_transcript(const std::string& transcript_id) const {
    auto it = pimpl_->by_id.find(transcript_id);
    return (it != pimpl_->by_id.end()) ? &pimpl_->transcripts[it->second] : nullptr;
}

size_t TranscriptDatabase::transcript_count() const {
    return pimpl_->transcripts.size();
}

// ============================================================================
// VariantAnnotator implementation
// ============================================================================

std::string AnnotatedVariant::hgvs_string() const {
    std::string result;
    for (const auto& n : notations) {
        if (!result.empty()) result += ",";
        result += n.hgvs;
    }
    return result;
}

VariantAnnotator::VariantAnnotator(const SequenceProvider& provider,
                                   const TranscriptDatabase* transcripts,
                                   AnnotatorConfig config)
    : provider_(provider), transcripts_(transcripts), config_(std::move(config)) {}

Variant VariantAnnotator::prepare(const Variant& variant) const {
    Variant prepared = variant;
    prepared.allele_string = normalize_allele_string(variant.allele_string, variant.strand,
                                                     config_.max_allele_length);
    prepared.strand = 1;
    return prepared;
}

AnnotatedVariant VariantAnnotator::annotate(
    const Variant& variant,
    const std::vector<TranscriptConsequence>* consequences) const {

    AnnotatedVariant result;
    result.variant = prepare(variant);
    const Variant& v = result.variant;

    // Symbolic deletions carry no sequence to check
    if (config_.run_qc && !symbolic_deletion_length(v.ref_allele_string())) {
        result.qc = classify(v, provider_);
        result.qc_checked = true;
    }

    std::string reference_name = config_.reference_name.empty() ? v.seq_region : config_.reference_name;
    auto genomic = build_notations(v, ReferenceFrame::GENOMIC, reference_name, provider_);
    if (!genomic.ok()) {
        result.notation_errors.push_back(genomic.error_message);
    }
    for (auto& n : genomic.notations) {
        result.notations.push_back(std::move(n));
    }
    for (const auto& reason : genomic.skipped) {
        log(LogLevel::DEBUG, v.display_id() + ": " + reason);
    }

    if (config_.cdna_notation && transcripts_) {
        for (const TranscriptModel* tr : transcripts_->get_transcripts_in_region(v.seq_region, v.start, v.end)) {
            auto cdna = build_notations(v, ReferenceFrame::CDNA, tr->id, provider_, tr);
            if (!cdna.ok()) {
                result.notation_errors.push_back(tr->id + ": " + cdna.error_message);
            }
            for (auto& n : cdna.notations) {
                result.notations.push_back(std::move(n));
            }
        }
    }

    if (consequences) {
        result.consequences = resolve(*consequences);
        result.consequences_resolved = true;
    }

    result.validation_states = parse_validation_states(v.validation_code);
    if (!result.qc.empty()) {
        result.validation_states.add(ValidationState::FAILED);
    }

    return result;
}

// ============================================================================
// Batch processing
// ============================================================================

std::string annotation_header() {
    return "name\tallele\tseq_region\tstart\tend\tstrand\tsource\thgvs\tconsequence\tfail_reasons\tvalidated";
}

std::string format_annotation(const AnnotatedVariant& annotated) {
    const Variant& v = annotated.variant;
    std::string line;
    line += v.name + "\t";
    line += v.allele_string + "\t";
    line += v.seq_region + "\t";
    line += std::to_string(v.start) + "\t";
    line += std::to_string(v.end) + "\t";
    line += std::to_string(v.strand) + "\t";
    line += v.source + "\t";
    line += annotated.hgvs_string() + "\t";
    line += (annotated.consequences_resolved ? consequence_set_to_string(annotated.consequences) : "") + "\t";
    line += annotated.qc.to_string() + "\t";
    line += annotated.validation_states.to_string();
    return line;
}

AnnotationSummary annotate_variant_file(
    const std::string& input_path,
    const std::string& output_path,
    const VariantAnnotator& annotator,
    const ConsequenceTable* consequences) {

    AnnotationSummary summary;

    log(LogLevel::INFO, "Reading variants from: " + input_path);

    // The whole file is read first so repeated names can be dropped
    std::vector<Variant> variants;
    std::unordered_map<std::string, size_t> name_counts;
    {
        LineReader reader(input_path);
        std::string line;
        while (reader.next(line)) {
            if (line.empty() || line[0] == '#') continue;
            summary.lines_read++;

            auto parsed = parse_variant_line(line);
            if (!parsed.valid) {
                log(LogLevel::WARNING, input_path + ":" + std::to_string(reader.line_number()) + ": " +
                    parsed.error_message);
                summary.malformed_lines++;
                continue;
            }
            if (!parsed.variant.name.empty()) {
                name_counts[parsed.variant.name]++;
            }
            variants.push_back(std::move(parsed.variant));
        }
    }

    std::ofstream output(output_path);
    if (!output.is_open()) {
        throw std::runtime_error("Cannot open output file: " + output_path);
    }

    output << annotation_header() << "\n";

    static const std::vector<TranscriptConsequence> no_consequences;

    for (const auto& variant : variants) {
        if (annotator.config().skip_duplicate_names && !variant.name.empty() &&
            name_counts[variant.name] > 1) {
            log(LogLevel::WARNING, "Skipping " + variant.name + ": name seen " +
                std::to_string(name_counts[variant.name]) + " times");
            summary.duplicate_names++;
            continue;
        }

        const std::vector<TranscriptConsequence>* tcs = nullptr;
        if (consequences) {
            auto it = consequences->find(variant.name);
            tcs = (it != consequences->end()) ? &it->second : &no_consequences;
        }

        AnnotatedVariant annotated = annotator.annotate(variant, tcs);
        for (const auto& error : annotated.notation_errors) {
            log(LogLevel::DEBUG, variant.display_id() + ": " + error);
        }

        output << format_annotation(annotated) << "\n";
        summary.annotated++;
        if (!annotated.qc.empty()) summary.qc_failed++;

        if (summary.annotated % 10000 == 0) {
            log(LogLevel::INFO, "Processed " + std::to_string(summary.annotated) + " variants...");
        }
    }

    log(LogLevel::INFO, "Annotation complete. " + std::to_string(summary.annotated) +
        " variants written to " + output_path + " (" + std::to_string(summary.qc_failed) +
        " failed QC, " + std::to_string(summary.duplicate_names) + " duplicate names dropped)");

    return summary;
}

} // namespace varnote
