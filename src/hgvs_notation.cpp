/**
 * HGVS notation construction
 */

#include "hgvs_notation.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace varnote {

std::string hgvs_change_type_to_string(HgvsChangeType type) {
    switch (type) {
        case HgvsChangeType::SUBSTITUTION:       return "substitution";
        case HgvsChangeType::INSERTION:          return "insertion";
        case HgvsChangeType::DELETION:           return "deletion";
        case HgvsChangeType::DELETION_INSERTION: return "deletion-insertion";
        case HgvsChangeType::DUPLICATION:        return "duplication";
    }
    return "unknown";
}

// ============================================================================
// Change description
// ============================================================================

std::optional<VariantChange> describe_change(
    const std::string& alt,
    const std::string& ref_sequence,
    int ref_start,
    int ref_end,
    int display_start,
    int display_end) {

    int ref_length = ref_end - ref_start + 1;
    if (display_end - display_start + 1 != ref_length) {
        throw std::invalid_argument(
            "Display interval " + std::to_string(display_start) + "-" +
            std::to_string(display_end) + " does not match reference interval " +
            std::to_string(ref_start) + "-" + std::to_string(ref_end));
    }
    if (ref_start < 1 || ref_length < 0 ||
        ref_end > static_cast<int>(ref_sequence.size())) {
        throw std::invalid_argument("Reference interval " + std::to_string(ref_start) + "-" +
                                    std::to_string(ref_end) + " outside reference sequence");
    }

    std::string allele = alt;
    allele.erase(std::remove(allele.begin(), allele.end(), '-'), allele.end());

    std::string ref = ref_sequence.substr(ref_start - 1, ref_length);
    if (allele == ref) {
        return std::nullopt;
    }

    VariantChange change;
    change.ref = ref;
    change.alt = allele;
    change.start = display_start;
    change.end = display_end;

    if (ref.size() == 1 && allele.size() == 1) {
        change.type = HgvsChangeType::SUBSTITUTION;
    } else if (ref.empty()) {
        int length = static_cast<int>(allele.size());
        int context_start = ref_start - length;
        if (context_start >= 1 && ref_sequence.compare(context_start - 1, length, allele) == 0) {
            // Inserted bases repeat the bases just before the insertion point
            change.type = HgvsChangeType::DUPLICATION;
            change.ref = allele;
            change.start = display_start - length;
            change.end = change.start + length - 1;
        } else {
            // Report the two bases flanking the insertion point
            change.type = HgvsChangeType::INSERTION;
            change.start = display_end;
            change.end = display_start;
        }
    } else if (allele.empty()) {
        change.type = HgvsChangeType::DELETION;
    } else {
        change.type = HgvsChangeType::DELETION_INSERTION;
    }

    return change;
}

// ============================================================================
// Rendering
// ============================================================================

std::string render_hgvs(
    const std::string& reference_name,
    const std::string& numbering,
    const std::string& start,
    const std::string& end,
    HgvsChangeType type,
    const std::string& ref,
    const std::string& alt) {

    std::string result = reference_name + ":";
    if (!numbering.empty()) {
        result += numbering + ".";
    }

    result += start;
    if (end != start) {
        result += "_" + end;
    }

    switch (type) {
        case HgvsChangeType::SUBSTITUTION:
            result += ref + ">" + alt;
            break;
        case HgvsChangeType::INSERTION:
            result += "ins" + alt;
            break;
        case HgvsChangeType::DELETION:
            result += "del" + ref;
            break;
        case HgvsChangeType::DELETION_INSERTION:
            result += "del" + ref + "ins" + alt;
            break;
        case HgvsChangeType::DUPLICATION:
            result += "dup" + ref;
            break;
    }

    return result;
}

std::vector<std::string> NotationResult::strings() const {
    std::vector<std::string> result;
    result.reserve(notations.size());
    for (const auto& n : notations) {
        result.push_back(n.hgvs);
    }
    return result;
}

// ============================================================================
// Notation builder
// ============================================================================

namespace {

bool is_clean_sequence(const std::string& allele) {
    return allele.find_first_not_of("ACGT-") == std::string::npos;
}

size_t sequence_length(const std::string& allele) {
    return allele.size() - std::count(allele.begin(), allele.end(), '-');
}

} // anonymous namespace

NotationResult build_notations(
    const Variant& variant,
    ReferenceFrame frame,
    const std::string& reference_name,
    const SequenceProvider& provider,
    const TranscriptModel* transcript) {

    if (frame == ReferenceFrame::PROTEIN) {
        throw UnsupportedFrameError("HGVS p. notation is not supported");
    }
    if (frame == ReferenceFrame::CDNA && transcript == nullptr) {
        throw UnsupportedFrameError("HGVS c. notation requires a transcript");
    }

    NotationResult result;

    if (!variant.has_valid_coordinates()) {
        result.error_message = "Invalid coordinates for " + variant.display_id();
        return result;
    }

    bool cdna = (frame == ReferenceFrame::CDNA);
    int orientation = cdna ? (transcript->strand() >= 0 ? 1 : -1) : 1;

    // Span of the reference feature in genomic coordinates
    int lo = 1;
    int hi = 0;
    if (cdna) {
        lo = transcript->exon_map.span_start();
        hi = transcript->exon_map.span_end();
    } else {
        hi = provider.region_length(variant.seq_region);
    }

    if (hi < lo || variant.start < lo || variant.end > hi) {
        result.error_message = variant.display_id() + " lies outside " + reference_name;
        return result;
    }

    // Collect distinct alleles in reference-feature orientation
    bool flip = variant.strand * orientation < 0;
    std::vector<std::string> alleles;
    std::set<std::string> seen;
    size_t max_length = 0;
    for (const auto& raw : variant.alleles()) {
        std::string allele = to_upper(raw);
        if (!is_clean_sequence(allele)) {
            result.skipped.push_back("MalformedAllele: '" + raw + "'");
            continue;
        }
        if (flip) {
            allele = reverse_complement(allele);
        }
        if (!seen.insert(allele).second) continue;
        alleles.push_back(allele);
        max_length = std::max(max_length, sequence_length(allele));
    }

    // Reference bases plus upstream context for duplication checks, in
    // reference-feature orientation
    int context = static_cast<int>(max_length);
    int variant_length = variant.end - variant.start + 1;
    std::string ref_sequence;
    int ref_start = 1;
    try {
        if (orientation > 0) {
            int fetch_start = std::max(lo, variant.start - context);
            if (variant.end >= fetch_start) {
                ref_sequence = provider.fetch(variant.seq_region, fetch_start, variant.end);
            }
            ref_start = variant.start - fetch_start + 1;
        } else {
            int fetch_end = std::min(hi, variant.end + context);
            if (fetch_end >= variant.start) {
                ref_sequence = reverse_complement(
                    provider.fetch(variant.seq_region, variant.start, fetch_end));
            }
            ref_start = fetch_end - variant.end + 1;
        }
    } catch (const CoordinateError& e) {
        result.error_message = e.what();
        return result;
    }
    int ref_end = ref_start + variant_length - 1;

    // Display coordinates run along the reference feature. On a reverse
    // strand transcript they are mirrored around the transcript end.
    int mirror = hi + 1;
    int display_start = orientation > 0 ? variant.start : mirror - variant.end;
    int display_end = display_start + variant_length - 1;

    std::string numbering = reference_frame_to_string(frame);
    if (cdna && !transcript->exon_map.is_coding()) {
        numbering = "";
    }

    for (const auto& allele : alleles) {
        auto change = describe_change(allele, ref_sequence, ref_start, ref_end,
                                      display_start, display_end);
        if (!change) continue;

        HgvsNotation notation;
        notation.reference_name = reference_name;
        notation.numbering = numbering;
        notation.type = change->type;
        notation.ref = change->ref;
        notation.alt = change->alt;
        notation.allele = allele;

        if (cdna) {
            int genomic_start = orientation > 0 ? change->start : mirror - change->start;
            int genomic_end = orientation > 0 ? change->end : mirror - change->end;
            try {
                CdnaPosition cdna_start = to_cdna(genomic_start, transcript->exon_map);
                CdnaPosition cdna_end = to_cdna(genomic_end, transcript->exon_map);
                if (cdna_end < cdna_start) {
                    std::swap(cdna_start, cdna_end);
                }
                notation.start = cdna_start.to_string();
                notation.end = cdna_end.to_string();
            } catch (const OutOfTranscriptBoundsError& e) {
                result.skipped.push_back("OutOfTranscriptBounds: '" + allele + "' " + e.what());
                continue;
            }
        } else {
            notation.start = std::to_string(change->start);
            notation.end = std::to_string(change->end);
        }

        notation.hgvs = render_hgvs(notation.reference_name, notation.numbering,
                                    notation.start, notation.end, notation.type,
                                    notation.ref, notation.alt);
        result.notations.push_back(std::move(notation));
    }

    return result;
}

} // namespace varnote
