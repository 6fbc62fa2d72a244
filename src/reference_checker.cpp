/**
 * Reference sequence retrieval and comparison
 */

#include "reference_checker.hpp"
#include "allele_normalizer.hpp"

namespace varnote {

std::string match_outcome_to_string(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::MATCH:        return "match";
        case MatchOutcome::MISMATCH:     return "mismatch";
        case MatchOutcome::NOT_COMPARED: return "not_compared";
    }
    return "not_compared";
}

std::string get_reference_sequence(const Variant& variant, const SequenceProvider& provider) {
    if (variant.is_insertion()) {
        return "-";
    }

    if (static_cast<long long>(variant.end) < static_cast<long long>(variant.start) - 1) {
        throw CoordinateError("Invalid coordinates for " + variant.display_id() + ": end " +
                              std::to_string(variant.end) + " < start " +
                              std::to_string(variant.start) + " - 1");
    }

    std::string seq = provider.fetch(variant.seq_region, variant.start, variant.end);
    if (variant.strand < 0) {
        seq = reverse_complement(seq);
    }
    return seq;
}

bool reference_alleles_match(const std::string& declared, const std::string& retrieved) {
    if (is_gap_allele(declared) || is_gap_allele(retrieved)) {
        return is_gap_allele(declared) && is_gap_allele(retrieved);
    }
    return to_upper(declared) == to_upper(retrieved);
}

ReferenceCheckResult check_reference(const Variant& variant, const SequenceProvider& provider) {
    ReferenceCheckResult result;

    try {
        result.reference_sequence = get_reference_sequence(variant, provider);
        result.retrieved = true;
    } catch (const CoordinateError& e) {
        result.error_message = e.what();
        log(LogLevel::DEBUG, "Reference lookup failed for " + variant.display_id() + ": " +
            result.error_message);
        return result;
    }

    std::string declared = variant.ref_allele_string();
    if (is_symbolic_allele(declared)) {
        result.outcome = MatchOutcome::NOT_COMPARED;
    } else if (reference_alleles_match(declared, result.reference_sequence)) {
        result.outcome = MatchOutcome::MATCH;
    } else {
        result.outcome = MatchOutcome::MISMATCH;
    }

    return result;
}

bool check_variant_size(int start, int end, const std::string& ref_allele) {
    if (is_gap_allele(ref_allele)) {
        return end == start - 1;
    }

    int length;
    if (auto recorded = symbolic_deletion_length(ref_allele)) {
        length = *recorded;
    } else if (is_symbolic_allele(ref_allele)) {
        // Named alleles carry no length
        return true;
    } else {
        length = static_cast<int>(ref_allele.size());
    }

    return end - start + 1 == length;
}

} // namespace varnote
