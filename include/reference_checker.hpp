/**
 * Reference Checker
 *
 * Retrieves the reference sequence under a variant and compares it with
 * the variant's declared reference allele.
 */

#ifndef REFERENCE_CHECKER_HPP
#define REFERENCE_CHECKER_HPP

#include "varnote.hpp"
#include <string>

namespace varnote {

/**
 * Outcome of comparing declared and retrieved reference
 */
enum class MatchOutcome {
    MATCH,
    MISMATCH,
    NOT_COMPARED    // Declared reference is symbolic
};

std::string match_outcome_to_string(MatchOutcome outcome);

/**
 * Result of a reference check. Retrieval failures are data, not exceptions.
 */
struct ReferenceCheckResult {
    bool retrieved = false;
    std::string reference_sequence;     // Variant-strand orientation, "-" for insertions
    MatchOutcome outcome = MatchOutcome::NOT_COMPARED;
    std::string error_message;

    bool matches() const { return retrieved && outcome == MatchOutcome::MATCH; }
};

/**
 * Get the reference sequence covered by a variant.
 *
 * Insertions (end = start - 1) yield "-" without a provider lookup.
 * For strand -1 the sequence is reverse complemented.
 *
 * @throws CoordinateError if end < start - 1 or the provider cannot
 *         supply the span
 */
std::string get_reference_sequence(const Variant& variant, const SequenceProvider& provider);

/**
 * Compare two reference alleles, case-insensitively, treating "" and "-"
 * as the same gap.
 */
bool reference_alleles_match(const std::string& declared, const std::string& retrieved);

/**
 * Retrieve the reference and compare it with variant.ref_allele_string()
 */
ReferenceCheckResult check_reference(const Variant& variant, const SequenceProvider& provider);

/**
 * Check that coordinates are consistent with the reference allele length.
 *
 * A gap reference requires end = start - 1. A "<N>_base_deletion" reference
 * uses its recorded length N.
 */
bool check_variant_size(int start, int end, const std::string& ref_allele);

} // namespace varnote

#endif // REFERENCE_CHECKER_HPP
