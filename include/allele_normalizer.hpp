/**
 * Allele Normalization
 *
 * Strand-aware allele string canonicalization and the allele-level QC
 * checks that feed the QC classifier:
 * - reverse complementing alleles stored on the negative strand
 * - collapsing very long alleles to "<N>_base_deletion"
 * - all-four-bases and IUPAC ambiguity detection
 * - ambiguity code and variation class of an allele string
 */

#ifndef ALLELE_NORMALIZER_HPP
#define ALLELE_NORMALIZER_HPP

#include <string>
#include <vector>
#include <optional>

namespace varnote {

/**
 * Alleles longer than this are stored in symbolic form
 */
constexpr size_t DEFAULT_MAX_ALLELE_LENGTH = 4000;

/**
 * dbSNP-style variation classes
 */
enum class VariationClass {
    SNP,            // A/G, A/C/T
    IN_DEL,         // -/ACG
    NAMED,          // LARGEDELETION/-, 1200_base_deletion/-
    SUBSTITUTION,   // AC/GT
    MICROSAT,       // (CA)14/25/26
    MIXED,          // A/-/TT
    HET,            // single allele
    UNKNOWN
};

std::string variation_class_to_string(VariationClass cls);

/**
 * Split an allele string on '/'. A trailing '/' yields a final empty allele.
 */
std::vector<std::string> split_allele_string(const std::string& allele_string);

/**
 * Join alleles with '/'
 */
std::string join_alleles(const std::vector<std::string>& alleles);

/**
 * Check if an allele is a gap ("-" or empty)
 */
inline bool is_gap_allele(const std::string& allele) {
    return allele.empty() || allele == "-";
}

/**
 * Check if an allele is symbolic rather than literal sequence.
 *
 * An allele containing any character outside the IUPAC nucleotide alphabet
 * and '-' is symbolic, e.g. "1200_base_deletion" or "PhenCode_variation".
 */
bool is_symbolic_allele(const std::string& allele);

/**
 * Build the symbolic form "<length>_base_deletion"
 */
std::string make_symbolic_deletion(size_t length);

/**
 * Recorded length of a "<N>_base_deletion" allele
 */
std::optional<int> symbolic_deletion_length(const std::string& allele);

/**
 * Normalize an allele string to the forward strand.
 *
 * Non-symbolic alleles are reverse complemented when strand is negative;
 * allele order is preserved. Any resulting allele longer than max_length is
 * replaced with its symbolic "<N>_base_deletion" form.
 *
 * @param raw_allele_string Allele string, e.g. "A/G" or "-/CAT"
 * @param strand +1 or -1
 * @param max_length Longest allele kept as literal sequence
 */
std::string normalize_allele_string(
    const std::string& raw_allele_string,
    int strand,
    size_t max_length = DEFAULT_MAX_ALLELE_LENGTH
);

/**
 * Check if the alleles cover all four bases A, C, G and T
 * (an "any base" call such as "A/C/G/T").
 */
bool check_four_bases(const std::string& allele_string);

/**
 * Check if a single allele contains an IUPAC ambiguity code
 * (R, Y, S, W, K, M, B, D, H, V, N). Symbolic alleles never do.
 */
bool is_ambiguous_allele(const std::string& allele);

/**
 * Check if any allele contains an IUPAC ambiguity code
 */
bool check_for_ambiguous_alleles(const std::string& allele_string);

/**
 * Get alleles containing IUPAC ambiguity codes, in input order
 */
std::vector<std::string> find_ambiguous_alleles(const std::string& allele_string);

/**
 * Allele string with ambiguous alleles stripped
 */
std::string remove_ambiguous_alleles(const std::string& allele_string);

/**
 * IUPAC ambiguity code for a set of single-base alleles.
 * "A/G" -> "R", "A/C/G/T" -> "N". Empty if any allele is not a single base.
 */
std::string ambiguity_code(const std::string& allele_string);

/**
 * Classify an allele string the way dbSNP does
 */
VariationClass variation_class(const std::string& allele_string);

} // namespace varnote

#endif // ALLELE_NORMALIZER_HPP
