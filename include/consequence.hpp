/**
 * Consequence Resolver
 *
 * Closed, severity-ranked consequence vocabulary and the fold that reduces
 * per-transcript consequence annotations to a single ordered list:
 * [regulatory] [splice site] most-severe-type
 */

#ifndef CONSEQUENCE_HPP
#define CONSEQUENCE_HPP

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace varnote {

/**
 * Version tag of the ranked vocabulary below
 */
constexpr const char* CONSEQUENCE_VOCABULARY_VERSION = "1.0";

/**
 * Consequence types, most severe first. The enumerator order is the rank.
 */
enum class ConsequenceType {
    ESSENTIAL_SPLICE_SITE,
    STOP_GAINED,
    STOP_LOST,
    FRAMESHIFT_CODING,
    NON_SYNONYMOUS_CODING,
    SPLICE_SITE,
    SYNONYMOUS_CODING,
    REGULATORY_REGION,
    FIVE_PRIME_UTR,
    THREE_PRIME_UTR,
    INTRONIC,
    UPSTREAM,
    DOWNSTREAM,
    INTERGENIC
};

using ConsequenceSet = std::vector<ConsequenceType>;

/**
 * Consequences of a variant on one transcript
 */
struct TranscriptConsequence {
    std::string transcript_id;
    std::string gene_id;
    ConsequenceSet consequences;
};

/**
 * Get tag as written in annotation files ("5PRIME_UTR", "STOP_GAINED", ...)
 */
std::string consequence_to_string(ConsequenceType type);

/**
 * Parse a tag. Unknown tags yield nullopt and a logged warning.
 */
std::optional<ConsequenceType> parse_consequence_type(const std::string& tag);

/**
 * Parse a comma-separated tag list, dropping unknown tags
 */
ConsequenceSet parse_consequence_set(const std::string& tags);

/**
 * Comma-joined tags
 */
std::string consequence_set_to_string(const ConsequenceSet& set);

/**
 * Severity rank, 1 = most severe
 */
int consequence_rank(ConsequenceType type);

/**
 * Full ranked vocabulary, most severe first
 */
const std::vector<std::pair<ConsequenceType, int>>& consequence_rank_table();

/**
 * Tags reported in their own bucket ahead of the type
 */
bool is_splice_site_consequence(ConsequenceType type);
bool is_regulatory_consequence(ConsequenceType type);

/**
 * Fold per-transcript consequence sets into one list:
 * [REGULATORY_REGION if any], [most severe splice tag if any], most severe
 * other type (INTERGENIC when none).
 *
 * Order-independent and associative: resolving a resolved list together
 * with more sets gives the same result as resolving everything at once.
 */
ConsequenceSet resolve(const std::vector<ConsequenceSet>& annotations);

/**
 * Resolve over transcript annotations
 */
ConsequenceSet resolve(const std::vector<TranscriptConsequence>& annotations);

/**
 * Resolve over the transcripts of one gene only; [INTERGENIC] when the gene
 * has none.
 */
ConsequenceSet resolve_for_gene(const std::vector<TranscriptConsequence>& annotations,
                                const std::string& gene_id);

/**
 * Single most severe tag over all buckets (INTERGENIC for an empty set)
 */
ConsequenceType most_severe_consequence(const ConsequenceSet& set);

} // namespace varnote

#endif // CONSEQUENCE_HPP
