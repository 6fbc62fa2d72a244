/**
 * Consequence vocabulary and resolution
 */

#include "consequence.hpp"
#include "varnote.hpp"
#include <algorithm>
#include <unordered_map>

namespace varnote {

std::string consequence_to_string(ConsequenceType type) {
    switch (type) {
        case ConsequenceType::ESSENTIAL_SPLICE_SITE: return "ESSENTIAL_SPLICE_SITE";
        case ConsequenceType::STOP_GAINED: return "STOP_GAINED";
        case ConsequenceType::STOP_LOST: return "STOP_LOST";
        case ConsequenceType::FRAMESHIFT_CODING: return "FRAMESHIFT_CODING";
        case ConsequenceType::NON_SYNONYMOUS_CODING: return "NON_SYNONYMOUS_CODING";
        case ConsequenceType::SPLICE_SITE: return "SPLICE_SITE";
        case ConsequenceType::SYNONYMOUS_CODING: return "SYNONYMOUS_CODING";
        case ConsequenceType::REGULATORY_REGION: return "REGULATORY_REGION";
        case ConsequenceType::FIVE_PRIME_UTR: return "5PRIME_UTR";
        case ConsequenceType::THREE_PRIME_UTR: return "3PRIME_UTR";
        case ConsequenceType::INTRONIC: return "INTRONIC";
        case ConsequenceType::UPSTREAM: return "UPSTREAM";
        case ConsequenceType::DOWNSTREAM: return "DOWNSTREAM";
        case ConsequenceType::INTERGENIC: return "INTERGENIC";
    }
    return "INTERGENIC";
}

const std::vector<std::pair<ConsequenceType, int>>& consequence_rank_table() {
    static const std::vector<std::pair<ConsequenceType, int>> table = {
        {ConsequenceType::ESSENTIAL_SPLICE_SITE, 1},
        {ConsequenceType::STOP_GAINED, 2},
        {ConsequenceType::STOP_LOST, 3},
        {ConsequenceType::FRAMESHIFT_CODING, 4},
        {ConsequenceType::NON_SYNONYMOUS_CODING, 5},
        {ConsequenceType::SPLICE_SITE, 6},
        {ConsequenceType::SYNONYMOUS_CODING, 7},
        {ConsequenceType::REGULATORY_REGION, 8},
        {ConsequenceType::FIVE_PRIME_UTR, 9},
        {ConsequenceType::THREE_PRIME_UTR, 10},
        {ConsequenceType::INTRONIC, 11},
        {ConsequenceType::UPSTREAM, 12},
        {ConsequenceType::DOWNSTREAM, 13},
        {ConsequenceType::INTERGENIC, 14}
    };
    return table;
}

int consequence_rank(ConsequenceType type) {
    for (const auto& [t, rank] : consequence_rank_table()) {
        if (t == type) return rank;
    }
    return static_cast<int>(consequence_rank_table().size());
}

std::optional<ConsequenceType> parse_consequence_type(const std::string& tag) {
    static const std::unordered_map<std::string, ConsequenceType> lookup = [] {
        std::unordered_map<std::string, ConsequenceType> m;
        for (const auto& entry : consequence_rank_table()) {
            m[consequence_to_string(entry.first)] = entry.first;
        }
        return m;
    }();

    auto it = lookup.find(to_upper(tag));
    if (it == lookup.end()) {
        log(LogLevel::WARNING, "Unknown consequence type '" + tag + "' ignored");
        return std::nullopt;
    }
    return it->second;
}

ConsequenceSet parse_consequence_set(const std::string& tags) {
    ConsequenceSet result;
    size_t start = 0;
    while (start <= tags.size()) {
        size_t pos = tags.find(',', start);
        std::string tag = tags.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!tag.empty()) {
            if (auto type = parse_consequence_type(tag)) {
                result.push_back(*type);
            }
        }
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return result;
}

std::string consequence_set_to_string(const ConsequenceSet& set) {
    std::string result;
    for (size_t i = 0; i < set.size(); ++i) {
        if (i > 0) result += ",";
        result += consequence_to_string(set[i]);
    }
    return result;
}

bool is_splice_site_consequence(ConsequenceType type) {
    return type == ConsequenceType::ESSENTIAL_SPLICE_SITE || type == ConsequenceType::SPLICE_SITE;
}

bool is_regulatory_consequence(ConsequenceType type) {
    return type == ConsequenceType::REGULATORY_REGION;
}

ConsequenceSet resolve(const std::vector<ConsequenceSet>& annotations) {
    bool regulatory = false;
    std::optional<ConsequenceType> splice;
    ConsequenceType type = ConsequenceType::INTERGENIC;

    for (const auto& set : annotations) {
        for (ConsequenceType c : set) {
            if (is_splice_site_consequence(c)) {
                if (!splice || consequence_rank(c) < consequence_rank(*splice)) {
                    splice = c;
                }
            } else if (is_regulatory_consequence(c)) {
                regulatory = true;
            } else if (consequence_rank(c) < consequence_rank(type)) {
                type = c;
            }
        }
    }

    ConsequenceSet result;
    if (regulatory) result.push_back(ConsequenceType::REGULATORY_REGION);
    if (splice) result.push_back(*splice);
    result.push_back(type);
    return result;
}

ConsequenceSet resolve(const std::vector<TranscriptConsequence>& annotations) {
    std::vector<ConsequenceSet> sets;
    sets.reserve(annotations.size());
    for (const auto& tc : annotations) {
        sets.push_back(tc.consequences);
    }
    return resolve(sets);
}

ConsequenceSet resolve_for_gene(const std::vector<TranscriptConsequence>& annotations,
                                const std::string& gene_id) {
    std::vector<ConsequenceSet> sets;
    for (const auto& tc : annotations) {
        if (tc.gene_id == gene_id) {
            sets.push_back(tc.consequences);
        }
    }
    return resolve(sets);
}

ConsequenceType most_severe_consequence(const ConsequenceSet& set) {
    ConsequenceType best = ConsequenceType::INTERGENIC;
    for (ConsequenceType c : set) {
        if (consequence_rank(c) < consequence_rank(best)) {
            best = c;
        }
    }
    return best;
}

} // namespace varnote
