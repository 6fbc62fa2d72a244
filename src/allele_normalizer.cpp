/**
 * Allele string normalization and allele-level checks
 */

#include "allele_normalizer.hpp"
#include "varnote.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <map>

namespace varnote {

namespace {

const std::string IUPAC_BASES = "ACGTRYSWKMBDHVN";
const std::string AMBIGUITY_SYMBOLS = "RYSWKMBDHVN";
const std::string SYMBOLIC_DELETION_SUFFIX = "_base_deletion";

bool is_iupac_char(char c) {
    char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return u == '-' || IUPAC_BASES.find(u) != std::string::npos;
}

bool is_plain_base(const std::string& allele) {
    if (allele.size() != 1) return false;
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(allele[0])));
    return c == 'A' || c == 'C' || c == 'G' || c == 'T';
}

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

std::string variation_class_to_string(VariationClass cls) {
    switch (cls) {
        case VariationClass::SNP:          return "snp";
        case VariationClass::IN_DEL:       return "in-del";
        case VariationClass::NAMED:        return "named";
        case VariationClass::SUBSTITUTION: return "substitution";
        case VariationClass::MICROSAT:     return "microsat";
        case VariationClass::MIXED:        return "mixed";
        case VariationClass::HET:          return "het";
        case VariationClass::UNKNOWN:      return "unknown";
    }
    return "unknown";
}

std::vector<std::string> split_allele_string(const std::string& allele_string) {
    std::vector<std::string> alleles;
    size_t start = 0;
    while (true) {
        size_t pos = allele_string.find('/', start);
        if (pos == std::string::npos) {
            alleles.push_back(allele_string.substr(start));
            break;
        }
        alleles.push_back(allele_string.substr(start, pos - start));
        start = pos + 1;
    }
    return alleles;
}

std::string join_alleles(const std::vector<std::string>& alleles) {
    std::string result;
    for (size_t i = 0; i < alleles.size(); ++i) {
        if (i > 0) result += "/";
        result += alleles[i];
    }
    return result;
}

bool is_symbolic_allele(const std::string& allele) {
    return std::any_of(allele.begin(), allele.end(),
                       [](char c) { return !is_iupac_char(c); });
}

std::string make_symbolic_deletion(size_t length) {
    return std::to_string(length) + SYMBOLIC_DELETION_SUFFIX;
}

std::optional<int> symbolic_deletion_length(const std::string& allele) {
    if (allele.size() <= SYMBOLIC_DELETION_SUFFIX.size()) return std::nullopt;

    size_t prefix_len = allele.size() - SYMBOLIC_DELETION_SUFFIX.size();
    if (allele.compare(prefix_len, std::string::npos, SYMBOLIC_DELETION_SUFFIX) != 0) {
        return std::nullopt;
    }

    std::string digits = allele.substr(0, prefix_len);
    if (!is_digits(digits)) return std::nullopt;

    try {
        return std::stoi(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string normalize_allele_string(
    const std::string& raw_allele_string,
    int strand,
    size_t max_length) {

    std::vector<std::string> alleles = split_allele_string(raw_allele_string);

    for (auto& allele : alleles) {
        if (strand < 0 && !is_symbolic_allele(allele)) {
            allele = reverse_complement(allele);
        }
        if (allele.size() > max_length) {
            allele = make_symbolic_deletion(allele.size());
        }
    }

    return join_alleles(alleles);
}

bool check_four_bases(const std::string& allele_string) {
    std::set<char> bases;
    for (const auto& allele : split_allele_string(allele_string)) {
        if (is_plain_base(allele)) {
            bases.insert(static_cast<char>(std::toupper(static_cast<unsigned char>(allele[0]))));
        }
    }
    return bases.size() == 4;
}

bool is_ambiguous_allele(const std::string& allele) {
    if (is_symbolic_allele(allele)) return false;
    return std::any_of(allele.begin(), allele.end(), [](char c) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return AMBIGUITY_SYMBOLS.find(u) != std::string::npos;
    });
}

bool check_for_ambiguous_alleles(const std::string& allele_string) {
    return !find_ambiguous_alleles(allele_string).empty();
}

std::vector<std::string> find_ambiguous_alleles(const std::string& allele_string) {
    std::vector<std::string> result;
    for (const auto& allele : split_allele_string(allele_string)) {
        if (is_ambiguous_allele(allele)) {
            result.push_back(allele);
        }
    }
    return result;
}

std::string remove_ambiguous_alleles(const std::string& allele_string) {
    std::vector<std::string> kept;
    for (const auto& allele : split_allele_string(allele_string)) {
        if (!is_ambiguous_allele(allele)) {
            kept.push_back(allele);
        }
    }
    return join_alleles(kept);
}

std::string ambiguity_code(const std::string& allele_string) {
    static const std::map<std::string, char> CODES = {
        {"A", 'A'}, {"C", 'C'}, {"G", 'G'}, {"T", 'T'},
        {"AG", 'R'}, {"CT", 'Y'}, {"CG", 'S'}, {"AT", 'W'},
        {"GT", 'K'}, {"AC", 'M'},
        {"CGT", 'B'}, {"AGT", 'D'}, {"ACT", 'H'}, {"ACG", 'V'},
        {"ACGT", 'N'}
    };

    std::set<char> bases;
    for (const auto& allele : split_allele_string(allele_string)) {
        if (!is_plain_base(allele)) return "";
        bases.insert(static_cast<char>(std::toupper(static_cast<unsigned char>(allele[0]))));
    }

    std::string key(bases.begin(), bases.end());
    auto it = CODES.find(key);
    return it != CODES.end() ? std::string(1, it->second) : "";
}

VariationClass variation_class(const std::string& allele_string) {
    if (allele_string.empty()) {
        return VariationClass::UNKNOWN;
    }

    std::vector<std::string> alleles = split_allele_string(allele_string);

    if (alleles.size() == 1) {
        return VariationClass::HET;
    }

    // Microsatellite repeat notation: (CA)14/25/26
    if (!alleles[0].empty() && alleles[0][0] == '(') {
        size_t close = alleles[0].find(')');
        if (close != std::string::npos && is_digits(alleles[0].substr(close + 1))) {
            return VariationClass::MICROSAT;
        }
    }

    bool all_single = true;
    bool has_gap = false;
    bool has_named = false;
    for (const auto& allele : alleles) {
        if (is_gap_allele(allele)) {
            has_gap = true;
            all_single = false;
        } else if (is_symbolic_allele(allele)) {
            has_named = true;
            all_single = false;
        } else if (!is_plain_base(allele)) {
            all_single = false;
        }
    }

    if (has_named) return VariationClass::NAMED;
    if (all_single) return VariationClass::SNP;

    if (has_gap) {
        // One gap and one sequence is a simple in-del; more than that is mixed
        return alleles.size() == 2 ? VariationClass::IN_DEL : VariationClass::MIXED;
    }

    size_t length = alleles[0].size();
    bool same_length = std::all_of(alleles.begin(), alleles.end(),
        [length](const std::string& a) { return a.size() == length; });
    if (same_length) return VariationClass::SUBSTITUTION;

    return VariationClass::MIXED;
}

} // namespace varnote
