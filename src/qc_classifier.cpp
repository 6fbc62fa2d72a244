/**
 * Variant QC checks
 */

#include "qc_classifier.hpp"
#include "allele_normalizer.hpp"
#include "reference_checker.hpp"
#include <stdexcept>

namespace varnote {

std::string qc_failure_description(int code) {
    switch (code) {
        case QC_REFERENCE_MISMATCH:
            return "Reference allele does not match the reference sequence";
        case QC_ALL_FOUR_BASES:
            return "Alleles denote all four bases";
        case QC_AMBIGUOUS_ALLELE:
            return "Alleles contain ambiguity codes";
        case QC_COORDINATE_ERROR:
            return "Coordinates are not compatible with the reference allele";
        default:
            return "Unknown failure";
    }
}

std::string QcFailureSet::to_string() const {
    std::string result;
    for (int code : codes_) {
        if (!result.empty()) result += ",";
        result += std::to_string(code);
    }
    return result;
}

QcFailureSet QcFailureSet::parse(const std::string& text) {
    QcFailureSet result;
    size_t start = 0;
    while (start < text.size()) {
        size_t pos = text.find(',', start);
        std::string field = text.substr(start, pos == std::string::npos ? std::string::npos : pos - start);

        size_t first = field.find_first_not_of(" \t");
        if (first != std::string::npos) {
            size_t last = field.find_last_not_of(" \t");
            field = field.substr(first, last - first + 1);
            size_t consumed = 0;
            int code = std::stoi(field, &consumed);
            if (consumed != field.size()) {
                throw std::invalid_argument("Invalid QC failure code: '" + field + "'");
            }
            result.add(code);
        }

        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return result;
}

QcFailureSet classify(const Variant& variant, const SequenceProvider& provider) {
    QcFailureSet fails;

    ReferenceCheckResult ref = check_reference(variant, provider);
    if (!ref.retrieved) {
        log(LogLevel::DEBUG, variant.display_id() + " failed reference lookup: " + ref.error_message);
        fails.add(QC_COORDINATE_ERROR);
        return fails;
    }

    if (check_four_bases(variant.allele_string)) {
        fails.add(QC_ALL_FOUR_BASES);
    }

    if (check_for_ambiguous_alleles(variant.allele_string)) {
        fails.add(QC_AMBIGUOUS_ALLELE);
    }

    if (ref.outcome == MatchOutcome::MISMATCH) {
        fails.add(QC_REFERENCE_MISMATCH);
    }

    if (!check_variant_size(variant.start, variant.end, variant.ref_allele_string())) {
        fails.add(QC_COORDINATE_ERROR);
    }

    return fails;
}

} // namespace varnote
