/**
 * QC Classifier
 *
 * Runs the variant-level quality checks and reports them as failure codes:
 *   2  - reference allele does not match the reference sequence
 *   3  - alleles denote all four bases
 *   14 - an allele contains an IUPAC ambiguity code
 *   15 - reference not retrievable, or coordinates inconsistent with the
 *        reference allele length
 */

#ifndef QC_CLASSIFIER_HPP
#define QC_CLASSIFIER_HPP

#include "varnote.hpp"
#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace varnote {

constexpr int QC_REFERENCE_MISMATCH = 2;
constexpr int QC_ALL_FOUR_BASES = 3;
constexpr int QC_AMBIGUOUS_ALLELE = 14;
constexpr int QC_COORDINATE_ERROR = 15;

/**
 * Get a description of a failure code
 */
std::string qc_failure_description(int code);

/**
 * Set of QC failure codes. Empty means the variant passed.
 */
class QcFailureSet {
public:
    QcFailureSet() = default;
    QcFailureSet(std::initializer_list<int> codes) : codes_(codes) {}

    void add(int code) { codes_.insert(code); }
    bool contains(int code) const { return codes_.count(code) > 0; }
    bool empty() const { return codes_.empty(); }
    size_t size() const { return codes_.size(); }

    /**
     * Codes in ascending order
     */
    std::vector<int> codes() const { return {codes_.begin(), codes_.end()}; }

    /**
     * Comma-joined codes, e.g. "2,14"; empty string when passed
     */
    std::string to_string() const;

    /**
     * Parse a comma-joined code list
     * @throws std::invalid_argument on a non-numeric code
     */
    static QcFailureSet parse(const std::string& text);

    bool operator==(const QcFailureSet& other) const { return codes_ == other.codes_; }
    bool operator!=(const QcFailureSet& other) const { return codes_ != other.codes_; }

private:
    std::set<int> codes_;
};

/**
 * Run all QC checks on a variant.
 *
 * The reference sequence is retrieved first; if that fails the result is
 * exactly {15}. Otherwise checks 2, 3, 14 and 15 run independently.
 */
QcFailureSet classify(const Variant& variant, const SequenceProvider& provider);

} // namespace varnote

#endif // QC_CLASSIFIER_HPP
