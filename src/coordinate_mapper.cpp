/**
 * Genomic to cDNA coordinate mapping
 */

#include "coordinate_mapper.hpp"
#include "varnote.hpp"
#include <algorithm>
#include <tuple>
#include <cstdlib>

namespace varnote {

// ============================================================================
// ExonMap
// ============================================================================

void ExonMap::sort_exons() {
    std::sort(exons.begin(), exons.end(),
              [](const Exon& a, const Exon& b) { return a.start < b.start; });
}

int ExonMap::span_start() const {
    return exons.empty() ? 0 : exons.front().start;
}

int ExonMap::span_end() const {
    return exons.empty() ? 0 : exons.back().end;
}

int ExonMap::cdna_length() const {
    int total = 0;
    for (const auto& exon : exons) {
        total += exon.length();
    }
    return total;
}

std::vector<std::pair<int, int>> ExonMap::exon_cdna_ranges() const {
    std::vector<std::pair<int, int>> ranges(exons.size());
    int n = static_cast<int>(exons.size());

    int cdna = 1;
    for (int k = 0; k < n; ++k) {
        // Transcript order runs from the highest exon on the reverse strand
        int i = (strand >= 0) ? k : n - 1 - k;
        ranges[i] = {cdna, cdna + exons[i].length() - 1};
        cdna += exons[i].length();
    }

    return ranges;
}

// ============================================================================
// TranscriptModel
// ============================================================================

bool TranscriptModel::overlaps(int start, int end) const {
    if (exon_map.exons.empty()) return false;
    if (end == start - 1) {
        return start > exon_map.span_start() && end < exon_map.span_end();
    }
    return start <= exon_map.span_end() && end >= exon_map.span_start();
}

// ============================================================================
// CdnaPosition
// ============================================================================

std::string CdnaPosition::to_string() const {
    std::string result = three_prime_utr ? "*" : "";
    result += std::to_string(coordinate);
    if (intron_offset > 0) {
        result += "+" + std::to_string(intron_offset);
    } else if (intron_offset < 0) {
        result += "-" + std::to_string(std::abs(intron_offset));
    }
    return result;
}

bool CdnaPosition::operator<(const CdnaPosition& other) const {
    return std::tie(transcript_position, intron_offset) <
           std::tie(other.transcript_position, other.intron_offset);
}

bool CdnaPosition::operator==(const CdnaPosition& other) const {
    return coordinate == other.coordinate && three_prime_utr == other.three_prime_utr &&
           intron_offset == other.intron_offset &&
           transcript_position == other.transcript_position;
}

// ============================================================================
// Mapping
// ============================================================================

namespace {

CdnaPosition rebase(int raw, int offset, const ExonMap& exon_map) {
    CdnaPosition pos;
    pos.transcript_position = raw;
    pos.intron_offset = offset;

    int coord = raw;
    if (exon_map.coding_end && coord > *exon_map.coding_end) {
        pos.three_prime_utr = true;
        coord -= *exon_map.coding_end;
    } else if (exon_map.coding_start) {
        // No position 0: the base before the start codon is -1
        int cs = *exon_map.coding_start;
        coord += (coord >= cs) ? 1 : 0;
        coord -= cs;
    }

    pos.coordinate = coord;
    return pos;
}

} // anonymous namespace

CdnaPosition to_cdna(int genomic_position, const ExonMap& exon_map) {
    const auto& exons = exon_map.exons;
    if (exons.empty()) {
        throw OutOfTranscriptBoundsError("Transcript has no exons");
    }

    auto ranges = exon_map.exon_cdna_ranges();
    bool forward = exon_map.strand >= 0;

    for (size_t i = 0; i < exons.size(); ++i) {
        const Exon& exon = exons[i];
        if (exon.end < genomic_position) continue;

        if (genomic_position >= exon.start) {
            int raw = forward
                ? ranges[i].first + (genomic_position - exon.start)
                : ranges[i].first + (exon.end - genomic_position);
            return rebase(raw, 0, exon_map);
        }

        if (i == 0) break;

        // Intronic: anchor on the closer flanking exon
        const Exon& prev = exons[i - 1];
        int updist = genomic_position - prev.end;
        int downdist = exon.start - genomic_position;

        if (updist < downdist || (updist == downdist && forward)) {
            return forward
                ? rebase(ranges[i - 1].second, updist, exon_map)
                : rebase(ranges[i - 1].first, -updist, exon_map);
        }
        return forward
            ? rebase(ranges[i].first, -downdist, exon_map)
            : rebase(ranges[i].second, downdist, exon_map);
    }

    throw OutOfTranscriptBoundsError("Position " + std::to_string(genomic_position) +
                                     " is outside transcript exons " +
                                     std::to_string(exon_map.span_start()) + "-" +
                                     std::to_string(exon_map.span_end()));
}

} // namespace varnote
