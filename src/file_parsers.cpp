/**
 * File format parsers implementation
 */

#include "file_parsers.hpp"
#include <sys/stat.h>
#include <stdexcept>
#include <zlib.h>

namespace varnote {

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> result;
    size_t pos = line.find_first_not_of(" \t");
    while (pos != std::string::npos) {
        size_t end = line.find_first_of(" \t", pos);
        result.emplace_back(line, pos, end == std::string::npos ? std::string::npos : end - pos);
        pos = line.find_first_not_of(" \t", end);
    }
    return result;
}

std::optional<int> parse_int(const std::string& field) {
    if (field.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        int value = std::stoi(field, &consumed);
        if (consumed != field.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

// ============================================================================
// LineReader
// ============================================================================

LineReader::LineReader(const std::string& path) : gz_(nullptr), path_(path) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    gz_ = gz;
}

LineReader::~LineReader() {
    if (gz_) gzclose(static_cast<gzFile>(gz_));
}

bool LineReader::next(std::string& line) {
    gzFile gz = static_cast<gzFile>(gz_);
    char buffer[65536];

    if (gzgets(gz, buffer, sizeof(buffer)) == nullptr) return false;
    line = buffer;
    // Lines longer than the buffer arrive in pieces
    while (!line.empty() && line.back() != '\n' && !gzeof(gz)) {
        if (gzgets(gz, buffer, sizeof(buffer)) == nullptr) break;
        line += buffer;
    }
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    line_number_++;
    return true;
}

// ============================================================================
// Variant input
// ============================================================================

std::optional<int> parse_strand(const std::string& field) {
    if (field == "1" || field == "+1" || field == "+") return 1;
    if (field == "-1" || field == "-") return -1;
    return std::nullopt;
}

VariantParseResult parse_variant_line(const std::string& line) {
    VariantParseResult result;

    auto fields = split_whitespace(line);
    if (fields.size() < 5) {
        result.error_message = "Invalid Ensembl format: need at least 5 fields";
        return result;
    }

    auto start = parse_int(fields[1]);
    auto end = parse_int(fields[2]);
    if (!start || !end || *start < 1) {
        result.error_message = "Invalid coordinates: " + fields[1] + " " + fields[2];
        return result;
    }

    auto strand = parse_strand(fields[4]);
    if (!strand) {
        result.error_message = "Unknown strand: " + fields[4];
        return result;
    }

    Variant& v = result.variant;
    v.seq_region = fields[0];
    v.start = *start;
    v.end = *end;
    v.allele_string = fields[3];
    v.strand = *strand;
    if (fields.size() > 5) v.name = fields[5];
    if (fields.size() > 6) v.source = fields[6];
    if (fields.size() > 7) v.validation_code = fields[7];

    if (!v.has_valid_coordinates()) {
        result.error_message = "End " + fields[2] + " is before start " + fields[1] + " - 1";
        return result;
    }

    result.valid = true;
    return result;
}

// ============================================================================
// Transcript table
// ============================================================================

namespace {

bool parse_int_list(const std::string& field, std::vector<int>& values) {
    for (const auto& item : split_line(field, ',')) {
        if (item.empty()) continue;  // Trailing comma as written by UCSC tables
        auto value = parse_int(item);
        if (!value) return false;
        values.push_back(*value);
    }
    return !values.empty();
}

bool parse_coding_bound(const std::string& field, std::optional<int>& bound) {
    if (field == "." || field.empty()) {
        bound.reset();
        return true;
    }
    bound = parse_int(field);
    return bound.has_value();
}

} // anonymous namespace

TranscriptParseResult parse_transcript_line(const std::string& line) {
    TranscriptParseResult result;

    auto fields = split_line(line, '\t');
    if (fields.size() < 8) {
        result.error_message = "Expected 8 tab-separated fields, found " +
                               std::to_string(fields.size());
        return result;
    }

    TranscriptModel& tr = result.transcript;
    tr.id = fields[0];
    tr.gene_id = fields[1];
    tr.seq_region = fields[2];

    auto strand = parse_strand(fields[3]);
    if (!strand) {
        result.error_message = "Unknown strand: " + fields[3];
        return result;
    }
    tr.exon_map.strand = *strand;

    std::vector<int> starts, ends;
    if (!parse_int_list(fields[4], starts) || !parse_int_list(fields[5], ends)) {
        result.error_message = "Invalid exon coordinates for " + tr.id;
        return result;
    }
    if (starts.size() != ends.size()) {
        result.error_message = "Exon start/end count mismatch for " + tr.id;
        return result;
    }
    for (size_t i = 0; i < starts.size(); ++i) {
        if (ends[i] < starts[i]) {
            result.error_message = "Exon end before start for " + tr.id;
            return result;
        }
        tr.exon_map.exons.push_back({starts[i], ends[i]});
    }
    tr.exon_map.sort_exons();

    if (!parse_coding_bound(fields[6], tr.exon_map.coding_start) ||
        !parse_coding_bound(fields[7], tr.exon_map.coding_end)) {
        result.error_message = "Invalid coding bounds for " + tr.id;
        return result;
    }
    if (tr.exon_map.coding_start.has_value() != tr.exon_map.coding_end.has_value()) {
        result.error_message = "Coding start and end must both be set for " + tr.id;
        return result;
    }

    result.valid = true;
    return result;
}

// ============================================================================
// Consequence table
// ============================================================================

ConsequenceParseResult parse_consequence_line(const std::string& line) {
    ConsequenceParseResult result;

    auto fields = split_line(line, '\t');
    if (fields.size() < 4) {
        result.error_message = "Expected 4 tab-separated fields, found " +
                               std::to_string(fields.size());
        return result;
    }

    result.variant_name = fields[0];
    result.consequence.transcript_id = fields[1];
    result.consequence.gene_id = fields[2];
    result.consequence.consequences = parse_consequence_set(fields[3]);

    if (result.variant_name.empty()) {
        result.error_message = "Missing variant name";
        return result;
    }

    result.valid = true;
    return result;
}

ConsequenceTable load_consequence_table(const std::string& path) {
    log(LogLevel::INFO, "Loading consequences from: " + path + " (vocabulary " +
        CONSEQUENCE_VOCABULARY_VERSION + ")");

    ConsequenceTable table;
    LineReader reader(path);
    std::string line;
    size_t count = 0;

    while (reader.next(line)) {
        if (line.empty() || line[0] == '#') continue;

        auto parsed = parse_consequence_line(line);
        if (!parsed.valid) {
            log(LogLevel::WARNING, path + ":" + std::to_string(reader.line_number()) + ": " +
                parsed.error_message);
            continue;
        }

        table[parsed.variant_name].push_back(std::move(parsed.consequence));
        count++;
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(count) + " transcript consequences for " +
        std::to_string(table.size()) + " variants");
    return table;
}

} // namespace varnote
