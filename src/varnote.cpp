/**
 * varnote - core types, sequence utilities and logging
 */

#include "varnote.hpp"
#include "allele_normalizer.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace varnote {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// Variant
// ============================================================================

std::vector<std::string> Variant::alleles() const {
    return split_allele_string(allele_string);
}

std::string Variant::ref_allele_string() const {
    size_t sep = allele_string.find_first_of("/|\\");
    if (sep == std::string::npos) {
        return allele_string;
    }
    return allele_string.substr(0, sep);
}

bool Variant::has_valid_coordinates() const {
    // Widened so start - 1 cannot overflow
    return static_cast<long long>(end) >= static_cast<long long>(start) - 1 &&
           (strand == 1 || strand == -1);
}

std::string Variant::display_id() const {
    if (!name.empty()) return name;
    return seq_region + ":" + std::to_string(start) + "-" + std::to_string(end);
}

// ============================================================================
// Reference frames
// ============================================================================

ReferenceFrame parse_reference_frame(const std::string& scheme) {
    if (scheme == "g") return ReferenceFrame::GENOMIC;
    if (scheme == "c") return ReferenceFrame::CDNA;
    if (scheme == "p") return ReferenceFrame::PROTEIN;
    throw UnsupportedFrameError("Unknown numbering scheme: '" + scheme + "'");
}

std::string reference_frame_to_string(ReferenceFrame frame) {
    switch (frame) {
        case ReferenceFrame::GENOMIC: return "g";
        case ReferenceFrame::CDNA:    return "c";
        case ReferenceFrame::PROTEIN: return "p";
    }
    return "?";
}

// ============================================================================
// Sequence utilities
// ============================================================================

char complement_base(char base) {
    switch (base) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'G': return 'C';
        case 'C': return 'G';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'K': return 'M';
        case 'M': return 'K';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        case 'a': return 't';
        case 't': return 'a';
        case 'g': return 'c';
        case 'c': return 'g';
        case 'r': return 'y';
        case 'y': return 'r';
        case 'k': return 'm';
        case 'm': return 'k';
        case 'b': return 'v';
        case 'v': return 'b';
        case 'd': return 'h';
        case 'h': return 'd';
        default:  return base;  // N, S, W, '-' are self-complementary
    }
}

std::string reverse_complement(const std::string& seq) {
    std::string result(seq.rbegin(), seq.rend());
    for (char& c : result) {
        c = complement_base(c);
    }
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace varnote
