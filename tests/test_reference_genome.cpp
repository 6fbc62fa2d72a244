/**
 * Tests for FASTA loading, sequence fetches and core sequence utilities
 */

#include <gtest/gtest.h>
#include "varnote.hpp"
#include "allele_normalizer.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <tuple>
#include <zlib.h>

using namespace varnote;

namespace {

// RAII temp file cleanup
class TempFile {
public:
    TempFile(const std::string& suffix = ".fa") {
        path_ = std::filesystem::temp_directory_path() / ("test_reference_" + std::to_string(counter_++) + suffix);
    }
    ~TempFile() {
        std::filesystem::remove(path_);
    }
    std::string path() const { return path_.string(); }
private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

const char* FASTA =
    ">chr1 test chromosome\n"
    "ACGTACGTAC\n"
    "ggattacagt\n"
    "\n"
    ">2\r\n"
    "TTTTCCCCGGGGAAAA\r\n";

} // namespace

// ============================================================================
// ReferenceGenome
// ============================================================================

TEST(ReferenceGenome, LoadPlainFasta) {
    TempFile tmp;
    {
        std::ofstream out(tmp.path());
        out << FASTA;
    }

    ReferenceGenome genome(tmp.path());
    EXPECT_EQ(genome.region_count(), 2u);
    EXPECT_EQ(genome.region_length("1"), 20);
    EXPECT_EQ(genome.region_length("2"), 16);
    EXPECT_EQ(genome.fetch("1", 1, 4), "ACGT");
    // Lines are joined and uppercased
    EXPECT_EQ(genome.fetch("1", 9, 12), "ACGG");
    EXPECT_EQ(genome.fetch("2", 16, 16), "A");
}

TEST(ReferenceGenome, LoadGzippedFasta) {
    TempFile tmp(".fa.gz");
    gzFile gz = gzopen(tmp.path().c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    std::string content = FASTA;
    gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    gzclose(gz);

    ReferenceGenome genome(tmp.path());
    EXPECT_EQ(genome.region_count(), 2u);
    EXPECT_EQ(genome.fetch("2", 5, 8), "CCCC");
}

TEST(ReferenceGenome, ChrPrefixIgnored) {
    auto genome = ReferenceGenome::from_sequences({{"chrX", "acgt"}});
    EXPECT_TRUE(genome->has_region("X"));
    EXPECT_TRUE(genome->has_region("chrX"));
    EXPECT_EQ(genome->fetch("chrX", 2, 3), "CG");
    EXPECT_FALSE(genome->has_region("Y"));
    EXPECT_EQ(genome->region_length("Y"), 0);
}

TEST(ReferenceGenome, FetchErrors) {
    auto genome = ReferenceGenome::from_sequences({{"1", "ACGTACGT"}});
    EXPECT_THROW(genome->fetch("2", 1, 1), CoordinateError);
    EXPECT_THROW(genome->fetch("1", 0, 1), CoordinateError);
    EXPECT_THROW(genome->fetch("1", 5, 4), CoordinateError);
    EXPECT_THROW(genome->fetch("1", 8, 9), CoordinateError);
    EXPECT_EQ(genome->fetch("1", 8, 8), "T");
}

TEST(ReferenceGenome, MissingFileThrows) {
    EXPECT_THROW(ReferenceGenome("/nonexistent/genome.fa"), std::runtime_error);
}

TEST(ReferenceGenome, EmptyFileThrows) {
    TempFile tmp;
    {
        std::ofstream out(tmp.path());
        out << "\n";
    }
    EXPECT_THROW(ReferenceGenome genome(tmp.path()), std::runtime_error);
}

TEST(IndexedFastaReader, MissingFileIsInvalid) {
    IndexedFastaReader reader("/nonexistent/genome.fa");
    EXPECT_FALSE(reader.is_valid());
    EXPECT_FALSE(reader.has_region("1"));
    EXPECT_EQ(reader.region_length("1"), 0);
    EXPECT_THROW(reader.fetch("1", 1, 1), CoordinateError);
}

#ifdef HAVE_HTSLIB

TEST(IndexedFastaReader, FetchMatchesInMemoryGenome) {
    TempFile tmp;
    {
        // faidx needs uniform line lengths
        std::ofstream out(tmp.path());
        out << ">chr1\n"
               "ACGTACGTAC\n"
               "ggattacagt\n"
               ">2\n"
               "TTTTCCCCGG\n"
               "GGAAAA\n";
    }

    {
        IndexedFastaReader reader(tmp.path());
        ASSERT_TRUE(reader.is_valid());

        EXPECT_EQ(reader.fetch("chr1", 1, 4), "ACGT");
        // "chr" prefix added or stripped to find the indexed name
        EXPECT_EQ(reader.fetch("1", 9, 12), "ACGG");
        EXPECT_EQ(reader.fetch("chr2", 5, 8), "CCCC");
        EXPECT_EQ(reader.region_length("1"), 20);
        EXPECT_EQ(reader.region_length("chr1"), 20);
        EXPECT_EQ(reader.region_length("2"), 16);
        EXPECT_TRUE(reader.has_region("2"));
        EXPECT_FALSE(reader.has_region("X"));

        EXPECT_THROW(reader.fetch("1", 19, 21), CoordinateError);
        EXPECT_THROW(reader.fetch("1", 0, 1), CoordinateError);
        EXPECT_THROW(reader.fetch("1", 5, 4), CoordinateError);
        EXPECT_THROW(reader.fetch("3", 1, 1), CoordinateError);

        ReferenceGenome genome(tmp.path());
        for (const auto& [region, start, end] : std::vector<std::tuple<std::string, int, int>>{
                 {"1", 1, 20}, {"1", 10, 11}, {"2", 1, 16}, {"2", 16, 16}}) {
            EXPECT_EQ(reader.fetch(region, start, end), genome.fetch(region, start, end))
                << region << ":" << start << "-" << end;
        }
    }

    std::remove((tmp.path() + ".fai").c_str());
}

#endif // HAVE_HTSLIB

// ============================================================================
// Variant
// ============================================================================

TEST(Variant, Alleles) {
    Variant v;
    v.allele_string = "A/G/-";
    EXPECT_EQ(v.alleles(), (std::vector<std::string>{"A", "G", "-"}));
    EXPECT_EQ(v.ref_allele_string(), "A");

    v.allele_string = "A/";
    EXPECT_EQ(v.alleles(), (std::vector<std::string>{"A", ""}));

    v.allele_string = "AC|T";
    EXPECT_EQ(v.ref_allele_string(), "AC");

    // Same splitting as split_allele_string
    v.allele_string = "";
    EXPECT_EQ(v.alleles(), split_allele_string(""));
    EXPECT_EQ(v.alleles(), (std::vector<std::string>{""}));
    v.allele_string = "-/CA";
    EXPECT_EQ(v.alleles(), split_allele_string("-/CA"));
}

TEST(Variant, Coordinates) {
    Variant v;
    v.seq_region = "1";
    v.start = 101;
    v.end = 100;
    EXPECT_TRUE(v.is_insertion());
    EXPECT_TRUE(v.has_valid_coordinates());
    EXPECT_EQ(v.display_id(), "1:101-100");

    v.end = 99;
    EXPECT_FALSE(v.has_valid_coordinates());

    v.end = 101;
    v.strand = 0;
    EXPECT_FALSE(v.has_valid_coordinates());

    v.name = "rs42";
    EXPECT_EQ(v.display_id(), "rs42");
}

TEST(Variant, ExtremeCoordinatesDoNotOverflow) {
    Variant v;
    v.seq_region = "1";
    v.start = std::numeric_limits<int>::min();
    v.end = std::numeric_limits<int>::min();
    EXPECT_TRUE(v.has_valid_coordinates());
    EXPECT_FALSE(v.is_insertion());

    v.end = std::numeric_limits<int>::max();
    EXPECT_TRUE(v.has_valid_coordinates());

    v.start = std::numeric_limits<int>::max();
    v.end = std::numeric_limits<int>::min();
    EXPECT_FALSE(v.has_valid_coordinates());
}

// ============================================================================
// Sequence utilities
// ============================================================================

TEST(SequenceUtils, ComplementBase) {
    EXPECT_EQ(complement_base('A'), 'T');
    EXPECT_EQ(complement_base('g'), 'c');
    EXPECT_EQ(complement_base('R'), 'Y');
    EXPECT_EQ(complement_base('N'), 'N');
    EXPECT_EQ(complement_base('-'), '-');
}

TEST(SequenceUtils, ToUpper) {
    EXPECT_EQ(to_upper("acgT-n"), "ACGT-N");
}

TEST(ReferenceFrame, RoundTrip) {
    for (ReferenceFrame frame : {ReferenceFrame::GENOMIC, ReferenceFrame::CDNA, ReferenceFrame::PROTEIN}) {
        EXPECT_EQ(parse_reference_frame(reference_frame_to_string(frame)), frame);
    }
}

// ============================================================================
// Logging
// ============================================================================

TEST(Logging, LevelFilter) {
    LogLevel saved = get_log_level();
    set_log_level(LogLevel::WARNING);
    EXPECT_EQ(get_log_level(), LogLevel::WARNING);

    testing::internal::CaptureStderr();
    log(LogLevel::INFO, "hidden message");
    log(LogLevel::ERROR, "shown message");
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("hidden message"), std::string::npos);
    EXPECT_NE(output.find("ERROR - shown message"), std::string::npos);
    set_log_level(saved);
}
