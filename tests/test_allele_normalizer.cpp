/**
 * Tests for allele normalization, ambiguity detection and variation class
 */

#include <gtest/gtest.h>
#include "allele_normalizer.hpp"
#include "varnote.hpp"

using namespace varnote;

// ============================================================================
// Reverse complement
// ============================================================================

TEST(ReverseComplement, BasicSequences) {
    EXPECT_EQ(reverse_complement("ACGT"), "ACGT");
    EXPECT_EQ(reverse_complement("AAC"), "GTT");
    EXPECT_EQ(reverse_complement("acgtn"), "nacgt");
    EXPECT_EQ(reverse_complement("-"), "-");
    EXPECT_EQ(reverse_complement(""), "");
}

TEST(ReverseComplement, IUPACCodes) {
    EXPECT_EQ(reverse_complement("R"), "Y");
    EXPECT_EQ(reverse_complement("KM"), "KM");
    EXPECT_EQ(reverse_complement("BDHV"), "BDHV");
    EXPECT_EQ(reverse_complement("SWN"), "NWS");
}

TEST(ReverseComplement, IsInvolution) {
    for (const std::string seq : {"A", "GATTACA", "ACGTRYKMBDHVNSW", "cagT-", "TTTTTTTTTG"}) {
        EXPECT_EQ(reverse_complement(reverse_complement(seq)), seq) << seq;
    }
}

// ============================================================================
// Splitting and symbolic alleles
// ============================================================================

TEST(AlleleString, Split) {
    EXPECT_EQ(split_allele_string("A/G"), (std::vector<std::string>{"A", "G"}));
    EXPECT_EQ(split_allele_string("-/CA/T"), (std::vector<std::string>{"-", "CA", "T"}));
    EXPECT_EQ(split_allele_string("A/"), (std::vector<std::string>{"A", ""}));
    EXPECT_EQ(split_allele_string("A"), (std::vector<std::string>{"A"}));
}

TEST(AlleleString, Join) {
    EXPECT_EQ(join_alleles({"A", "G", "T"}), "A/G/T");
    EXPECT_EQ(join_alleles({}), "");
}

TEST(SymbolicAllele, Detection) {
    EXPECT_TRUE(is_symbolic_allele("1200_base_deletion"));
    EXPECT_TRUE(is_symbolic_allele("PhenCode_variation"));
    EXPECT_TRUE(is_symbolic_allele("LARGEDELETION"));
    EXPECT_FALSE(is_symbolic_allele("ACGT"));
    EXPECT_FALSE(is_symbolic_allele("acgtn"));
    EXPECT_FALSE(is_symbolic_allele("-"));
    EXPECT_FALSE(is_symbolic_allele(""));
    EXPECT_FALSE(is_symbolic_allele("RYKM"));
}

TEST(SymbolicAllele, DeletionLength) {
    EXPECT_EQ(make_symbolic_deletion(4500), "4500_base_deletion");
    EXPECT_EQ(symbolic_deletion_length("4500_base_deletion"), 4500);
    EXPECT_FALSE(symbolic_deletion_length("_base_deletion").has_value());
    EXPECT_FALSE(symbolic_deletion_length("x12_base_deletion").has_value());
    EXPECT_FALSE(symbolic_deletion_length("ACGT").has_value());
    EXPECT_FALSE(symbolic_deletion_length("PhenCode_variation").has_value());
}

// ============================================================================
// Strand normalization
// ============================================================================

TEST(NormalizeAlleles, ForwardStrandUnchanged) {
    EXPECT_EQ(normalize_allele_string("A/G", 1), "A/G");
    EXPECT_EQ(normalize_allele_string("-/CAT", 1), "-/CAT");
}

TEST(NormalizeAlleles, ReverseStrandComplemented) {
    EXPECT_EQ(normalize_allele_string("A/G", -1), "T/C");
    EXPECT_EQ(normalize_allele_string("-/CAT", -1), "-/ATG");
    EXPECT_EQ(normalize_allele_string("AC/G/TT", -1), "GT/C/AA");
}

TEST(NormalizeAlleles, SymbolicAllelesNotFlipped) {
    EXPECT_EQ(normalize_allele_string("A/PhenCode_variation", -1), "T/PhenCode_variation");
    EXPECT_EQ(normalize_allele_string("5000_base_deletion/-", -1), "5000_base_deletion/-");
}

TEST(NormalizeAlleles, LongAlleleCollapsed) {
    std::string long_allele(4001, 'A');
    EXPECT_EQ(normalize_allele_string(long_allele + "/-", 1), "4001_base_deletion/-");

    std::string limit_allele(4000, 'C');
    EXPECT_EQ(normalize_allele_string(limit_allele + "/-", 1), limit_allele + "/-");
}

TEST(NormalizeAlleles, CustomLengthLimit) {
    EXPECT_EQ(normalize_allele_string("ACGTAC/-", 1, 5), "6_base_deletion/-");
    EXPECT_EQ(normalize_allele_string("ACGTAC/-", -1, 6), "GTACGT/-");
}

// ============================================================================
// Allele checks
// ============================================================================

TEST(FourBases, AllFourPresent) {
    EXPECT_TRUE(check_four_bases("A/C/G/T"));
    EXPECT_TRUE(check_four_bases("T/G/c/a"));
    EXPECT_TRUE(check_four_bases("A/C/G/T/-"));
}

TEST(FourBases, NotAllFour) {
    EXPECT_FALSE(check_four_bases("A/C/G"));
    EXPECT_FALSE(check_four_bases("A/C/G/TT"));
    EXPECT_FALSE(check_four_bases("ACGT/-"));
    EXPECT_FALSE(check_four_bases("A/A/C/G"));
}

TEST(AmbiguousAlleles, Detection) {
    EXPECT_TRUE(check_for_ambiguous_alleles("N/T"));
    EXPECT_TRUE(check_for_ambiguous_alleles("A/R"));
    EXPECT_TRUE(check_for_ambiguous_alleles("ACY/-"));
    EXPECT_TRUE(check_for_ambiguous_alleles("a/n"));
    EXPECT_FALSE(check_for_ambiguous_alleles("A/G"));
    EXPECT_FALSE(check_for_ambiguous_alleles("-/CAT"));
}

TEST(AmbiguousAlleles, SymbolicAllelesIgnored) {
    // Symbolic text contains letters like D and N but is not sequence
    EXPECT_FALSE(check_for_ambiguous_alleles("1200_base_deletion/-"));
    EXPECT_FALSE(check_for_ambiguous_alleles("A/PhenCode_variation"));
}

TEST(AmbiguousAlleles, FindAndRemove) {
    EXPECT_EQ(find_ambiguous_alleles("A/N/T/RY"), (std::vector<std::string>{"N", "RY"}));
    EXPECT_EQ(remove_ambiguous_alleles("A/N/T/RY"), "A/T");
    EXPECT_EQ(remove_ambiguous_alleles("A/G"), "A/G");
}

// ============================================================================
// Ambiguity code and variation class
// ============================================================================

TEST(AmbiguityCode, Pairs) {
    EXPECT_EQ(ambiguity_code("A/G"), "R");
    EXPECT_EQ(ambiguity_code("C/T"), "Y");
    EXPECT_EQ(ambiguity_code("G/C"), "S");
    EXPECT_EQ(ambiguity_code("T/A"), "W");
    EXPECT_EQ(ambiguity_code("G/T"), "K");
    EXPECT_EQ(ambiguity_code("A/C"), "M");
}

TEST(AmbiguityCode, TriplesAndAll) {
    EXPECT_EQ(ambiguity_code("C/G/T"), "B");
    EXPECT_EQ(ambiguity_code("A/G/T"), "D");
    EXPECT_EQ(ambiguity_code("A/C/T"), "H");
    EXPECT_EQ(ambiguity_code("A/C/G"), "V");
    EXPECT_EQ(ambiguity_code("A/C/G/T"), "N");
    EXPECT_EQ(ambiguity_code("A/A"), "A");
}

TEST(AmbiguityCode, NonSingleBaseAlleles) {
    EXPECT_EQ(ambiguity_code("-/A"), "");
    EXPECT_EQ(ambiguity_code("AC/G"), "");
}

TEST(VariationClass, Classes) {
    EXPECT_EQ(variation_class("A/G"), VariationClass::SNP);
    EXPECT_EQ(variation_class("A/C/T"), VariationClass::SNP);
    EXPECT_EQ(variation_class("-/ACG"), VariationClass::IN_DEL);
    EXPECT_EQ(variation_class("1200_base_deletion/-"), VariationClass::NAMED);
    EXPECT_EQ(variation_class("AC/GT"), VariationClass::SUBSTITUTION);
    EXPECT_EQ(variation_class("(CA)14/25/26"), VariationClass::MICROSAT);
    EXPECT_EQ(variation_class("A/-/TT"), VariationClass::MIXED);
    EXPECT_EQ(variation_class("AC/G"), VariationClass::MIXED);
    EXPECT_EQ(variation_class("A"), VariationClass::HET);
    EXPECT_EQ(variation_class(""), VariationClass::UNKNOWN);
}

TEST(VariationClass, Names) {
    EXPECT_EQ(variation_class_to_string(VariationClass::SNP), "snp");
    EXPECT_EQ(variation_class_to_string(VariationClass::IN_DEL), "in-del");
    EXPECT_EQ(variation_class_to_string(VariationClass::MICROSAT), "microsat");
}
