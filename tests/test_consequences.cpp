/**
 * Tests for consequence vocabulary, ranking and resolution
 */

#include <gtest/gtest.h>
#include "consequence.hpp"
#include <algorithm>

using namespace varnote;

using CT = ConsequenceType;

// ============================================================================
// Vocabulary
// ============================================================================

TEST(ConsequenceVocabulary, Version) {
    EXPECT_STREQ(CONSEQUENCE_VOCABULARY_VERSION, "1.0");
}

TEST(ConsequenceString, Tags) {
    EXPECT_EQ(consequence_to_string(CT::ESSENTIAL_SPLICE_SITE), "ESSENTIAL_SPLICE_SITE");
    EXPECT_EQ(consequence_to_string(CT::NON_SYNONYMOUS_CODING), "NON_SYNONYMOUS_CODING");
    EXPECT_EQ(consequence_to_string(CT::FIVE_PRIME_UTR), "5PRIME_UTR");
    EXPECT_EQ(consequence_to_string(CT::THREE_PRIME_UTR), "3PRIME_UTR");
    EXPECT_EQ(consequence_to_string(CT::INTERGENIC), "INTERGENIC");
}

TEST(ConsequenceString, ParseRoundTripsEveryTag) {
    for (const auto& entry : consequence_rank_table()) {
        auto parsed = parse_consequence_type(consequence_to_string(entry.first));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, entry.first);
    }
}

TEST(ConsequenceString, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_consequence_type("stop_gained"), CT::STOP_GAINED);
    EXPECT_EQ(parse_consequence_type("5prime_utr"), CT::FIVE_PRIME_UTR);
}

TEST(ConsequenceString, UnknownTag) {
    EXPECT_FALSE(parse_consequence_type("missense_variant").has_value());
    EXPECT_FALSE(parse_consequence_type("").has_value());
}

TEST(ConsequenceSet, ParseList) {
    EXPECT_EQ(parse_consequence_set("INTRONIC,SPLICE_SITE"),
              (ConsequenceSet{CT::INTRONIC, CT::SPLICE_SITE}));
    EXPECT_EQ(parse_consequence_set("INTRONIC,,BOGUS,UPSTREAM"),
              (ConsequenceSet{CT::INTRONIC, CT::UPSTREAM}));
    EXPECT_TRUE(parse_consequence_set("").empty());
}

TEST(ConsequenceSet, ToString) {
    EXPECT_EQ(consequence_set_to_string({CT::REGULATORY_REGION, CT::SPLICE_SITE, CT::INTRONIC}),
              "REGULATORY_REGION,SPLICE_SITE,INTRONIC");
    EXPECT_EQ(consequence_set_to_string({}), "");
}

// ============================================================================
// Ranking
// ============================================================================

TEST(ConsequenceRank, TableIsOrderedAndComplete) {
    const auto& table = consequence_rank_table();
    ASSERT_EQ(table.size(), 14u);
    for (size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(table[i].second, static_cast<int>(i) + 1);
        EXPECT_EQ(consequence_rank(table[i].first), table[i].second);
    }
}

TEST(ConsequenceRank, Extremes) {
    EXPECT_EQ(consequence_rank(CT::ESSENTIAL_SPLICE_SITE), 1);
    EXPECT_EQ(consequence_rank(CT::INTERGENIC), 14);
    EXPECT_LT(consequence_rank(CT::STOP_GAINED), consequence_rank(CT::SYNONYMOUS_CODING));
    EXPECT_LT(consequence_rank(CT::FIVE_PRIME_UTR), consequence_rank(CT::THREE_PRIME_UTR));
}

TEST(ConsequenceRank, Buckets) {
    EXPECT_TRUE(is_splice_site_consequence(CT::ESSENTIAL_SPLICE_SITE));
    EXPECT_TRUE(is_splice_site_consequence(CT::SPLICE_SITE));
    EXPECT_FALSE(is_splice_site_consequence(CT::INTRONIC));
    EXPECT_TRUE(is_regulatory_consequence(CT::REGULATORY_REGION));
    EXPECT_FALSE(is_regulatory_consequence(CT::UPSTREAM));
}

// ============================================================================
// Resolution
// ============================================================================

TEST(Resolve, EmptyIsIntergenic) {
    EXPECT_EQ(resolve(std::vector<ConsequenceSet>{}), (ConsequenceSet{CT::INTERGENIC}));
    EXPECT_EQ(resolve(std::vector<ConsequenceSet>{{}}), (ConsequenceSet{CT::INTERGENIC}));
}

TEST(Resolve, MostSevereType) {
    auto result = resolve(std::vector<ConsequenceSet>{
        {CT::INTRONIC},
        {CT::NON_SYNONYMOUS_CODING},
        {CT::THREE_PRIME_UTR}
    });
    EXPECT_EQ(result, (ConsequenceSet{CT::NON_SYNONYMOUS_CODING}));
}

TEST(Resolve, SpliceBeforeType) {
    auto result = resolve(std::vector<ConsequenceSet>{
        {CT::INTRONIC, CT::SPLICE_SITE},
        {CT::SYNONYMOUS_CODING}
    });
    EXPECT_EQ(result, (ConsequenceSet{CT::SPLICE_SITE, CT::SYNONYMOUS_CODING}));
}

TEST(Resolve, MostSevereSpliceKept) {
    auto result = resolve(std::vector<ConsequenceSet>{
        {CT::SPLICE_SITE, CT::INTRONIC},
        {CT::ESSENTIAL_SPLICE_SITE, CT::INTRONIC}
    });
    EXPECT_EQ(result, (ConsequenceSet{CT::ESSENTIAL_SPLICE_SITE, CT::INTRONIC}));
}

TEST(Resolve, RegulatoryFirst) {
    auto result = resolve(std::vector<ConsequenceSet>{
        {CT::SPLICE_SITE, CT::INTRONIC},
        {CT::REGULATORY_REGION, CT::UPSTREAM}
    });
    EXPECT_EQ(result, (ConsequenceSet{CT::REGULATORY_REGION, CT::SPLICE_SITE, CT::INTRONIC}));
}

TEST(Resolve, RegulatoryOnlyStillHasType) {
    auto result = resolve(std::vector<ConsequenceSet>{{CT::REGULATORY_REGION}});
    EXPECT_EQ(result, (ConsequenceSet{CT::REGULATORY_REGION, CT::INTERGENIC}));
}

TEST(Resolve, OrderIndependent) {
    std::vector<ConsequenceSet> sets = {
        {CT::UPSTREAM},
        {CT::SPLICE_SITE, CT::INTRONIC},
        {CT::REGULATORY_REGION},
        {CT::STOP_LOST}
    };
    ConsequenceSet expected = resolve(sets);
    std::sort(sets.begin(), sets.end());
    do {
        EXPECT_EQ(resolve(sets), expected);
    } while (std::next_permutation(sets.begin(), sets.end()));
}

TEST(Resolve, Associative) {
    ConsequenceSet a = {CT::INTRONIC, CT::SPLICE_SITE};
    ConsequenceSet b = {CT::REGULATORY_REGION, CT::DOWNSTREAM};
    ConsequenceSet c = {CT::FRAMESHIFT_CODING};

    ConsequenceSet all = resolve(std::vector<ConsequenceSet>{a, b, c});
    ConsequenceSet left = resolve(std::vector<ConsequenceSet>{resolve(std::vector<ConsequenceSet>{a, b}), c});
    ConsequenceSet right = resolve(std::vector<ConsequenceSet>{a, resolve(std::vector<ConsequenceSet>{b, c})});
    EXPECT_EQ(left, all);
    EXPECT_EQ(right, all);
}

TEST(Resolve, Idempotent) {
    ConsequenceSet once = resolve(std::vector<ConsequenceSet>{{CT::SPLICE_SITE, CT::UPSTREAM}});
    EXPECT_EQ(resolve(std::vector<ConsequenceSet>{once}), once);
}

TEST(Resolve, TranscriptAnnotations) {
    std::vector<TranscriptConsequence> annotations = {
        {"ENST1", "GENE1", {CT::INTRONIC}},
        {"ENST2", "GENE1", {CT::STOP_GAINED}},
        {"ENST3", "GENE2", {CT::ESSENTIAL_SPLICE_SITE, CT::DOWNSTREAM}}
    };
    EXPECT_EQ(resolve(annotations), (ConsequenceSet{CT::ESSENTIAL_SPLICE_SITE, CT::STOP_GAINED}));
    EXPECT_EQ(resolve_for_gene(annotations, "GENE1"), (ConsequenceSet{CT::STOP_GAINED}));
    EXPECT_EQ(resolve_for_gene(annotations, "GENE2"),
              (ConsequenceSet{CT::ESSENTIAL_SPLICE_SITE, CT::DOWNSTREAM}));
    EXPECT_EQ(resolve_for_gene(annotations, "GENE3"), (ConsequenceSet{CT::INTERGENIC}));
}

TEST(MostSevere, AcrossBuckets) {
    EXPECT_EQ(most_severe_consequence({CT::REGULATORY_REGION, CT::SPLICE_SITE, CT::INTRONIC}),
              CT::SPLICE_SITE);
    EXPECT_EQ(most_severe_consequence({CT::ESSENTIAL_SPLICE_SITE, CT::STOP_GAINED}),
              CT::ESSENTIAL_SPLICE_SITE);
    EXPECT_EQ(most_severe_consequence({}), CT::INTERGENIC);
}
