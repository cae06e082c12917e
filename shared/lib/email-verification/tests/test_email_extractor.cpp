/**
 * @file test_email_extractor.cpp
 * @brief Unit tests for address extraction from free text
 */

#include <gtest/gtest.h>
#include <everify/verification/email_extractor.h>

using namespace everify::verification;

// ============================================================================
// findEmailCandidates
// ============================================================================

TEST(EmailExtractorTest, FindsAddressesInProse) {
    auto found = findEmailCandidates("Contact john@example.com or Jane.Doe@Mail.Example.org today.");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0], "john@example.com");
    EXPECT_EQ(found[1], "Jane.Doe@Mail.Example.org");
}

TEST(EmailExtractorTest, CsvCellsAndQuotes) {
    auto found = findEmailCandidates("id,email\n1,\"a@x.io\"\n2,b@y.net\n");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0], "a@x.io");
    EXPECT_EQ(found[1], "b@y.net");
}

TEST(EmailExtractorTest, TrailingPunctuationExcluded) {
    auto found = findEmailCandidates("write to <john@example.com>.");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "john@example.com");
}

TEST(EmailExtractorTest, DomainStopsAtLastAlphaSuffix) {
    // Greedy domain backs off to the last ".letters" run
    auto found = findEmailCandidates("a@b.com-x");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "a@b.com");

    found = findEmailCandidates("a@host.example.com.5");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "a@host.example.com");
}

TEST(EmailExtractorTest, RequiresTwoLetterSuffix) {
    EXPECT_TRUE(findEmailCandidates("a@b.c").empty());
    EXPECT_TRUE(findEmailCandidates("a@localhost").empty());
    EXPECT_TRUE(findEmailCandidates("@example.com").empty());
}

TEST(EmailExtractorTest, ChainedAtSigns) {
    auto found = findEmailCandidates("a@b@c.com");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "b@c.com");
}

TEST(EmailExtractorTest, NonAsciiIsBoundary) {
    auto found = findEmailCandidates("caf\xc3\xa9john@example.com");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "john@example.com");
}

TEST(EmailExtractorTest, LeadingDotKeptForLaterSyntaxCheck) {
    auto found = findEmailCandidates(" .a@b.com ");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], ".a@b.com");
}

// ============================================================================
// extractEmails
// ============================================================================

TEST(EmailExtractorTest, LowercasesAndDeduplicates) {
    auto emails = extractEmails("B@Example.com a@example.com b@example.COM A@EXAMPLE.COM");
    ASSERT_EQ(emails.size(), 2u);
    EXPECT_EQ(emails[0], "b@example.com");
    EXPECT_EQ(emails[1], "a@example.com");
}

TEST(EmailExtractorTest, EmptyText) {
    EXPECT_TRUE(extractEmails("").empty());
    EXPECT_TRUE(extractEmails("no addresses here").empty());
}

TEST(EmailExtractorTest, NormalizeEmail) {
    EXPECT_EQ(normalizeEmail("  John@Example.COM\r\n"), "john@example.com");
    EXPECT_EQ(normalizeEmail(""), "");
}
