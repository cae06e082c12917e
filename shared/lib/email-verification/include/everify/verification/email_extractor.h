/**
 * @file email_extractor.h
 * @brief Candidate address extraction from free text
 *
 * Matches the pattern
 *   [A-Za-z0-9.!#$%&'*+/=?^_`{|}~-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}
 * with leftmost, greedy, non-overlapping semantics, without a regex engine.
 * Bytes outside ASCII never match and act as boundaries.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace everify::verification {

/**
 * @brief Find every pattern match in order of appearance (no normalization)
 */
std::vector<std::string> findEmailCandidates(std::string_view text);

/**
 * @brief Extract normalized, unique addresses
 *
 * Candidates are trimmed and lowercased; duplicates are dropped keeping the
 * first occurrence. A candidate may still fail SyntaxValidator (e.g. ".a@b.com").
 */
std::vector<std::string> extractEmails(std::string_view text);

/**
 * @brief Lowercase and trim an address
 */
std::string normalizeEmail(std::string_view email);

} // namespace everify::verification
