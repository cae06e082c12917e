/**
 * @file email_extractor.cpp
 * @brief Candidate address extraction implementation
 */

#include "everify/verification/email_extractor.h"

#include <cstring>
#include <unordered_set>

namespace everify::verification {

namespace {

bool isAlpha(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAlnum(unsigned char c) {
    return isAlpha(c) || (c >= '0' && c <= '9');
}

/// Local-part class: alnum and .!#$%&'*+/=?^_`{|}~-
bool isLocalChar(unsigned char c) {
    if (isAlnum(c)) {
        return true;
    }
    static const char specials[] = ".!#$%&'*+/=?^_`{|}~-";
    return c != '\0' && std::strchr(specials, c) != nullptr;
}

/// Domain class: alnum, dot and hyphen
bool isDomainChar(unsigned char c) {
    return isAlnum(c) || c == '.' || c == '-';
}

unsigned char at(std::string_view text, size_t i) {
    return static_cast<unsigned char>(text[i]);
}

/**
 * @brief Match the domain half starting right after '@'
 * @return End offset (exclusive) of the match, or 0 if the domain half does not match
 */
size_t matchDomain(std::string_view text, size_t begin) {
    size_t runEnd = begin;
    while (runEnd < text.size() && isDomainChar(at(text, runEnd))) {
        runEnd++;
    }

    // Greedy backtracking: the rightmost '.' that leaves a non-empty prefix
    // and is followed by at least two letters wins.
    for (size_t dot = runEnd; dot-- > begin + 1;) {
        if (text[dot] != '.') {
            continue;
        }
        size_t alphaEnd = dot + 1;
        while (alphaEnd < runEnd && isAlpha(at(text, alphaEnd))) {
            alphaEnd++;
        }
        if (alphaEnd - (dot + 1) >= 2) {
            return alphaEnd;
        }
    }
    return 0;
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // anonymous namespace

std::vector<std::string> findEmailCandidates(std::string_view text) {
    std::vector<std::string> matches;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t atPos = text.find('@', pos);
        if (atPos == std::string_view::npos) {
            break;
        }

        size_t start = atPos;
        while (start > pos && isLocalChar(at(text, start - 1))) {
            start--;
        }

        size_t end = (start < atPos) ? matchDomain(text, atPos + 1) : 0;
        if (end == 0) {
            pos = atPos + 1;
            continue;
        }

        matches.emplace_back(text.substr(start, end - start));
        pos = end;
    }

    return matches;
}

std::string normalizeEmail(std::string_view email) {
    size_t first = 0;
    size_t last = email.size();
    while (first < last && isSpace(email[first])) first++;
    while (last > first && isSpace(email[last - 1])) last--;

    std::string result(email.substr(first, last - first));
    for (auto& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

std::vector<std::string> extractEmails(std::string_view text) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;

    for (const auto& candidate : findEmailCandidates(text)) {
        std::string email = normalizeEmail(candidate);
        if (email.empty()) {
            continue;
        }
        if (seen.insert(email).second) {
            result.push_back(std::move(email));
        }
    }
    return result;
}

} // namespace everify::verification
