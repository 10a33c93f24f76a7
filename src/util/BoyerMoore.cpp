#include "util/BoyerMoore.hpp"
#include <cctype>

namespace cadence::util {

BoyerMooreSearch::BoyerMooreSearch(const std::string& pattern, bool case_sensitive)
    : pattern_(pattern),
      pattern_len_(static_cast<int>(pattern.length())),
      case_sensitive_(case_sensitive) {

    if (pattern_len_ > MAX_PATTERN) {
        pattern_len_ = 0;
    }
    compute_bad_char();
}

unsigned char BoyerMooreSearch::normalize_char(unsigned char c) const {
    return case_sensitive_ ? c : static_cast<unsigned char>(std::tolower(c));
}

void BoyerMooreSearch::compute_bad_char() {
    // Default shift is the whole pattern
    for (int i = 0; i < ALPHABET_SIZE; ++i) {
        bad_char_[i] = pattern_len_;
    }

    // Last occurrence wins; the final pattern character is excluded (BMH)
    for (int i = 0; i < pattern_len_ - 1; ++i) {
        unsigned char c = normalize_char(static_cast<unsigned char>(pattern_[i]));
        bad_char_[c] = pattern_len_ - 1 - i;
    }
}

int BoyerMooreSearch::search(const std::string& text, int start_pos) const {
    const int m = pattern_len_;
    const int n = static_cast<int>(text.length());

    if (m == 0 || start_pos < 0 || start_pos >= n || m > n) {
        return -1;
    }

    int i = start_pos;
    while (i <= n - m) {
        int j = m - 1;

        // Right to left
        while (j >= 0 &&
               normalize_char(static_cast<unsigned char>(text[i + j])) ==
               normalize_char(static_cast<unsigned char>(pattern_[j]))) {
            --j;
        }

        if (j < 0) {
            return i;
        }

        unsigned char bad = normalize_char(static_cast<unsigned char>(text[i + m - 1]));
        int shift = bad_char_[bad];
        i += shift > 0 ? shift : 1;
    }

    return -1;
}

}  // namespace cadence::util
