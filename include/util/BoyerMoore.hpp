#pragma once

#include <string>

namespace cadence::util {

/**
 * Boyer-Moore-Horspool literal search.
 *
 * Average case O(n/m), worst case O(n*m). The skip table is a fixed
 * 256-entry array, so a searcher is cheap to build per query.
 */
class BoyerMooreSearch {
public:
    /**
     * @param pattern        The search pattern (longer than MAX_PATTERN never matches)
     * @param case_sensitive Whether ASCII case must match
     */
    explicit BoyerMooreSearch(const std::string& pattern, bool case_sensitive = false);

    /**
     * @return Position of the first match at or after start_pos, or -1
     */
    int search(const std::string& text, int start_pos = 0) const;

    bool matches(const std::string& text) const { return search(text) != -1; }

private:
    static constexpr int ALPHABET_SIZE = 256;
    static constexpr int MAX_PATTERN = 256;

    int bad_char_[ALPHABET_SIZE];

    std::string pattern_;
    int pattern_len_;
    bool case_sensitive_;

    unsigned char normalize_char(unsigned char c) const;
    void compute_bad_char();
};

}  // namespace cadence::util
