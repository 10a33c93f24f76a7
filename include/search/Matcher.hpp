#pragma once

#include <cstddef>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace cadence::search {

/**
 * Substring filter over a fixed candidate list.
 *
 * Candidates are normalized once up front (accents stripped, lowercased),
 * so "bjork" finds "Björk". An empty query matches everything.
 */
class Matcher {
public:
    explicit Matcher(std::vector<std::string> candidates);

    // Indices of matching candidates, in list order, at most `limit`
    std::vector<size_t> filter(const std::string& query,
                               size_t limit = std::numeric_limits<size_t>::max()) const;

    const std::string& candidate(size_t index) const { return candidates_[index]; }
    size_t size() const { return candidates_.size(); }

    // One candidate per non-blank line; empty if the file cannot be read
    static std::vector<std::string> load_lines(const std::filesystem::path& path);

    static std::vector<std::string> default_candidates();

private:
    std::vector<std::string> candidates_;
    std::vector<std::string> normalized_;
};

}  // namespace cadence::search
