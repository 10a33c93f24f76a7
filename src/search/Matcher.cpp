#include "search/Matcher.hpp"
#include "util/BoyerMoore.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <fstream>
#include <utility>
#include <format>

namespace cadence::search {

Matcher::Matcher(std::vector<std::string> candidates) : candidates_(std::move(candidates)) {
    normalized_.reserve(candidates_.size());
    for (const auto& c : candidates_) {
        normalized_.push_back(util::normalize_for_search(c));
    }
}

std::vector<size_t> Matcher::filter(const std::string& query, size_t limit) const {
    std::vector<size_t> hits;
    std::string needle = util::normalize_for_search(query);

    // A lone combining mark folds to nothing; treat it as no query
    if (needle.empty()) {
        for (size_t i = 0; i < candidates_.size() && hits.size() < limit; ++i) {
            hits.push_back(i);
        }
        return hits;
    }

    util::BoyerMooreSearch searcher(needle);
    for (size_t i = 0; i < normalized_.size() && hits.size() < limit; ++i) {
        if (searcher.matches(normalized_[i])) {
            hits.push_back(i);
        }
    }

    util::Logger::debug(std::format("Matcher: '{}' -> {} of {} candidates", query, hits.size(), candidates_.size()));
    return hits;
}

std::vector<std::string> Matcher::load_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;

    std::ifstream file(path);
    if (!file) {
        util::Logger::error("Matcher: Cannot open " + path.string());
        return lines;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        lines.push_back(line);
    }

    util::Logger::info(std::format("Matcher: Loaded {} candidates from {}", lines.size(), path.string()));
    return lines;
}

std::vector<std::string> Matcher::default_candidates() {
    return {
        "Björk - Homogenic",
        "Boards of Canada - Music Has the Right to Children",
        "Café Tacvba - Re",
        "Daft Punk - Discovery",
        "Sigur Rós - Ágætis byrjun",
        "Kraftwerk - Trans-Europa Express",
        "Motörhead - Ace of Spades",
        "Múm - Finally We Are No One",
        "Portishead - Dummy",
        "Radiohead - Kid A",
        "Röyksopp - Melody A.M.",
        "Stereolab - Dots and Loops",
        "The Beatles - Abbey Road",
        "Aphex Twin - Selected Ambient Works 85-92",
        "Beyoncé - Lemonade",
    };
}

}  // namespace cadence::search
