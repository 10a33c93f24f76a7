#pragma once

#include "ui/InputEvent.hpp"
#include <string>

namespace cadence::ui::widgets {

// Single-line query editor; owns no state beyond the query text
class SearchBox {
public:
    enum class Result {
        None,
        Changed,
        Submit,
        Cancel
    };

    Result handle_search_input(const InputEvent& event);

    const std::string& get_query() const { return query_; }
    void clear();

    // "Search: <query>" cut to width
    std::string render_line(int width) const;

private:
    Result append_utf8_byte(unsigned char c);

    std::string query_;
    std::string partial_;  // incomplete UTF-8 sequence
};

}  // namespace cadence::ui::widgets
