#include "ui/widgets/SearchBox.hpp"
#include "util/Logger.hpp"
#include <cctype>

namespace cadence::ui::widgets {

SearchBox::Result SearchBox::handle_search_input(const InputEvent& event) {
    if (event.type != InputEvent::Type::KeyPress) return Result::None;

    if (event.key_name == "enter") {
        util::Logger::info("SearchBox: Submitting query: '" + query_ + "'");
        return Result::Submit;
    }

    if (event.key_name == "escape") {
        util::Logger::debug("SearchBox: Cancelled");
        clear();
        return Result::Cancel;
    }

    if (event.key_name == "backspace") {
        if (!partial_.empty()) {
            partial_.clear();
            return Result::None;
        }
        if (query_.empty()) return Result::None;

        // Drop a whole UTF-8 sequence, not just its last byte
        while (!query_.empty() && (static_cast<unsigned char>(query_.back()) & 0xC0) == 0x80) {
            query_.pop_back();
        }
        if (!query_.empty()) query_.pop_back();
        return Result::Changed;
    }

    if (event.key_name.length() == 1) {
        unsigned char c = static_cast<unsigned char>(event.key_name[0]);
        if (c < 0x80) {
            partial_.clear();
            if (!std::isprint(c)) return Result::None;
            query_ += event.key_name;
            return Result::Changed;
        }
        return append_utf8_byte(c);
    }

    return Result::None;
}

// Multi-byte characters arrive one byte per key event; the query only
// changes once a sequence is complete
SearchBox::Result SearchBox::append_utf8_byte(unsigned char c) {
    if ((c & 0xC0) == 0x80) {
        if (partial_.empty()) return Result::None;  // stray continuation byte
        partial_ += static_cast<char>(c);
    } else {
        partial_.assign(1, static_cast<char>(c));
    }

    unsigned char lead = static_cast<unsigned char>(partial_[0]);
    size_t expected = (lead & 0xE0) == 0xC0 ? 2
                    : (lead & 0xF0) == 0xE0 ? 3
                    : (lead & 0xF8) == 0xF0 ? 4
                    : 0;
    if (expected == 0) {
        partial_.clear();
        return Result::None;
    }
    if (partial_.size() < expected) return Result::None;

    query_ += partial_;
    partial_.clear();
    return Result::Changed;
}

void SearchBox::clear() {
    query_.clear();
    partial_.clear();
}

std::string SearchBox::render_line(int width) const {
    std::string line = "Search: " + query_ + "_";
    if (width > 3 && static_cast<int>(line.size()) > width) {
        // Keep the end of the query visible
        line = "..." + line.substr(line.size() - static_cast<size_t>(width) + 3);
    }
    return line;
}

}  // namespace cadence::ui::widgets
