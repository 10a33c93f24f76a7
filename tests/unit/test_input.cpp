#include "../framework/SimpleTest.hpp"
#include "ui/InputEvent.hpp"
#include "ui/Terminal.hpp"
#include "ui/widgets/SearchBox.hpp"
#include <string>
#include <vector>
#include <unistd.h>

using cadence::ui::InputEvent;
using cadence::ui::Terminal;
using cadence::ui::widgets::SearchBox;

namespace {

// Replaces stdin with a pipe holding `bytes`; the write end is closed so
// reads see end of input once the bytes are consumed
class PipedStdin {
public:
    explicit PipedStdin(const std::string& bytes) {
        saved_ = dup(STDIN_FILENO);
        int fds[2];
        if (pipe(fds) != 0) return;
        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = write(fds[1], bytes.data() + written, bytes.size() - written);
            if (n <= 0) break;
            written += static_cast<size_t>(n);
        }
        close(fds[1]);
        dup2(fds[0], STDIN_FILENO);
        close(fds[0]);
    }

    ~PipedStdin() {
        if (saved_ >= 0) {
            dup2(saved_, STDIN_FILENO);
            close(saved_);
        }
    }

private:
    int saved_ = -1;
};

// Key names up to and including end of input
std::vector<std::string> drain_keys() {
    std::vector<std::string> names;
    auto& terminal = Terminal::instance();
    for (int i = 0; i < 64; ++i) {
        auto event = terminal.read_input();
        if (event.type == InputEvent::Type::Eof) {
            names.push_back("<eof>");
            break;
        }
        if (event.type == InputEvent::Type::KeyPress) names.push_back(event.key_name);
    }
    return names;
}

InputEvent byte_key(char c) {
    return {InputEvent::Type::KeyPress, c, std::string(1, c)};
}

}  // namespace

TEST_CASE(test_delete_key_is_one_event) {
    PipedStdin in("abc\033[3~d");
    auto keys = drain_keys();

    ASSERT_EQ(keys.size(), 6u);
    ASSERT_EQ(keys[2], std::string("c"));
    ASSERT_EQ(keys[3], std::string("delete"));
    ASSERT_EQ(keys[4], std::string("d"));
    ASSERT_EQ(keys[5], std::string("<eof>"));
}

TEST_CASE(test_navigation_keys_do_not_touch_query) {
    PipedStdin in("ab\033[3~\033[H\033[15~c");
    auto& terminal = Terminal::instance();
    SearchBox box;

    for (int i = 0; i < 16; ++i) {
        auto event = terminal.read_input();
        if (event.type == InputEvent::Type::Eof) break;
        ASSERT_TRUE(box.handle_search_input(event) != SearchBox::Result::Cancel);
    }
    ASSERT_EQ(box.get_query(), std::string("abc"));
}

TEST_CASE(test_escape_sequence_names) {
    PipedStdin in("\033[A\033[D\033OB\033[1;5C\033[5~\033[6~\033[4~\033[F\033[15~");
    auto keys = drain_keys();

    std::vector<std::string> expected = {
        "up", "left", "down", "right", "pageup", "pagedown", "end", "end", "unknown", "<eof>"};
    ASSERT_EQ(keys.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        ASSERT_EQ(keys[i], expected[i]);
    }
}

TEST_CASE(test_lone_escape_at_end_of_input) {
    PipedStdin in("x\033");
    auto keys = drain_keys();

    ASSERT_EQ(keys.size(), 3u);
    ASSERT_EQ(keys[1], std::string("escape"));
    ASSERT_EQ(keys[2], std::string("<eof>"));
}

TEST_CASE(test_control_keys) {
    PipedStdin in("\r\x7f\x04");
    auto keys = drain_keys();

    ASSERT_EQ(keys.size(), 4u);
    ASSERT_EQ(keys[0], std::string("enter"));
    ASSERT_EQ(keys[1], std::string("backspace"));
    ASSERT_EQ(keys[2], std::string("ctrl-d"));
}

TEST_CASE(test_closed_stdin_reports_eof_every_time) {
    PipedStdin in("");
    auto& terminal = Terminal::instance();

    ASSERT_TRUE(terminal.read_input().type == InputEvent::Type::Eof);
    ASSERT_TRUE(terminal.read_input().type == InputEvent::Type::Eof);
}

TEST_CASE(test_shutdown_joins_writer_every_cycle) {
    PipedStdin in("");
    auto& terminal = Terminal::instance();

    for (int i = 0; i < 200; ++i) {
        terminal.init();
        ASSERT_TRUE(terminal.is_initialized());
        terminal.shutdown();
        ASSERT_FALSE(terminal.is_initialized());
    }
}

TEST_CASE(test_search_box_waits_for_whole_utf8_sequence) {
    SearchBox box;
    ASSERT_TRUE(box.handle_search_input(byte_key('m')) == SearchBox::Result::Changed);

    // ö is C3 B6
    ASSERT_TRUE(box.handle_search_input(byte_key('\xC3')) == SearchBox::Result::None);
    ASSERT_EQ(box.get_query(), std::string("m"));
    ASSERT_TRUE(box.handle_search_input(byte_key('\xB6')) == SearchBox::Result::Changed);
    ASSERT_EQ(box.get_query(), std::string("m\xC3\xB6"));

    // € is E2 82 AC
    ASSERT_TRUE(box.handle_search_input(byte_key('\xE2')) == SearchBox::Result::None);
    ASSERT_TRUE(box.handle_search_input(byte_key('\x82')) == SearchBox::Result::None);
    ASSERT_TRUE(box.handle_search_input(byte_key('\xAC')) == SearchBox::Result::Changed);
    ASSERT_EQ(box.get_query(), std::string("m\xC3\xB6\xE2\x82\xAC"));

    ASSERT_TRUE(box.handle_search_input({InputEvent::Type::KeyPress, 127, "backspace"}) ==
                SearchBox::Result::Changed);
    ASSERT_EQ(box.get_query(), std::string("m\xC3\xB6"));
}

TEST_CASE(test_search_box_drops_broken_utf8) {
    SearchBox box;

    // Continuation byte with no lead
    ASSERT_TRUE(box.handle_search_input(byte_key('\xB6')) == SearchBox::Result::None);
    ASSERT_EQ(box.get_query(), std::string(""));

    // Lead byte interrupted by ASCII
    box.handle_search_input(byte_key('\xC3'));
    ASSERT_TRUE(box.handle_search_input(byte_key('a')) == SearchBox::Result::Changed);
    ASSERT_TRUE(box.handle_search_input(byte_key('\xB6')) == SearchBox::Result::None);
    ASSERT_EQ(box.get_query(), std::string("a"));

    // Backspace discards a half-typed sequence only
    box.handle_search_input(byte_key('\xC3'));
    ASSERT_TRUE(box.handle_search_input({InputEvent::Type::KeyPress, 127, "backspace"}) ==
                SearchBox::Result::None);
    ASSERT_EQ(box.get_query(), std::string("a"));
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
