#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <fcntl.h>
#include <cstring>
#include <csignal>
#include <cerrno>
#include <poll.h>
#include <format>

namespace cadence::ui {

// Never call ioctl from the handler; read_input() picks the flag up
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

#ifdef __linux__
    if (tcgetattr(STDIN_FILENO, &original_termios_) != 0) {
        util::Logger::warn(std::format("Terminal: tcgetattr failed: {}", std::strerror(errno)));
    }

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_iflag &= ~(IXON | ICRNL);  // Disable flow control and CR->NL
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    original_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, original_flags_ | O_NONBLOCK);

    std::signal(SIGWINCH, sigwinch_handler);
#endif

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h");  // Enter alternate screen buffer
    initialized_ = true;
    util::Logger::debug("Terminal: raw mode on");
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[?25h");    // Show cursor
    write_raw("\033[?1049l");  // Exit alternate screen buffer

    // Writer drains the queue before it exits. The flag flips under the
    // queue lock so the writer cannot miss the wakeup between its predicate
    // check and the wait
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

#ifdef __linux__
    fcntl(STDIN_FILENO, F_SETFL, original_flags_);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
#endif
    initialized_ = false;
    util::Logger::debug("Terminal: restored");
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) {
                break;  // stopped and drained
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;

            // stdout may share O_NONBLOCK with stdin
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                poll(&pfd, 1, 100);
                continue;
            }

            util::Logger::error("Terminal writer error: " + std::string(std::strerror(errno)));
            break;
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

void Terminal::print(int x, int y, const std::string& text) {
    // Cursor move and text in one chunk, then clear to end of line
    write_raw(std::format("\033[{};{}H{}\033[K", y + 1, x + 1, text));
}

namespace {

// One byte from stdin: 1 on success, 0 at end of input, -1 when nothing is buffered
int read_byte(char& c) {
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);

    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        util::Logger::debug(std::format("read_input: read() failed, errno={}", errno));
    }
    return n == 1 ? 1 : (n == 0 ? 0 : -1);
}

std::string csi_key_name(const std::string& params, char final_byte) {
    switch (final_byte) {
        case 'A': return "up";
        case 'B': return "down";
        case 'C': return "right";
        case 'D': return "left";
        case 'H': return "home";
        case 'F': return "end";
        case '~': break;
        default: return "unknown";
    }

    // Modifiers follow a ';' ("3;5~" is ctrl-delete)
    std::string code = params.substr(0, params.find(';'));
    if (code == "1" || code == "7") return "home";
    if (code == "2") return "insert";
    if (code == "3") return "delete";
    if (code == "4" || code == "8") return "end";
    if (code == "5") return "pageup";
    if (code == "6") return "pagedown";
    return "unknown";
}

}  // namespace

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    char c;
    int got = read_byte(c);
    if (got == 0) {
        return {InputEvent::Type::Eof, 0, "eof"};
    }
    if (got < 0) {
        return {};
    }

    if (c == '\033') {
        char next;
        if (read_byte(next) != 1) {
            return {InputEvent::Type::KeyPress, 27, "escape"};
        }

        if (next == '[') {
            // CSI: parameter bytes up to a final byte in 0x40-0x7E
            std::string params;
            char b;
            while (read_byte(b) == 1) {
                if (b >= 0x40 && b <= 0x7E) {
                    return {InputEvent::Type::KeyPress, 0, csi_key_name(params, b)};
                }
                params += b;
            }
            return {InputEvent::Type::KeyPress, 0, "unknown"};
        }

        if (next == 'O') {
            // SS3: application-mode cursor keys and F1-F4
            char b;
            if (read_byte(b) == 1) {
                switch (b) {
                    case 'A': return {InputEvent::Type::KeyPress, 0, "up"};
                    case 'B': return {InputEvent::Type::KeyPress, 0, "down"};
                    case 'C': return {InputEvent::Type::KeyPress, 0, "right"};
                    case 'D': return {InputEvent::Type::KeyPress, 0, "left"};
                    case 'H': return {InputEvent::Type::KeyPress, 0, "home"};
                    case 'F': return {InputEvent::Type::KeyPress, 0, "end"};
                }
            }
            return {InputEvent::Type::KeyPress, 0, "unknown"};
        }

        return {InputEvent::Type::KeyPress, next, std::string("alt-") + next};
    }

    if (c == '\n' || c == '\r') {
        return {InputEvent::Type::KeyPress, c, "enter"};
    }
    if (c == 127 || c == '\b') {
        return {InputEvent::Type::KeyPress, c, "backspace"};
    }
    if (c == 4) {
        return {InputEvent::Type::KeyPress, c, "ctrl-d"};
    }

    return {InputEvent::Type::KeyPress, c, std::string(1, c)};
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) return 80;
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_row == 0) return 24;
    return w.ws_row;
}

}  // namespace cadence::ui
