#include "config/Config.hpp"
#include "events/EventLoop.hpp"
#include "events/Scheduler.hpp"
#include "search/Matcher.hpp"
#include "timing/AdvancedDebouncer.hpp"
#include "ui/Terminal.hpp"
#include "ui/widgets/SearchBox.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <poll.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_shutdown{false};

// Only flips the flag; poll() returns EINTR and the main loop exits
void signal_handler(int) {
    g_shutdown.store(true);
}

struct Options {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> wordlist;
};

void print_usage() {
    std::cerr << "usage: cadence [--config PATH] [WORDLIST]\n";
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] != '-' && !opts.wordlist) {
            opts.wordlist = arg;
        } else {
            std::cerr << "cadence: unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }
    return opts;
}

void render(cadence::ui::Terminal& terminal,
            const cadence::ui::widgets::SearchBox& search_box,
            const cadence::search::Matcher& matcher,
            const std::vector<size_t>& results,
            bool filter_pending) {
    int width = terminal.get_terminal_width();
    int height = terminal.get_terminal_height();

    terminal.clear_screen();
    terminal.print(0, 0, search_box.render_line(width));
    terminal.print(0, 1, std::format("{} of {} {}", results.size(), matcher.size(),
                                     filter_pending ? "(typing...)" : ""));

    int rows = std::max(0, height - 3);
    for (int i = 0; i < rows && i < static_cast<int>(results.size()); ++i) {
        terminal.print(2, 3 + i, matcher.candidate(results[i]));
    }
}

}  // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 2;
    }

    try {
        using cadence::util::Logger;

        Logger::init();
        auto config = args->config_file
            ? cadence::config::ConfigLoader::load_from_file(*args->config_file)
            : cadence::config::ConfigLoader::load_config();
        Logger::init(config.log_file, Logger::parse_level(config.log_level).value_or(Logger::Level::Info));
        Logger::info("CADENCE starting...");

        cadence::search::Matcher matcher(args->wordlist
            ? cadence::search::Matcher::load_lines(*args->wordlist)
            : cadence::search::Matcher::default_candidates());
        const size_t max_results = static_cast<size_t>(std::max(config.max_results, 1));

        cadence::events::Scheduler scheduler;
        cadence::events::EventLoop loop(scheduler);

        // Throws DebounceConfigError when the config disables both edges
        cadence::timing::AdvancedDebouncer debouncer(scheduler, config.delay(), config.debounce_options());

        cadence::ui::widgets::SearchBox search_box;
        std::vector<size_t> results = matcher.filter("", max_results);
        bool needs_render = true;

        auto commit_query = [&](const std::string& query) {
            results = matcher.filter(query, max_results);
            needs_render = true;
        };

        auto& terminal = cadence::ui::Terminal::instance();
        terminal.init();

        // Install after terminal init so the handler never races it
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        while (!g_shutdown.load()) {
            if (needs_render) {
                render(terminal, search_box, matcher, results, debouncer.is_active());
                needs_render = false;
            }

            // Sleep until input arrives or the next debounce timer is due
            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, loop.poll_timeout(250));

            if (ret < 0) {
                if (errno == EINTR) continue;
                Logger::error("Poll failed: " + std::string(std::strerror(errno)));
                break;
            }

            if (scheduler.process() > 0) {
                needs_render = true;
            }

            if (ret == 0) continue;

            // Hangup with data left still reports POLLIN; drain it and stop at Eof
            if ((pfd.revents & (POLLERR | POLLNVAL)) ||
                ((pfd.revents & POLLHUP) && !(pfd.revents & POLLIN))) {
                Logger::info("Input closed");
                g_shutdown.store(true);
                break;
            }
            if (!(pfd.revents & POLLIN)) continue;

            for (auto event = terminal.read_input();
                 event.type != cadence::ui::InputEvent::Type::None;
                 event = terminal.read_input()) {
                if (event.type == cadence::ui::InputEvent::Type::Resize) {
                    needs_render = true;
                    continue;
                }
                if (event.type == cadence::ui::InputEvent::Type::Eof || event.is_key("ctrl-d")) {
                    Logger::info("Input closed");
                    g_shutdown.store(true);
                    break;
                }

                switch (search_box.handle_search_input(event)) {
                    case cadence::ui::widgets::SearchBox::Result::Changed: {
                        debouncer.run([&commit_query, query = search_box.get_query()] {
                            commit_query(query);
                        });
                        needs_render = true;
                        break;
                    }
                    case cadence::ui::widgets::SearchBox::Result::Submit:
                    case cadence::ui::widgets::SearchBox::Result::Cancel:
                        // Enter commits now, Esc clears; nothing left to debounce
                        debouncer.cancel();
                        commit_query(search_box.get_query());
                        break;
                    case cadence::ui::widgets::SearchBox::Result::None:
                        break;
                }
            }
        }

        debouncer.dispose();
        terminal.shutdown();
        Logger::info("CADENCE shutdown");
        return 0;
    } catch (const std::exception& e) {
        // Restore the terminal before reporting
        cadence::ui::Terminal::instance().shutdown();
        cadence::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
