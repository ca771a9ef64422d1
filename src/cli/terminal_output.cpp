#include "terminal_output.hpp"
#include "theme.hpp"
#include <cstring>
#include <iostream>
#include <fmt/format.h>

namespace TerminalOutput {

// Remove all occurrences of escape sequence `seq`
static void strip_seq(std::string& s, const char* seq) {
    size_t len = std::strlen(seq);
    std::string::size_type pos;
    while ((pos = s.find(seq)) != std::string::npos)
        s.erase(pos, len);
}

std::string filter_for_display(const std::string& data, int& consecutive_newlines) {
    std::string display;
    display.reserve(data.size());

    // Collapse runs of >2 consecutive blank lines
    for (char c : data) {
        if (c == '\n') {
            if (++consecutive_newlines <= 2) display += c;
        } else if (c == '\r') {
            display += c;
        } else {
            consecutive_newlines = 0;
            display += c;
        }
    }

    strip_seq(display, "\033[?1049h");  // Alt screen enter
    strip_seq(display, "\033[?1049l");  // Alt screen exit
    strip_seq(display, "\033[?47h");
    strip_seq(display, "\033[?47l");
    strip_seq(display, "\033[2J");      // Clear screen
    strip_seq(display, "\033[H");       // Cursor home

    return display;
}

std::string strip_escapes(const std::string& data) {
    std::string out;
    out.reserve(data.size());
    size_t len = data.size();
    for (size_t i = 0; i < len; ) {
        if (data[i] == '\033' && i + 1 < len && data[i + 1] == '[') {
            size_t j = i + 2;
            while (j < len && (data[j] == ';' || data[j] == '?' || (data[j] >= '0' && data[j] <= '9')))
                j++;
            i = j < len ? j + 1 : j;
        } else if (data[i] == '\033') {
            i += 2;
        } else if (data[i] == '\r') {
            i++;
        } else {
            out += data[i++];
        }
    }
    return out;
}

} // namespace TerminalOutput

// ── TerminalSink ────────────────────────────────────────────

void TerminalSink::close_progress_line() {
    if (progress_open_) {
        std::cout << "\n";
        progress_open_ = false;
    }
}

void TerminalSink::on_session_event(const SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_progress_line();

    bool switched = !last_profile_.empty() && last_profile_ != event.profile;
    last_profile_ = event.profile;
    if (switched) {
        consecutive_newlines_ = 0;
        std::cout << theme::dim(fmt::format("  [{}]", event.profile)) << "\n";
    }

    switch (event.type) {
        case SessionEventType::Stdout:
            std::cout << TerminalOutput::filter_for_display(event.data, consecutive_newlines_)
                      << std::flush;
            break;
        case SessionEventType::Stderr:
            std::cerr << theme::yellow(TerminalOutput::filter_for_display(event.data, consecutive_newlines_))
                      << std::flush;
            break;
        case SessionEventType::Info:
            std::cout << theme::info(fmt::format("[{}] {}", event.profile, event.data)) << std::flush;
            break;
        case SessionEventType::Error:
            std::cout << theme::fail(fmt::format("[{}] {}", event.profile, event.data)) << std::flush;
            break;
        case SessionEventType::Clear:
            std::cout << "\033[2J\033[H" << std::flush;
            consecutive_newlines_ = 0;
            break;
    }
}

void TerminalSink::on_transfer_event(const TransferEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* arrow = event.operation == TransferOp::Upload ? "put" : "get";
    std::cout << "\r    " << theme::dim(arrow) << " " << event.filename << " "
              << theme::progress_bar(event.percent)
              << theme::dim(fmt::format("  {}/{} bytes", event.bytes_transferred, event.total_bytes))
              << std::flush;
    progress_open_ = true;
    if (event.percent >= 100.0) close_progress_line();
}
