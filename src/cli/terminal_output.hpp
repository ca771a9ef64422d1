#pragma once

#include <string>
#include <mutex>
#include <core/types.hpp>
#include <managers/event_queue.hpp>

// Remote output cleanup before it reaches the user's terminal.
namespace TerminalOutput {

// Strip destructive sequences (clear, home, alt screen) and collapse runs of
// blank lines. consecutive_newlines carries state across chunks.
std::string filter_for_display(const std::string& data, int& consecutive_newlines);

// Drop every escape sequence and carriage return.
std::string strip_escapes(const std::string& data);

} // namespace TerminalOutput

// Renders events on stdout/stderr. Output lines are prefixed with the
// profile name when more than one profile has produced output.
class TerminalSink : public EventSink {
public:
    void on_session_event(const SessionEvent& event) override;
    void on_transfer_event(const TransferEvent& event) override;

private:
    std::mutex mutex_;
    std::string last_profile_;
    int consecutive_newlines_ = 0;
    bool progress_open_ = false;   // a progress line is being redrawn in place

    void close_progress_line();
};
