#pragma once

#include <string>

// Debug log: appends "[HH:MM:SS.mmm] msg" lines to a file.
// Defaults to <tmp>/sshdeck_debug.log until set_log_path() is called.

void set_log_path(const std::string& path);
std::string sshdeck_log_path();

void sshdeck_log(const std::string& msg);
