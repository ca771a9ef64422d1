#pragma once

#include <filesystem>

namespace platform {

// HOME on Unix, USERPROFILE on Windows. Falls back to the temp directory.
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

void sleep_ms(int ms);

} // namespace platform
