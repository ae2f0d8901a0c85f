#pragma once
#include <filesystem>
#include <vector>

namespace hoststatsd::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Directories searched for a .env file: cwd, the executable's dir and their parents.
std::vector<std::filesystem::path> project_search_paths();

} // namespace hoststatsd::core::paths
