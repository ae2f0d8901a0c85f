#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hoststatsd::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer variable; a missing or malformed value yields the fallback.
int64_t get_env_int(const std::string& key, int64_t fallback);

// Boolean variable ("1", "true", "yes", "on" are true).
bool get_env_flag(const std::string& key, bool fallback);

} // namespace hoststatsd::core::config
