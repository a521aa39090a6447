#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace util {

// Logging
void setup_logging(const std::string& service_name, const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);
std::optional<std::string> read_secret(const std::string& file_env, const std::string& value_env);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// Strict integer parse: whole string (after trimming) must be a base-10 integer
std::optional<int64_t> parse_int64(const std::string& str);

// Time utilities
int64_t now_epoch_millis();
std::string current_iso8601();

} // namespace util
