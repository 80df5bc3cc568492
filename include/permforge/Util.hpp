#ifndef PERMFORGE_UTIL_HPP
#define PERMFORGE_UTIL_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <vector>
#include <utility>

namespace permforge {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(nlohmann::json& a, const nlohmann::json& b);

// Set a nested value by dot-notation, creating intermediate objects
void set_by_dot(nlohmann::json& obj, const std::string& path, const nlohmann::json& value);

// Get a nested value by dot-notation. Throws std::out_of_range if missing.
const nlohmann::json& get_by_dot(const nlohmann::json& obj, const std::string& path);

// Check existence of a nested key by dot-notation.
bool exists_by_dot(const nlohmann::json& obj, const std::string& path);

// Case folding helpers (ASCII only; group names and nodes are ASCII in practice)
std::string to_lower(std::string s);
bool iequals(const std::string& a, const std::string& b);
bool iless(const std::string& a, const std::string& b);

std::vector<std::string> split(const std::string& s, char delim);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Replace every "{name}" in text with vars[name]; unknown placeholders are kept.
std::string substitute(const std::string& text, const std::map<std::string, std::string>& vars);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Try parsing string as JSON, otherwise return it as a string.
nlohmann::json parse_json_or_string(const std::string& raw);

} // namespace permforge

#endif // PERMFORGE_UTIL_HPP
