#include "permforge/Util.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace permforge {

void deep_merge(nlohmann::json& a, const nlohmann::json& b) {
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        const auto& key = it.key();
        const auto& bv  = it.value();
        if (a.contains(key) && a[key].is_object() && bv.is_object()) {
            deep_merge(a[key], bv);
        } else {
            a[key] = bv;
        }
    }
}

static const nlohmann::json& get_obj_child(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object())
        throw std::out_of_range("Attempt to access child on non-object");
    auto it = obj.find(key);
    if (it == obj.end())
        throw std::out_of_range("Missing key: " + key);
    return *it;
}

const nlohmann::json& get_by_dot(const nlohmann::json& obj, const std::string& path) {
    const nlohmann::json* cur = &obj;
    for (const auto& token : split(path, '.')) {
        cur = &get_obj_child(*cur, token);
    }
    return *cur;
}

bool exists_by_dot(const nlohmann::json& obj, const std::string& path) {
    const nlohmann::json* cur = &obj;
    for (const auto& token : split(path, '.')) {
        if (!cur->is_object()) return false;
        auto it = cur->find(token);
        if (it == cur->end()) return false;
        cur = &(*it);
    }
    return true;
}

void set_by_dot(nlohmann::json& obj, const std::string& path, const nlohmann::json& value) {
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) return;
    nlohmann::json* cur = &obj;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& p = parts[i];
        if (!(*cur).contains(p) || !(*cur)[p].is_object()) {
            (*cur)[p] = nlohmann::json::object();
        }
        cur = &(*cur)[p];
    }
    (*cur)[parts.back()] = value;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool iless(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string substitute(const std::string& text, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{') {
            auto close = text.find('}', i + 1);
            if (close != std::string::npos) {
                auto it = vars.find(text.substr(i + 1, close - i - 1));
                if (it != vars.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += text[i++];
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

nlohmann::json parse_json_or_string(const std::string& raw) {
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json(raw);
    }
    return parsed;
}

} // namespace permforge
