#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <string>

namespace voice_os {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::map<std::string, std::string> parse_env_file(const std::string& path) {
    std::map<std::string, std::string> out;
    std::ifstream f(expand_path(path));
    if (!f.is_open()) return out;
    std::string line;
    while (std::getline(f, line)) {
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        if (line[start] == '#') continue;
        if (line.compare(start, 7, "export ") == 0) {
            start = line.find_first_not_of(" \t", start + 7);
            if (start == std::string::npos) continue;
        }
        size_t eq = line.find('=', start);
        if (eq == std::string::npos) continue;
        std::string key = line.substr(start, eq - start);
        std::string value = line.substr(eq + 1);
        size_t key_end = key.find_last_not_of(" \t");
        if (key_end == std::string::npos) continue;
        key = key.substr(0, key_end + 1);
        size_t val_start = value.find_first_not_of(" \t");
        value = val_start == std::string::npos ? "" : value.substr(val_start);
        size_t val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) value = value.substr(0, val_end + 1);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        out[key] = value;
    }
    return out;
}

std::string resolve_credential(const std::string& name, const std::string& env_file) {
    if (name.empty()) return "";
    const char* value = std::getenv(name.c_str());
    if (value && *value) return value;
    if (env_file.empty()) return "";
    auto env = parse_env_file(env_file);
    auto it = env.find(name);
    return it != env.end() ? it->second : "";
}

} // namespace voice_os
