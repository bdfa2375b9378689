#pragma once

#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

/**
 * Config - frontend settings kept in dmgemu.ini
 *
 * One "key = value" per line, blank lines and lines starting with '#'
 * or ';' are skipped. A missing file simply leaves every key at its
 * default. Keys in use: scale, palette, window_x, window_y,
 * strict_vram_access.
 */
class Config {
public:
    static Config& Instance() {
        static Config instance;
        return instance;
    }

    void Load(const std::string& path = "dmgemu.ini") {
        file_path = path;
        std::ifstream in(path);
        if (!in) return;

        std::string line;
        while (std::getline(in, line)) {
            ParseLine(line);
        }
    }

    void Save() const {
        if (file_path.empty()) return;
        std::ofstream out(file_path);
        if (!out) return;

        for (const auto& entry : values) {
            out << entry.first << " = " << entry.second << "\n";
        }
    }

    std::string Get(const std::string& key, const std::string& fallback = "") const {
        auto it = values.find(key);
        return it != values.end() ? it->second : fallback;
    }

    void Set(const std::string& key, const std::string& value) { values[key] = value; }

    // Non-numeric text falls back to the default
    int GetInt(const std::string& key, int fallback = 0) const {
        std::string text = Get(key);
        if (text.empty()) return fallback;

        char* end = nullptr;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (end == text.c_str() || *end != '\0') {
            return fallback;
        }
        return static_cast<int>(parsed);
    }

    void SetInt(const std::string& key, int value) { Set(key, std::to_string(value)); }

    bool GetBool(const std::string& key, bool fallback = false) const {
        std::string text = Get(key);
        if (text.empty()) return fallback;
        return text == "1" || text == "true" || text == "yes" || text == "on";
    }

private:
    std::map<std::string, std::string> values;
    std::string file_path;

    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void ParseLine(const std::string& raw) {
        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') return;

        size_t equals = line.find('=');
        if (equals == std::string::npos) return;

        std::string key = Trim(line.substr(0, equals));
        if (!key.empty()) {
            values[key] = Trim(line.substr(equals + 1));
        }
    }

    static std::string Trim(const std::string& text) {
        size_t first = text.find_first_not_of(" \t\r");
        if (first == std::string::npos) return "";
        size_t last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }
};
