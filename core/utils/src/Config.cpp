#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace HuffStream {

    namespace {

        std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        // Whole-string numeric parse; partial matches such as "12ab" are rejected
        template <typename T, typename Parse>
        std::optional<T> parseWhole(const std::string& text, Parse parse) {
            try {
                size_t consumed = 0;
                auto parsed = parse(text, &consumed);
                if (consumed != text.size()) {
                    return std::nullopt;
                }
                return static_cast<T>(parsed);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }

    } // namespace

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::map<std::string, std::string> parsed;
        std::string line;
        while (std::getline(file, line)) {
            auto trimmed = trim(line);
            auto eq = trimmed.find('=');
            if (trimmed.empty() || trimmed[0] == '#' || eq == std::string::npos) {
                continue;
            }

            auto key = trim(trimmed.substr(0, eq));
            if (!key.empty()) {
                parsed[key] = trim(trimmed.substr(eq + 1));
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, value] : parsed) {
            if (overrideExisting) {
                settings_[key] = std::move(value);
            } else {
                settings_.emplace(key, std::move(value));
            }
        }
        return true;
    }

    bool Config::loadLayered(const std::vector<std::string>& paths, bool overrideExisting) {
        bool anyLoaded = false;
        for (const auto& path : paths) {
            anyLoaded = loadFromFile(path, overrideExisting) || anyLoaded;
        }
        return anyLoaded;
    }

    bool Config::saveToFile(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : settings_) {
            file << key << "=" << value << "\n";
        }
        file.flush();
        return static_cast<bool>(file);
    }

    size_t Config::applyEnvironment(const std::string& prefix, const std::vector<std::string>& keys) {
        size_t applied = 0;
        for (const auto& key : keys) {
            std::string name = prefix + key;
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            if (const char* value = std::getenv(name.c_str())) {
                set(key, trim(value));
                ++applied;
            }
        }
        return applied;
    }

    bool Config::hasKey(const std::string& key) const {
        return lookup(key).has_value();
    }

    std::vector<std::string> Config::keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(settings_.size());
        for (const auto& entry : settings_) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::optional<std::string> Config::lookup(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        if (it == settings_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        return lookup(key).value_or(defaultValue);
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        auto value = lookup(key);
        if (!value) {
            return defaultValue;
        }
        auto parse = [](const std::string& s, size_t* pos) { return std::stoi(s, pos); };
        return parseWhole<int>(*value, parse).value_or(defaultValue);
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        auto value = lookup(key);
        // stoull accepts a leading '-' and wraps, so reject it up front
        if (!value || value->empty() || (*value)[0] == '-') {
            return defaultValue;
        }
        auto parse = [](const std::string& s, size_t* pos) { return std::stoull(s, pos); };
        return parseWhole<size_t>(*value, parse).value_or(defaultValue);
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        auto value = lookup(key);
        if (!value) {
            return defaultValue;
        }

        auto word = lowercase(*value);
        if (word == "1" || word == "true" || word == "yes" || word == "on") {
            return true;
        }
        if (word == "0" || word == "false" || word == "no" || word == "off") {
            return false;
        }
        return defaultValue;
    }

    void Config::setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    bool Config::validate(const std::unordered_map<std::string, Validator>& schema,
                          std::string* failedKey) const {
        for (const auto& [key, validator] : schema) {
            auto value = lookup(key);
            if (value && validator && !validator(key, *value)) {
                if (failedKey) {
                    *failedKey = key;
                }
                return false;
            }
        }
        return true;
    }

    std::string Config::trim(const std::string& value) {
        const char* blanks = " \t\r\n";
        auto start = value.find_first_not_of(blanks);
        if (start == std::string::npos) {
            return "";
        }
        return value.substr(start, value.find_last_not_of(blanks) - start + 1);
    }

}
