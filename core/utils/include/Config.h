#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace HuffStream {

    /**
     * @brief Flat key=value configuration store.
     *
     * Files are parsed line by line; blank lines and lines starting with '#'
     * are skipped. Later layers override earlier ones unless
     * overrideExisting is false. Environment variables named
     * <PREFIX><KEY in upper case> can be layered on top with applyEnvironment().
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        /**
         * @brief Override known keys from the environment
         * @param prefix Variable prefix, e.g. "HUFFSTREAM_" maps data_port to HUFFSTREAM_DATA_PORT
         * @param keys Keys to look up
         * @return Number of keys taken from the environment
         */
        size_t applyEnvironment(const std::string& prefix, const std::vector<std::string>& keys);

        bool hasKey(const std::string& key) const;
        std::vector<std::string> keys() const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        /// Typed getters return defaultValue when the key is absent or does not parse
        int getInt(const std::string& key, int defaultValue = 0) const;
        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /**
         * @brief Run each validator against the key it is registered for
         * @param schema key -> validator; absent keys are not checked
         * @param failedKey Receives the first key that failed, if any
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        std::optional<std::string> lookup(const std::string& key) const;
        static std::string trim(const std::string& value);

        std::map<std::string, std::string> settings_;
        mutable std::mutex mutex_;
    };

}
