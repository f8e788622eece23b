#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "CompletenessEvaluator.hpp"

// Everything one organizer run needs to know; folders are already placeholder-expanded.
struct OrganizerConfig {
    std::string sourceFolder;
    std::string manifestFolder;
    std::string destinationFolder;
    std::string reportFolder;
    std::string workFolder;
    unsigned int threads = 0;
    bool dryRun = false;
    OverridePolicy overrides;
    bool verifyConflicts = true;
    std::size_t conflictConfirmThreshold = 100;
    bool autoConfirm = false;
};

// Parses organizer.json and exposes the resolved run configuration.
class ConfigParser {
public:
    // Read-only access to the loaded configuration.
    const OrganizerConfig& getConfig() const;
    // Load `<path>/config/organizer.json`, or `path` itself when it names a file; false on I/O or validation errors.
    bool load(const std::string& path);
    // Parse configuration text; `origin` only labels messages.
    bool loadFromString(const std::string& text, const std::string& origin);
    // Confirm the source and manifest folders exist before a run starts.
    bool validateFolders() const;

private:
    bool parse(const nlohmann::json& data);
    // `user` and every `placeholders` entry; false when a value is not a string.
    bool loadPlaceholders(const nlohmann::json& data);
    // Expand each `{{name}}` once, left to right; substituted text is not rescanned. Returns false with
    // `unresolved` set to the first unknown or unclosed token.
    bool expandPlaceholders(const std::string& value, std::string& out, std::string& unresolved) const;
    bool readFolder(const nlohmann::json& data, const char* key, bool required, std::string& out) const;
    bool readPatterns(const nlohmann::json& data, const char* key, std::vector<std::string>& out) const;
    bool readBool(const nlohmann::json& data, const char* key, bool& out) const;
    bool readCount(const nlohmann::json& data, const char* key, std::size_t& out) const;

    OrganizerConfig m_config;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
