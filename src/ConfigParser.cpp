#include "ConfigParser.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

bool checkFolder(const std::string& label, const std::string& folder) {
    if (folder.empty()) {
        std::cerr << label << " has not been configured yet." << std::endl;
        return false;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(folder, ec)) {
        return true;
    }

    if (ec) {
        std::cerr << "Unable to validate folder `" << folder << "`: " << ec.message() << std::endl;
        return false;
    }

    std::cerr << label << " `" << folder << "` is not a folder, please fix it and try again." << std::endl;
    return false;
}

} // namespace

const OrganizerConfig& ConfigParser::getConfig() const {
    return m_config;
}

bool ConfigParser::validateFolders() const {
    const bool sourceOk = checkFolder("Source folder", m_config.sourceFolder);
    const bool manifestOk = checkFolder("Manifest folder", m_config.manifestFolder);
    return sourceOk && manifestOk;
}

bool ConfigParser::load(const std::string& path) {
    // A directory argument means the bundled layout: organizer.json lives in a config folder beneath it.
    std::filesystem::path configPath(path);
    std::error_code ec;
    if (std::filesystem::is_directory(configPath, ec)) {
        configPath = configPath / "config" / "organizer.json";
    }

    std::ifstream jsonFile(configPath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << configPath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!parse(data)) {
        return false;
    }

    std::cout << "Loaded configuration from " << configPath << std::endl;
    return true;
}

bool ConfigParser::loadFromString(const std::string& text, const std::string& origin) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration " << origin << ": " << e.what() << std::endl;
        return false;
    }
    return parse(data);
}

bool ConfigParser::parse(const json& data) {
    if (!data.is_object()) {
        std::cerr << "Invalid configuration: the top level must be an object." << std::endl;
        return false;
    }

    if (!loadPlaceholders(data)) {
        return false;
    }

    OrganizerConfig config;
    if (!readFolder(data, "source_folder", true, config.sourceFolder) ||
        !readFolder(data, "manifest_folder", true, config.manifestFolder) ||
        !readFolder(data, "destination_folder", true, config.destinationFolder) ||
        !readFolder(data, "report_folder", false, config.reportFolder) ||
        !readFolder(data, "work_folder", false, config.workFolder)) {
        return false;
    }

    if (config.reportFolder.empty()) {
        config.reportFolder = (std::filesystem::path(config.manifestFolder) / "Reports").string();
    }
    if (config.workFolder.empty()) {
        config.workFolder = config.reportFolder;
    }

    std::size_t threads = 0;
    if (!readCount(data, "threads", threads)) {
        return false;
    }
    if (threads > std::numeric_limits<unsigned int>::max()) {
        std::cerr << "`threads` is out of range." << std::endl;
        return false;
    }
    config.threads = static_cast<unsigned int>(threads);

    if (!readBool(data, "dry_run", config.dryRun) ||
        !readBool(data, "allow_empty_force", config.overrides.allowEmptyForce) ||
        !readBool(data, "verify_conflicts", config.verifyConflicts) ||
        !readBool(data, "auto_confirm", config.autoConfirm) ||
        !readCount(data, "conflict_confirm_threshold", config.conflictConfirmThreshold)) {
        return false;
    }

    if (!readPatterns(data, "forced_complete", config.overrides.forcedComplete) ||
        !readPatterns(data, "force_move_only", config.overrides.forceMoveOnly)) {
        return false;
    }

    std::string overrideError;
    if (!config.overrides.validate(overrideError)) {
        std::cerr << "Invalid configuration: " << overrideError << "; the overrides are mutually exclusive." << std::endl;
        return false;
    }

    m_config = std::move(config);
    return true;
}

bool ConfigParser::readFolder(const json& data, const char* key, bool required, std::string& out) const {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        if (required) {
            std::cerr << "Missing `" << key << "` in configuration." << std::endl;
            return false;
        }
        return true;
    }

    if (!it->is_string()) {
        std::cerr << "`" << key << "` must be a string." << std::endl;
        return false;
    }

    std::string unresolved;
    if (!expandPlaceholders(it->get<std::string>(), out, unresolved)) {
        std::cerr << "`" << key << "` uses unknown placeholder `" << unresolved << "`." << std::endl;
        return false;
    }
    if (required && out.empty()) {
        std::cerr << "`" << key << "` cannot be empty." << std::endl;
        return false;
    }
    return true;
}

bool ConfigParser::readPatterns(const json& data, const char* key, std::vector<std::string>& out) const {
    out.clear();
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }

    if (!it->is_array()) {
        std::cerr << "Invalid configuration: `" << key << "` must be an array." << std::endl;
        return false;
    }

    for (const auto& pattern : *it) {
        if (!pattern.is_string()) {
            std::cerr << "Invalid entry in `" << key << "`: each pattern must be a string." << std::endl;
            return false;
        }
        const std::string value = pattern.get<std::string>();
        if (value.empty()) {
            std::cerr << "Invalid entry in `" << key << "`: patterns cannot be empty." << std::endl;
            return false;
        }
        out.push_back(value);
    }
    return true;
}

bool ConfigParser::readBool(const json& data, const char* key, bool& out) const {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        std::cerr << "`" << key << "` must be a boolean value." << std::endl;
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool ConfigParser::readCount(const json& data, const char* key, std::size_t& out) const {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }
    if (!it->is_number_unsigned()) {
        std::cerr << "`" << key << "` must be a non-negative integer." << std::endl;
        return false;
    }
    out = it->get<std::size_t>();
    return true;
}

bool ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    auto userIt = data.find("user");
    if (userIt != data.end() && !userIt->is_null()) {
        if (!userIt->is_string()) {
            std::cerr << "`user` must be a string." << std::endl;
            return false;
        }
        m_placeholders["user"] = userIt->get<std::string>();
    }

    auto mapIt = data.find("placeholders");
    if (mapIt == data.end() || mapIt->is_null()) {
        return true;
    }
    if (!mapIt->is_object()) {
        std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        return false;
    }
    for (const auto& item : mapIt->items()) {
        if (item.key().empty() || !item.value().is_string()) {
            std::cerr << "Placeholder `" << item.key() << "` must have a name and a string value." << std::endl;
            return false;
        }
        // An explicit entry wins over the top-level `user`.
        m_placeholders[item.key()] = item.value().get<std::string>();
    }
    return true;
}

bool ConfigParser::expandPlaceholders(const std::string& value, std::string& out, std::string& unresolved) const {
    out.clear();
    unresolved.clear();

    std::string::size_type pos = 0;
    while (pos < value.size()) {
        const std::string::size_type open = value.find("{{", pos);
        if (open == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, open - pos);

        const std::string::size_type close = value.find("}}", open + 2);
        if (close == std::string::npos) {
            unresolved = value.substr(open);
            return false;
        }

        const std::string name = value.substr(open + 2, close - open - 2);
        auto found = m_placeholders.find(name);
        if (found == m_placeholders.end()) {
            unresolved = "{{" + name + "}}";
            return false;
        }
        out += found->second;
        pos = close + 2;
    }
    return true;
}
