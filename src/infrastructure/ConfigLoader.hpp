/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (settings.json) and the entity catalogue.
 *
 * Keeps JSON parsing of configuration in one place. Every structural problem
 * surfaces as domain::MalformedConfiguration at startup.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "application/AnalysisConfig.hpp"
#include "domain/EntityRecord.hpp"

namespace worldpulse::infrastructure {

struct HttpSettings {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 8787;
};

/**
 * @struct AppSettings
 * @brief Everything settings.json can configure.
 */
struct AppSettings {
    application::AnalysisConfig analysis;
    std::string stateDir;       ///< Empty: PathUtils::GetStateDir().
    std::string inputDir = "input";
    std::string entityCatalog;  ///< Empty: built-in catalogue.
    HttpSettings http;
    std::map<std::string, int> sourceTiers; ///< Source name → tier, applied to items without one.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param path Path to the settings file. A missing file yields the defaults.
     * @throws domain::MalformedConfiguration on unparsable JSON or wrongly typed values.
     */
    static AppSettings Load(const std::string& path);

    /** @brief Parses settings from an already loaded document. */
    static AppSettings FromJsonText(const std::string& text);

    /**
     * @brief Reads an entity catalogue: {"entities": [{id, name, type, aliases, keywords, sector, related}]}.
     * @throws domain::MalformedConfiguration when the file is missing or malformed.
     */
    static std::vector<domain::EntityRecord> LoadEntityCatalog(const std::string& path);
};

} // namespace worldpulse::infrastructure
