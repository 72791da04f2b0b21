/**
 * @file EntityRecord.hpp
 * @brief Static knowledge-base entry for a named entity.
 */

#pragma once

#include <string>
#include <set>
#include <optional>

namespace worldpulse::domain {

/**
 * @enum EntityType
 * @brief Closed set of entity categories. Extend with care: every switch over it is exhaustive.
 */
enum class EntityType {
    Company,
    Index,
    Commodity,
    Crypto,
    Country,
    Organization,
    Person
};

inline std::string EntityTypeToString(EntityType type) {
    switch (type) {
        case EntityType::Company: return "company";
        case EntityType::Index: return "index";
        case EntityType::Commodity: return "commodity";
        case EntityType::Crypto: return "crypto";
        case EntityType::Country: return "country";
        case EntityType::Organization: return "organization";
        case EntityType::Person: return "person";
    }
    return "company";
}

inline std::optional<EntityType> EntityTypeFromString(const std::string& value) {
    if (value == "company") return EntityType::Company;
    if (value == "index") return EntityType::Index;
    if (value == "commodity") return EntityType::Commodity;
    if (value == "crypto") return EntityType::Crypto;
    if (value == "country") return EntityType::Country;
    if (value == "organization") return EntityType::Organization;
    if (value == "person") return EntityType::Person;
    return std::nullopt;
}

/**
 * @struct EntityRecord
 * @brief Loaded once at startup and never mutated afterwards.
 */
struct EntityRecord {
    std::string id;                     ///< Canonical id, e.g. ticker "AVGO" or ISO code "UA".
    std::string displayName;
    EntityType type = EntityType::Company;
    std::set<std::string> aliases;      ///< Exact names, matched on word boundaries.
    std::set<std::string> keywords;     ///< Topical terms, matched with inflections.
    std::string sector;
    std::set<std::string> relatedIds;
};

} // namespace worldpulse::domain
