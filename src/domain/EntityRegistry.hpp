/**
 * @file EntityRegistry.hpp
 * @brief Static entity knowledge base with its precomputed lookup index.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include "domain/EntityRecord.hpp"
#include "domain/TextMatch.hpp"

namespace worldpulse::domain {

/**
 * @class EntityRegistry
 * @brief Validated, immutable set of entities.
 *
 * Built once at startup. The constructor throws MalformedConfiguration on any
 * structural fault so that a bad catalogue can never reach an analysis cycle.
 * All lookups are case-insensitive.
 */
class EntityRegistry {
public:
    static constexpr std::size_t kMinAliasLength = 3;

    explicit EntityRegistry(std::vector<EntityRecord> records);

    const EntityRecord* byId(const std::string& id) const;
    const EntityRecord* byAlias(const std::string& alias) const;
    std::vector<const EntityRecord*> byKeyword(const std::string& keyword) const;
    std::vector<const EntityRecord*> bySector(const std::string& sector) const;
    std::vector<const EntityRecord*> byType(EntityType type) const;

    /**
     * @brief Entities of the given type mentioned in the text.
     *
     * An alias or the display name counts on a whole-word hit; keywords count
     * with inflections (see text::MatchesKeyword).
     */
    std::vector<const EntityRecord*> mentionedIn(const MatchText& text, EntityType type) const;

    const std::vector<EntityRecord>& all() const { return m_records; }
    std::size_t size() const { return m_records.size(); }

private:
    std::vector<const EntityRecord*> resolve(const std::set<std::size_t>& positions) const;

    std::vector<EntityRecord> m_records;
    std::map<std::string, std::size_t> m_byId;
    std::map<std::string, std::size_t> m_byAlias;
    std::map<std::string, std::set<std::size_t>> m_byKeyword;
    std::map<std::string, std::set<std::size_t>> m_bySector;
    std::map<EntityType, std::set<std::size_t>> m_byType;
};

} // namespace worldpulse::domain
