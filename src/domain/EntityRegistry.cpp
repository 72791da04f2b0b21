/**
 * @file EntityRegistry.cpp
 * @brief Implementation of EntityRegistry.
 */

#include "domain/EntityRegistry.hpp"
#include "domain/MalformedConfiguration.hpp"

namespace worldpulse::domain {

EntityRegistry::EntityRegistry(std::vector<EntityRecord> records) : m_records(std::move(records)) {
    for (std::size_t i = 0; i < m_records.size(); ++i) {
        const auto& record = m_records[i];
        std::string id = text::Trim(record.id);
        if (id.empty()) {
            throw MalformedConfiguration("entity #" + std::to_string(i) + " has an empty id");
        }
        if (!m_byId.emplace(text::ToLower(id), i).second) {
            throw MalformedConfiguration("duplicate entity id '" + id + "'");
        }
        if (record.aliases.empty()) {
            throw MalformedConfiguration("entity '" + id + "' has no aliases");
        }

        for (const auto& rawAlias : record.aliases) {
            std::string alias = text::ToLower(text::Trim(rawAlias));
            if (alias.size() < kMinAliasLength) {
                throw MalformedConfiguration("alias '" + rawAlias + "' of entity '" + id +
                                             "' is shorter than " + std::to_string(kMinAliasLength) + " characters");
            }
            auto [it, inserted] = m_byAlias.emplace(alias, i);
            if (!inserted && it->second != i) {
                throw MalformedConfiguration("alias '" + rawAlias + "' is claimed by both '" +
                                             m_records[it->second].id + "' and '" + id + "'");
            }
        }

        for (const auto& keyword : record.keywords) {
            std::string kw = text::ToLower(text::Trim(keyword));
            if (!kw.empty()) m_byKeyword[kw].insert(i);
        }
        if (!record.sector.empty()) {
            m_bySector[text::ToLower(record.sector)].insert(i);
        }
        m_byType[record.type].insert(i);
    }

    // Related ids can point forward, so they are checked once every id is known.
    for (const auto& record : m_records) {
        for (const auto& related : record.relatedIds) {
            if (!m_byId.count(text::ToLower(related))) {
                throw MalformedConfiguration("entity '" + record.id + "' relates to unknown entity '" + related + "'");
            }
        }
    }
}

const EntityRecord* EntityRegistry::byId(const std::string& id) const {
    auto it = m_byId.find(text::ToLower(text::Trim(id)));
    return it == m_byId.end() ? nullptr : &m_records[it->second];
}

const EntityRecord* EntityRegistry::byAlias(const std::string& alias) const {
    auto it = m_byAlias.find(text::ToLower(text::Trim(alias)));
    return it == m_byAlias.end() ? nullptr : &m_records[it->second];
}

std::vector<const EntityRecord*> EntityRegistry::byKeyword(const std::string& keyword) const {
    auto it = m_byKeyword.find(text::ToLower(text::Trim(keyword)));
    if (it == m_byKeyword.end()) return {};
    return resolve(it->second);
}

std::vector<const EntityRecord*> EntityRegistry::bySector(const std::string& sector) const {
    auto it = m_bySector.find(text::ToLower(text::Trim(sector)));
    if (it == m_bySector.end()) return {};
    return resolve(it->second);
}

std::vector<const EntityRecord*> EntityRegistry::byType(EntityType type) const {
    auto it = m_byType.find(type);
    if (it == m_byType.end()) return {};
    return resolve(it->second);
}

std::vector<const EntityRecord*> EntityRegistry::mentionedIn(const MatchText& text, EntityType type) const {
    std::vector<const EntityRecord*> found;
    for (const auto* record : byType(type)) {
        bool hit = text::ContainsPhrase(text, record->displayName);
        for (auto it = record->aliases.begin(); !hit && it != record->aliases.end(); ++it) {
            hit = text::ContainsPhrase(text, *it);
        }
        if (!hit) hit = text::MatchesAnyKeyword(text, record->keywords);
        if (hit) found.push_back(record);
    }
    return found;
}

std::vector<const EntityRecord*> EntityRegistry::resolve(const std::set<std::size_t>& positions) const {
    std::vector<const EntityRecord*> out;
    out.reserve(positions.size());
    for (auto pos : positions) out.push_back(&m_records[pos]);
    return out;
}

} // namespace worldpulse::domain
