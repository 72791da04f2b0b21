/**
 * @file EntityCatalog.hpp
 * @brief Built-in entity catalogue used when settings.json names none.
 */

#pragma once

#include <vector>
#include "domain/EntityRecord.hpp"

namespace worldpulse::infrastructure {

/** @brief Companies, indices, commodities, crypto, organizations and the monitored countries. */
std::vector<domain::EntityRecord> DefaultEntityCatalog();

} // namespace worldpulse::infrastructure
