/**
 * @file ConvergenceGrid.cpp
 * @brief Implementation of ConvergenceGrid.
 */

#include "application/ConvergenceGrid.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

bool ValidPosition(double lat, double lon) {
    return std::isfinite(lat) && std::isfinite(lon) &&
           lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

std::string CellId(const CellKey& key) {
    return std::to_string(key.latIndex) + ":" + std::to_string(key.lonIndex);
}

} // namespace

ConvergenceGrid::ConvergenceGrid(double cellSizeDeg, std::chrono::hours window)
    : m_cellSize(cellSizeDeg >= kMinCellSizeDeg && cellSizeDeg <= kMaxCellSizeDeg ? cellSizeDeg : 1.0),
      m_window(window) {}

CellKey ConvergenceGrid::cellFor(double lat, double lon) const {
    return CellKey{static_cast<int>(std::floor(lat / m_cellSize)), static_cast<int>(std::floor(lon / m_cellSize))};
}

std::vector<GeoCell> ConvergenceGrid::binEvents(const std::vector<GeoEvent>& events, Timestamp now) const {
    Timestamp windowStart = now - m_window;
    std::map<CellKey, GeoCell> cells;

    for (const auto& event : events) {
        if (!ValidPosition(event.lat, event.lon)) continue;
        if (event.occurredAt < windowStart || event.occurredAt > now) continue;

        CellKey key = cellFor(event.lat, event.lon);
        auto& cell = cells[key];
        cell.key = key;
        cell.windowStart = windowStart;
        cell.windowEnd = now;
        cell.eventsByKind[event.kind]++;
        if (event.countryCode && !event.countryCode->empty()) cell.countries.insert(*event.countryCode);
    }

    std::vector<GeoCell> out;
    out.reserve(cells.size());
    for (auto& [key, cell] : cells) out.push_back(std::move(cell));
    return out;
}

int ConvergenceGrid::score(int distinctKinds, int totalEvents) {
    return std::min(100, distinctKinds * 25 + std::min(25, totalEvents * 2));
}

ConvergenceLevel ConvergenceGrid::levelFor(int distinctKinds, int score) {
    if (distinctKinds >= 4 || score >= 80) return ConvergenceLevel::Critical;
    if (score >= 60) return ConvergenceLevel::High;
    return ConvergenceLevel::Medium;
}

std::vector<ConvergenceAlert> ConvergenceGrid::detectConvergence(const std::vector<GeoEvent>& events, Timestamp now) const {
    std::vector<ConvergenceAlert> alerts;
    for (auto& cell : binEvents(events, now)) {
        int kinds = static_cast<int>(cell.eventsByKind.size());
        if (kinds < kMinDistinctKinds) continue;

        ConvergenceAlert alert;
        alert.cellKey = cell.key;
        alert.cellId = CellId(cell.key);
        alert.centerLat = (cell.key.latIndex + 0.5) * m_cellSize;
        alert.centerLon = (cell.key.lonIndex + 0.5) * m_cellSize;
        alert.distinctKinds = kinds;
        alert.totalEvents = cell.totalEvents();
        alert.eventsByKind = cell.eventsByKind;
        alert.score = score(kinds, alert.totalEvents);
        alert.level = levelFor(kinds, alert.score);
        alert.countries = cell.countries;
        alert.windowStart = cell.windowStart;
        alert.windowEnd = cell.windowEnd;
        alerts.push_back(std::move(alert));
    }

    std::sort(alerts.begin(), alerts.end(), [](const ConvergenceAlert& a, const ConvergenceAlert& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.cellId < b.cellId;
    });
    return alerts;
}

} // namespace worldpulse::application
