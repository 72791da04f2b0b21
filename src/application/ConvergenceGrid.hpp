/**
 * @file ConvergenceGrid.hpp
 * @brief Spatial binning of geolocated events and multi-kind co-occurrence alerts.
 */

#pragma once

#include <vector>
#include "domain/GeoEvent.hpp"

namespace worldpulse::application {

/**
 * @class ConvergenceGrid
 * @brief Fixed-size lat/lon grid over a trailing time window.
 *
 * Cells are keyed by floor(lat/cellSize), floor(lon/cellSize). Events that
 * straddle a cell boundary are not merged across cells, so convergence at grid
 * edges is under-counted.
 */
class ConvergenceGrid {
public:
    static constexpr int kMinDistinctKinds = 3;
    static constexpr double kMinCellSizeDeg = 0.01;
    static constexpr double kMaxCellSizeDeg = 90.0;

    /** @brief A cell size outside [kMinCellSizeDeg, kMaxCellSizeDeg] falls back to 1 degree. */
    ConvergenceGrid(double cellSizeDeg = 1.0, std::chrono::hours window = std::chrono::hours(24));

    /** @brief Cells holding at least one event inside [now - window, now], ordered by key. */
    std::vector<domain::GeoCell> binEvents(const std::vector<domain::GeoEvent>& events, domain::Timestamp now) const;

    /**
     * @brief Cells with at least three distinct event kinds.
     * @return Alerts sorted by score descending, then cell id.
     */
    std::vector<domain::ConvergenceAlert> detectConvergence(const std::vector<domain::GeoEvent>& events,
                                                            domain::Timestamp now) const;

    /** @brief min(100, kinds*25 + min(25, totalEvents*2)). */
    static int score(int distinctKinds, int totalEvents);

    /** @brief Critical at four kinds or a score of 80, high from 60, else medium. */
    static domain::ConvergenceLevel levelFor(int distinctKinds, int score);

    domain::CellKey cellFor(double lat, double lon) const;

private:
    double m_cellSize;
    std::chrono::hours m_window;
};

} // namespace worldpulse::application
