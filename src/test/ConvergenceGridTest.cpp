#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>
#include "application/ConvergenceGrid.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::application;

namespace {

GeoEvent Event(GeoEventKind kind, double lat, double lon, Timestamp at, const std::string& country = "TW") {
    GeoEvent e;
    e.kind = kind;
    e.lat = lat;
    e.lon = lon;
    e.occurredAt = at;
    e.countryCode = country;
    return e;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Convergence Grid Test..." << std::endl;

    ConvergenceGrid grid(1.0, std::chrono::hours(24));
    const Timestamp now = FromEpochMillis(1760000000000);

    // 1. Three kinds in one cell within the window
    std::vector<GeoEvent> events;
    for (int i = 0; i < 3; ++i) events.push_back(Event(GeoEventKind::MilitaryFlight, 25.5, 121.5, now - std::chrono::hours(i + 1)));
    for (int i = 0; i < 2; ++i) events.push_back(Event(GeoEventKind::MilitaryVessel, 25.2, 121.8, now - std::chrono::hours(3)));
    events.push_back(Event(GeoEventKind::Protest, 25.9, 121.1, now - std::chrono::hours(10)));

    auto alerts = grid.detectConvergence(events, now);
    assert(alerts.size() == 1);
    const auto& alert = alerts.front();
    assert(alert.cellId == "25:121");
    assert(alert.distinctKinds == 3);
    assert(alert.totalEvents == 6);
    assert(alert.score == 87);
    assert(alert.level == ConvergenceLevel::Critical);
    assert(alert.eventsByKind.at(GeoEventKind::MilitaryFlight) == 3);
    assert(alert.countries.count("TW") == 1);
    assert(std::fabs(alert.centerLat - 25.5) < 1e-9);
    std::cout << "[PASS] Three-kind convergence is critical" << std::endl;

    // 2. Old, future and invalid events are ignored
    std::vector<GeoEvent> noisy = events;
    noisy.push_back(Event(GeoEventKind::Earthquake, 25.5, 121.5, now - std::chrono::hours(30)));
    noisy.push_back(Event(GeoEventKind::Outage, 25.5, 121.5, now + std::chrono::hours(1)));
    noisy.push_back(Event(GeoEventKind::Outage, std::numeric_limits<double>::quiet_NaN(), 121.5, now));
    noisy.push_back(Event(GeoEventKind::Outage, 95.0, 121.5, now));
    auto filtered = grid.detectConvergence(noisy, now);
    assert(filtered.size() == 1);
    assert(filtered.front().distinctKinds == 3);
    assert(filtered.front().totalEvents == 6);
    std::cout << "[PASS] Window and coordinate filtering" << std::endl;

    // 3. Two kinds are not convergence; cells do not leak
    std::vector<GeoEvent> split = {
        Event(GeoEventKind::MilitaryFlight, 10.2, 10.2, now),
        Event(GeoEventKind::Protest, 10.7, 10.7, now),
        Event(GeoEventKind::Outage, 11.2, 10.2, now),
    };
    assert(grid.detectConvergence(split, now).empty());
    assert(grid.binEvents(split, now).size() == 2);
    std::cout << "[PASS] Below threshold" << std::endl;

    // 4. Negative coordinates floor toward the south-west
    CellKey sw = grid.cellFor(-0.5, -179.5);
    assert(sw.latIndex == -1 && sw.lonIndex == -180);
    std::cout << "[PASS] Cell indexing" << std::endl;

    // 5. Scoring and levels
    assert(ConvergenceGrid::score(3, 1) == 77);
    assert(ConvergenceGrid::score(5, 40) == 100);
    assert(ConvergenceGrid::levelFor(4, 50) == ConvergenceLevel::Critical);
    assert(ConvergenceGrid::levelFor(3, 79) == ConvergenceLevel::High);
    assert(ConvergenceGrid::levelFor(2, 55) == ConvergenceLevel::Medium);
    std::cout << "[PASS] Score bands" << std::endl;

    // 6. Ordering by score
    std::vector<GeoEvent> two = events;
    two.push_back(Event(GeoEventKind::MilitaryFlight, -33.5, 151.5, now, "AU"));
    two.push_back(Event(GeoEventKind::Protest, -33.5, 151.5, now, "AU"));
    two.push_back(Event(GeoEventKind::Outage, -33.5, 151.5, now, "AU"));
    two.push_back(Event(GeoEventKind::Earthquake, -33.5, 151.5, now, "AU"));
    auto ranked = grid.detectConvergence(two, now);
    assert(ranked.size() == 2);
    assert(ranked[0].score >= ranked[1].score);
    assert(ranked[0].cellId == "-34:151");
    std::cout << "[PASS] Alerts ranked by score" << std::endl;

    std::cout << "[Test] Convergence Grid Test Completed Successfully." << std::endl;
    return 0;
}
