#include <iostream>
#include <cassert>
#include <cmath>
#include <memory>
#include "application/CountryInstabilityScorer.hpp"
#include "infrastructure/EntityCatalog.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::application;

namespace {

CountrySignals UnrestOnly() {
    CountrySignals s;
    s.countryCode = "UA";
    s.protests = 7;
    s.fatalities = 6;
    s.highSeverity = 2;
    return s;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Country Instability Scorer Test..." << std::endl;

    auto registry = std::make_shared<const EntityRegistry>(worldpulse::infrastructure::DefaultEntityCatalog());
    ScorerSettings settings;
    settings.dampingThreshold = 10.0;
    settings.monitoredCountries = {"UA", "RU", "DE"};
    settings.floors = {{"UA", 55}};
    CountryInstabilityScorer scorer(registry, settings);
    const Timestamp now = FromEpochMillis(1760000000000);

    // 1. Floor lifts a low computed score
    CountryScore floored = scorer.scoreCountry(UnrestOnly(), 10.0, now);
    assert(floored.unrest == 100);
    assert(floored.security == 0);
    assert(floored.information == 0);
    assert(floored.composite == 55);
    assert(floored.countryName == "Ukraine");
    assert(floored.level == InstabilityLevelForScore(55));
    std::cout << "[PASS] Floor applied to 40" << std::endl;

    // 2. Floor never lowers a higher score
    CountrySignals hot = UnrestOnly();
    hot.militaryFlights = 17;
    hot.navalVessels = 6;
    hot.anyAlert = true;
    CountryScore above = scorer.scoreCountry(hot, 10.0, now);
    assert(above.security == 80);
    assert(above.information == 20);
    assert(above.composite == 70);
    std::cout << "[PASS] Floor ignored at 70" << std::endl;

    // 3. Heavy coverage damps unrest and information but not security
    CountrySignals loud = UnrestOnly();
    loud.countryCode = "DE";
    loud.newsVolume = 100.0;
    loud.militaryFlights = 10;
    CountryScore damped = scorer.scoreCountry(loud, 10.0, now);
    assert(damped.unrest == 50);
    assert(damped.security == 30);
    assert(damped.composite == 29);
    assert(std::fabs(CountryInstabilityScorer::dampingFactor(5.0, 10.0) - 1.0) < 1e-9);
    assert(std::fabs(CountryInstabilityScorer::dampingFactor(100.0, 10.0) - 0.5) < 1e-9);
    std::cout << "[PASS] Volume damping" << std::endl;

    // 4. Learned volume raises the damping threshold
    Baseline volume;
    volume.windowLong.sampleCount = 10;
    volume.windowLong.mean = 40.0;
    assert(CountryInstabilityScorer::calibratedThreshold(10.0, volume, 6) == 40.0);
    volume.windowLong.sampleCount = 2;
    assert(CountryInstabilityScorer::calibratedThreshold(10.0, volume, 6) == 10.0);
    std::cout << "[PASS] Threshold calibration" << std::endl;

    // 5. Trend follows committed history
    assert(!floored.hasPrevious);
    assert(floored.trend == ScoreTrend::Stable);
    scorer.commit({floored});
    CountryScore rising = scorer.scoreCountry(hot, 10.0, now + std::chrono::minutes(5));
    assert(rising.hasPrevious);
    assert(rising.change == 15);
    assert(rising.trend == ScoreTrend::Rising);
    scorer.commit({rising});
    auto state = scorer.trendState("ua");
    assert(state && state->previous && *state->previous == 55 && state->current == 70);
    CountryScore falling = scorer.scoreCountry(UnrestOnly(), 10.0, now + std::chrono::minutes(10));
    assert(falling.trend == ScoreTrend::Falling);
    assert(CountryInstabilityScorer::trendFor(50, 53) == ScoreTrend::Stable);
    std::cout << "[PASS] Trend tracking" << std::endl;

    // 6. Signals are attributed from headlines and events
    NewsCluster cluster;
    cluster.id = "c1";
    cluster.primaryTitle = "Ukrainian drones hit Russian refinery";
    cluster.velocityPerHour = 2.0;
    cluster.members.resize(3);
    GeoEvent protest;
    protest.kind = GeoEventKind::Protest;
    protest.countryCode = "ua";
    protest.fatalities = 2;
    protest.severity = EventSeverity::High;
    GeoEvent flight;
    flight.kind = GeoEventKind::MilitaryFlight;
    flight.countryCode = "RU";
    GeoEvent unmonitored;
    unmonitored.kind = GeoEventKind::Protest;
    unmonitored.countryCode = "FR";

    auto signals = scorer.collectSignals({cluster}, {protest, flight, unmonitored}, {});
    assert(signals.size() == 3);
    assert(signals["UA"].newsCount == 1);
    assert(signals["UA"].newsVolume == 3.0);
    assert(signals["UA"].protests == 1);
    assert(signals["UA"].fatalities == 2);
    assert(signals["UA"].highSeverity == 1);
    assert(signals["RU"].newsCount == 1);
    assert(signals["RU"].militaryFlights == 1);
    assert(std::fabs(signals["RU"].avgVelocity - 2.0) < 1e-9);
    assert(signals["DE"].newsCount == 0);
    assert(signals.count("FR") == 0);

    // Fatality totals saturate instead of overflowing
    GeoEvent massive = protest;
    massive.fatalities = kMaxFatalities;
    auto saturated = scorer.collectSignals({}, {massive, massive, massive}, {});
    assert(saturated["UA"].fatalities == kMaxFatalities);
    assert(scorer.scoreCountry(saturated["UA"], 10.0, now).unrest == 74);
    std::cout << "[PASS] Signal attribution" << std::endl;

    // 7. Only monitored countries are scored, highest first
    auto scores = scorer.computeScores(signals, {}, now);
    assert(scores.size() == 3);
    for (std::size_t i = 1; i < scores.size(); ++i) {
        assert(scores[i - 1].composite >= scores[i].composite);
    }
    assert(scores.front().countryCode == "UA");
    std::cout << "[PASS] Monitored country ranking" << std::endl;

    std::cout << "[Test] Country Instability Scorer Test Completed Successfully." << std::endl;
    return 0;
}
