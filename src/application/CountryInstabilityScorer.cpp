/**
 * @file CountryInstabilityScorer.cpp
 * @brief Implementation of CountryInstabilityScorer.
 */

#include "application/CountryInstabilityScorer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include "domain/TextMatch.hpp"

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

constexpr double kUnrestWeight = 0.4;
constexpr double kSecurityWeight = 0.3;
constexpr double kInformationWeight = 0.3;

double Clamp100(double value) {
    return std::max(0.0, std::min(100.0, value));
}

std::string NormalizeCode(const std::string& code) {
    std::string out = text::Trim(code);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

CountryInstabilityScorer::CountryInstabilityScorer(std::shared_ptr<const EntityRegistry> registry, ScorerSettings settings)
    : m_registry(std::move(registry)), m_settings(std::move(settings)) {}

std::map<std::string, CountrySignals> CountryInstabilityScorer::collectSignals(const std::vector<NewsCluster>& clusters,
                                                                              const std::vector<GeoEvent>& events,
                                                                              const std::vector<ConvergenceAlert>& alerts) const {
    std::map<std::string, CountrySignals> signals;
    for (const auto& code : m_settings.monitoredCountries) {
        signals[code].countryCode = code;
    }
    auto lookup = [&signals](const std::string& rawCode) -> CountrySignals* {
        auto it = signals.find(NormalizeCode(rawCode));
        return it == signals.end() ? nullptr : &it->second;
    };

    std::map<std::string, double> velocitySums;
    if (m_registry) {
        for (const auto& cluster : clusters) {
            MatchText title = text::Prepare(cluster.primaryTitle);
            for (const auto* country : m_registry->mentionedIn(title, EntityType::Country)) {
                CountrySignals* s = lookup(country->id);
                if (!s) continue;
                s->newsCount++;
                s->newsVolume += static_cast<double>(cluster.members.size());
                s->anyAlert = s->anyAlert || cluster.isAlert;
                velocitySums[s->countryCode] += cluster.velocityPerHour;
            }
        }
    }
    for (auto& [code, s] : signals) {
        if (s.newsCount > 0) s.avgVelocity = velocitySums[code] / s.newsCount;
    }

    for (const auto& event : events) {
        if (!event.countryCode) continue;
        CountrySignals* s = lookup(*event.countryCode);
        if (!s) continue;
        switch (event.kind) {
            case GeoEventKind::Protest:
                s->protests++;
                s->fatalities = std::min(kMaxFatalities,
                                         s->fatalities + std::clamp(event.fatalities, 0, kMaxFatalities));
                if (event.severity == EventSeverity::High) s->highSeverity++;
                break;
            case GeoEventKind::MilitaryFlight:
                s->militaryFlights++;
                break;
            case GeoEventKind::MilitaryVessel:
                s->navalVessels++;
                break;
            case GeoEventKind::Earthquake:
            case GeoEventKind::Outage:
                break;
        }
    }

    for (const auto& alert : alerts) {
        for (const auto& code : alert.countries) {
            if (CountrySignals* s = lookup(code)) s->anyAlert = true;
        }
    }
    return signals;
}

double CountryInstabilityScorer::dampingFactor(double newsVolume, double threshold) {
    if (threshold <= 0.0 || !std::isfinite(newsVolume) || newsVolume <= threshold) return 1.0;
    return 1.0 / (1.0 + std::log10(newsVolume / threshold));
}

double CountryInstabilityScorer::calibratedThreshold(double configured, const Baseline& volumeBaseline, int minSamples) {
    if (volumeBaseline.windowLong.sampleCount < minSamples) return configured;
    return std::max(configured, volumeBaseline.windowLong.mean);
}

ScoreTrend CountryInstabilityScorer::trendFor(std::optional<int> previous, int current, int delta) {
    if (!previous) return ScoreTrend::Stable;
    int change = current - *previous;
    if (change >= delta) return ScoreTrend::Rising;
    if (change <= -delta) return ScoreTrend::Falling;
    return ScoreTrend::Stable;
}

int CountryInstabilityScorer::floorFor(const std::string& countryCode) const {
    auto it = m_settings.floors.find(NormalizeCode(countryCode));
    return it == m_settings.floors.end() ? 0 : it->second;
}

CountryScore CountryInstabilityScorer::scoreCountry(const CountrySignals& s, double dampingThreshold, Timestamp now) const {
    double damping = dampingFactor(s.newsVolume, dampingThreshold);

    double unrestRaw = std::min(50, s.protests * 8) + std::min(30, s.fatalities * 5) + std::min(20, s.highSeverity * 10);
    double securityRaw = std::min(50, s.militaryFlights * 3) + std::min(30, s.navalVessels * 5);
    double informationRaw = std::min(40.0, s.newsCount * 5.0) + std::min(40.0, s.avgVelocity * 10.0) + (s.anyAlert ? 20.0 : 0.0);

    double unrest = Clamp100(unrestRaw * damping);
    double security = Clamp100(securityRaw);
    double information = Clamp100(informationRaw * damping);

    int computed = static_cast<int>(std::lround(unrest * kUnrestWeight + security * kSecurityWeight + information * kInformationWeight));

    CountryScore score;
    score.countryCode = NormalizeCode(s.countryCode);
    if (m_registry) {
        if (const auto* entity = m_registry->byId(score.countryCode)) score.countryName = entity->displayName;
    }
    score.unrest = static_cast<int>(std::lround(unrest));
    score.security = static_cast<int>(std::lround(security));
    score.information = static_cast<int>(std::lround(information));
    score.composite = std::max(computed, floorFor(score.countryCode));
    score.level = InstabilityLevelForScore(score.composite);
    score.computedAt = now;

    auto it = m_history.find(score.countryCode);
    if (it != m_history.end()) {
        score.hasPrevious = true;
        score.change = score.composite - it->second.current;
        score.trend = trendFor(it->second.current, score.composite, m_settings.trendDelta);
    }
    return score;
}

std::vector<CountryScore> CountryInstabilityScorer::computeScores(const std::map<std::string, CountrySignals>& signals,
                                                                  const std::map<std::string, double>& thresholds,
                                                                  Timestamp now) const {
    std::vector<CountryScore> scores;
    for (const auto& code : m_settings.monitoredCountries) {
        CountrySignals s;
        auto sit = signals.find(code);
        if (sit != signals.end()) s = sit->second;
        s.countryCode = code;

        auto tit = thresholds.find(code);
        double threshold = tit != thresholds.end() ? tit->second : m_settings.dampingThreshold;
        scores.push_back(scoreCountry(s, threshold, now));
    }
    std::sort(scores.begin(), scores.end(), [](const CountryScore& a, const CountryScore& b) {
        if (a.composite != b.composite) return a.composite > b.composite;
        return a.countryCode < b.countryCode;
    });
    return scores;
}

void CountryInstabilityScorer::commit(const std::vector<CountryScore>& scores) {
    for (const auto& score : scores) {
        auto it = m_history.find(score.countryCode);
        if (it == m_history.end()) {
            m_history[score.countryCode] = TrendState{std::nullopt, score.composite};
        } else {
            it->second.previous = it->second.current;
            it->second.current = score.composite;
        }
    }
}

std::optional<TrendState> CountryInstabilityScorer::trendState(const std::string& countryCode) const {
    auto it = m_history.find(NormalizeCode(countryCode));
    if (it == m_history.end()) return std::nullopt;
    return it->second;
}

} // namespace worldpulse::application
