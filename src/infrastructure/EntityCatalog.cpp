/**
 * @file EntityCatalog.cpp
 * @brief Built-in entity catalogue.
 */

#include "infrastructure/EntityCatalog.hpp"

namespace worldpulse::infrastructure {

using domain::EntityRecord;
using domain::EntityType;

namespace {

EntityRecord Make(const std::string& id, const std::string& name, EntityType type,
                  std::set<std::string> aliases, std::set<std::string> keywords,
                  const std::string& sector = "", std::set<std::string> related = {}) {
    EntityRecord r;
    r.id = id;
    r.displayName = name;
    r.type = type;
    r.aliases = std::move(aliases);
    r.keywords = std::move(keywords);
    r.sector = sector;
    r.relatedIds = std::move(related);
    return r;
}

} // namespace

std::vector<EntityRecord> DefaultEntityCatalog() {
    std::vector<EntityRecord> c;

    // Companies
    c.push_back(Make("AVGO", "Broadcom", EntityType::Company, {"Broadcom", "AVGO"},
                     {"custom chips", "vmware"}, "semiconductors", {"TSM"}));
    c.push_back(Make("NVDA", "Nvidia", EntityType::Company, {"Nvidia", "NVDA"},
                     {"gpu", "blackwell", "cuda"}, "semiconductors", {"TSM"}));
    c.push_back(Make("TSM", "TSMC", EntityType::Company, {"TSMC", "Taiwan Semiconductor"},
                     {"foundry", "chipmaker"}, "semiconductors", {"TW"}));
    c.push_back(Make("AMD", "AMD", EntityType::Company, {"AMD", "Advanced Micro Devices"},
                     {"ryzen", "instinct"}, "semiconductors"));
    c.push_back(Make("INTC", "Intel", EntityType::Company, {"Intel", "INTC"},
                     {"foundry"}, "semiconductors"));
    c.push_back(Make("AAPL", "Apple", EntityType::Company, {"Apple", "AAPL"},
                     {"iphone", "app store"}, "technology"));
    c.push_back(Make("MSFT", "Microsoft", EntityType::Company, {"Microsoft", "MSFT"},
                     {"azure", "windows"}, "technology"));
    c.push_back(Make("XOM", "ExxonMobil", EntityType::Company, {"Exxon", "ExxonMobil", "XOM"},
                     {"oil major"}, "energy", {"CL=F"}));
    c.push_back(Make("LMT", "Lockheed Martin", EntityType::Company, {"Lockheed", "Lockheed Martin", "LMT"},
                     {"f-35", "defense contract"}, "defense"));
    c.push_back(Make("RTX", "RTX", EntityType::Company, {"Raytheon", "RTX"},
                     {"patriot missile", "defense contract"}, "defense"));

    // Indices
    c.push_back(Make("^GSPC", "S&P 500", EntityType::Index, {"S&P 500", "S&P", "SPX"},
                     {"wall street", "stocks"}, "broad-market"));
    c.push_back(Make("^IXIC", "Nasdaq Composite", EntityType::Index, {"Nasdaq", "IXIC"},
                     {"tech stocks"}, "broad-market"));

    // Commodities
    c.push_back(Make("CL=F", "WTI Crude", EntityType::Commodity, {"WTI", "crude oil", "West Texas"},
                     {"oil", "opec", "barrel", "pipeline"}, "energy", {"OPEC"}));
    c.push_back(Make("BZ=F", "Brent Crude", EntityType::Commodity, {"Brent"},
                     {"oil", "opec", "barrel", "tanker"}, "energy", {"OPEC"}));
    c.push_back(Make("NG=F", "Natural Gas", EntityType::Commodity, {"natural gas", "Henry Hub"},
                     {"lng", "gas pipeline", "nord stream"}, "energy"));
    c.push_back(Make("GC=F", "Gold", EntityType::Commodity, {"Gold", "bullion"},
                     {"safe haven"}, "metals"));

    // Crypto
    c.push_back(Make("BTC-USD", "Bitcoin", EntityType::Crypto, {"Bitcoin", "BTC"},
                     {"crypto", "cryptocurrency"}, "crypto"));

    // Organizations
    c.push_back(Make("OPEC", "OPEC", EntityType::Organization, {"OPEC", "OPEC+"},
                     {"output cut", "oil cartel"}, "energy"));
    c.push_back(Make("NATO", "NATO", EntityType::Organization, {"NATO", "North Atlantic Treaty"},
                     {"alliance", "article 5"}, "defense"));
    c.push_back(Make("FED", "Federal Reserve", EntityType::Organization, {"Federal Reserve", "the Fed", "FOMC"},
                     {"interest rates", "rate cut", "rate hike"}, "monetary"));

    // Monitored countries
    c.push_back(Make("US", "United States", EntityType::Country, {"United States", "USA", "U.S.", "America"},
                     {"washington", "white house", "pentagon", "american"}));
    c.push_back(Make("RU", "Russia", EntityType::Country, {"Russia", "Russian Federation"},
                     {"kremlin", "moscow", "putin", "russian"}, "", {"UA"}));
    c.push_back(Make("CN", "China", EntityType::Country, {"China", "PRC"},
                     {"beijing", "chinese", "xi jinping"}, "", {"TW"}));
    c.push_back(Make("UA", "Ukraine", EntityType::Country, {"Ukraine"},
                     {"kyiv", "kiev", "zelensky", "ukrainian", "donbas"}, "", {"RU"}));
    c.push_back(Make("IR", "Iran", EntityType::Country, {"Iran"},
                     {"tehran", "iranian", "irgc", "khamenei"}));
    c.push_back(Make("IL", "Israel", EntityType::Country, {"Israel"},
                     {"israeli", "idf", "netanyahu", "gaza", "tel aviv"}));
    c.push_back(Make("TW", "Taiwan", EntityType::Country, {"Taiwan"},
                     {"taipei", "taiwanese", "taiwan strait"}, "", {"CN"}));
    c.push_back(Make("KP", "North Korea", EntityType::Country, {"North Korea", "DPRK"},
                     {"pyongyang", "kim jong"}));
    c.push_back(Make("SA", "Saudi Arabia", EntityType::Country, {"Saudi Arabia", "Saudi"},
                     {"riyadh", "aramco"}));
    c.push_back(Make("TR", "Turkey", EntityType::Country, {"Turkey", "Turkiye"},
                     {"ankara", "erdogan", "turkish"}));
    c.push_back(Make("PL", "Poland", EntityType::Country, {"Poland"},
                     {"warsaw", "polish"}));
    c.push_back(Make("DE", "Germany", EntityType::Country, {"Germany"},
                     {"berlin", "german", "bundeswehr"}));
    c.push_back(Make("FR", "France", EntityType::Country, {"France"},
                     {"paris", "french", "macron"}));
    c.push_back(Make("GB", "United Kingdom", EntityType::Country, {"United Kingdom", "Britain", "U.K."},
                     {"london", "british", "downing street"}));
    c.push_back(Make("IN", "India", EntityType::Country, {"India"},
                     {"new delhi", "indian", "modi"}));
    c.push_back(Make("PK", "Pakistan", EntityType::Country, {"Pakistan"},
                     {"islamabad", "pakistani"}));
    c.push_back(Make("SY", "Syria", EntityType::Country, {"Syria"},
                     {"damascus", "syrian", "aleppo"}));
    c.push_back(Make("YE", "Yemen", EntityType::Country, {"Yemen"},
                     {"houthi", "sanaa", "yemeni"}));
    c.push_back(Make("MM", "Myanmar", EntityType::Country, {"Myanmar", "Burma"},
                     {"naypyidaw", "junta", "rohingya"}));
    c.push_back(Make("VE", "Venezuela", EntityType::Country, {"Venezuela"},
                     {"caracas", "maduro", "venezuelan"}));

    return c;
}

} // namespace worldpulse::infrastructure
