#pragma once

#include "domain/Candidate.hpp"
#include "domain/ScannerQuery.hpp"
#include "domain/TradingConfig.hpp"
#include "ports/output/IBrokerGateway.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Вселенная кандидатов на цикл
 *
 * Порядок: сначала ручной include_symbols ("SYM" или "SYM,US|UK"),
 * затем сканеры брокера по каждому коду и рынку. Дубликаты по символу
 * отбрасываются, результат обрезается до max_candidates.
 * Упавший скан логируется и пропускается.
 */
class MarketScreener {
public:
    explicit MarketScreener(std::shared_ptr<ports::output::IBrokerGateway> broker)
        : broker_(std::move(broker))
    {}

    std::vector<domain::Candidate> candidates(const domain::TradingSection& cfg) {
        if (cfg.markets.empty()) {
            std::cerr << "[MarketScreener] No markets configured; skipping scanner cycle" << std::endl;
            return {};
        }

        const auto& sc = cfg.screener;
        int maxCandidates = sc.maxCandidates > 0 ? sc.maxCandidates : 250;

        std::set<std::string> excluded;
        for (const auto& raw : sc.excludeSymbols) {
            std::string sym = upper(trim(raw.substr(0, raw.find(','))));
            if (!sym.empty()) excluded.insert(sym);
        }

        std::vector<domain::Candidate> all;

        for (const auto& entry : sc.includeSymbols) {
            auto resolved = resolveManual(entry, cfg.markets);
            if (!resolved) continue;
            const auto& [symbol, market] = *resolved;
            if (excluded.count(symbol) > 0) continue;
            if (std::find(cfg.markets.begin(), cfg.markets.end(), market) == cfg.markets.end()) {
                std::cerr << "[MarketScreener] include_symbols entry '" << entry << "' ignored (market "
                          << domain::toString(market) << " not enabled)" << std::endl;
                continue;
            }
            domain::Candidate c;
            c.contract = domain::Contract(symbol, domain::exchangeFor(market), domain::currencyFor(market));
            c.source = "Manual";
            all.push_back(c);
        }

        for (auto market : {domain::Market::US, domain::Market::UK}) {
            if (std::find(cfg.markets.begin(), cfg.markets.end(), market) == cfg.markets.end()) {
                continue;
            }
            for (const auto& code : sc.scanCodes) {
                domain::ScannerQuery query;
                query.scanCode = code;
                query.locationCode = market == domain::Market::US ? "STK.US.MAJOR" : "STK.LSE";
                query.belowPrice = cfg.maxSharePrice;
                query.abovePrice = cfg.minSharePrice;
                query.aboveVolume = static_cast<double>(cfg.minAvgVolume);

                std::cout << "[MarketScreener] Scanning " << domain::toString(market) << " ("
                          << label(code) << ") " << cfg.minSharePrice << "-" << cfg.maxSharePrice
                          << ", vol>" << cfg.minAvgVolume << std::endl;

                std::vector<domain::Contract> rows;
                try {
                    rows = broker_->scan(query);
                } catch (const domain::BrokerError& e) {
                    std::cerr << "[MarketScreener] " << domain::toString(market) << " scan "
                              << code << " failed: " << e.what() << std::endl;
                    continue;
                }

                for (const auto& row : rows) {
                    std::string sym = upper(row.symbol);
                    if (excluded.count(sym) > 0) continue;
                    if (market == domain::Market::US && cfg.excludeMicrocap && row.tradingClass == "SCM") {
                        continue;
                    }
                    domain::Candidate c;
                    c.contract = domain::Contract(row.symbol, domain::exchangeFor(market), domain::currencyFor(market));
                    c.contract.tradingClass = row.tradingClass;
                    c.source = label(code);
                    all.push_back(c);
                }
            }
        }

        std::vector<domain::Candidate> unique;
        std::set<std::string> seen;
        for (const auto& c : all) {
            if (seen.insert(c.contract.symbol).second) {
                unique.push_back(c);
            }
        }
        std::cout << "[MarketScreener] Found " << unique.size() << " unique candidates" << std::endl;

        if (static_cast<int>(unique.size()) > maxCandidates) {
            unique.resize(static_cast<size_t>(maxCandidates));
        }
        return unique;
    }

    /**
     * @brief Подмешать символы из соцсетей в начало списка (до 50, без дублей)
     */
    static std::vector<domain::Candidate> mergeSocial(const std::vector<std::string>& symbols,
                                                      std::vector<domain::Candidate> base) {
        std::vector<domain::Candidate> merged;
        std::set<std::string> seen;
        for (const auto& raw : symbols) {
            if (merged.size() >= 50) break;
            std::string sym = upper(trim(raw));
            if (sym.empty() || !seen.insert(sym).second) continue;
            domain::Candidate c;
            c.contract = domain::Contract(sym, "SMART", "USD");
            c.source = "reddit";
            merged.push_back(c);
        }
        for (auto& c : base) {
            if (seen.insert(c.contract.symbol).second) {
                merged.push_back(std::move(c));
            }
        }
        return merged;
    }

    static std::string label(const std::string& code) {
        if (code == "MOST_ACTIVE") return "Most Active";
        if (code == "TOP_PERC_GAIN") return "Top Gainers";
        if (code == "HOT_BY_VOLUME") return "High Volume";
        if (code == "HIGH_VS_13W_HI") return "Near 13-Week High";
        return code;
    }

private:
    std::shared_ptr<ports::output::IBrokerGateway> broker_;

    static std::optional<std::pair<std::string, domain::Market>> resolveManual(
        const std::string& entry, const std::vector<domain::Market>& markets) {
        std::string raw = trim(entry);
        if (raw.empty()) return std::nullopt;

        auto comma = raw.find(',');
        if (comma != std::string::npos) {
            std::string sym = upper(trim(raw.substr(0, comma)));
            auto market = domain::parseMarket(upper(trim(raw.substr(comma + 1))));
            if (sym.empty() || !market) return std::nullopt;
            return std::make_pair(sym, *market);
        }

        // Один рынок - он; иначе US, если включён
        domain::Market market = markets.front();
        if (markets.size() > 1 &&
            std::find(markets.begin(), markets.end(), domain::Market::US) != markets.end()) {
            market = domain::Market::US;
        }
        return std::make_pair(upper(raw), market);
    }

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    static std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }
};

} // namespace autotrader::application
