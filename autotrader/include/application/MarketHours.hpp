#pragma once

#include "domain/enums/Market.hpp"

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace autotrader::application {

/**
 * @brief Торговые сессии рынков (без учёта праздников)
 *
 * US: 09:30-16:00 America/New_York
 * UK: 08:00-16:30 Europe/London
 * Выходные закрыты. Границы сессии включаются.
 *
 * Переход на летнее время задаётся POSIX-правилами Boost.DateTime:
 * US - второе воскресенье марта / первое воскресенье ноября,
 * UK - последнее воскресенье марта / последнее воскресенье октября.
 */
class MarketHours {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct Status {
        bool open = false;
        std::string reason;
        double minutesToClose = 0.0;   ///< отрицательно после закрытия
    };

    static Status status(domain::Market market, TimePoint now) {
        const Session session = sessionFor(market);
        auto local = toLocal(now, session);

        Status st;
        auto closeAt = boost::posix_time::ptime(local.date(), session.close);
        st.minutesToClose = (closeAt - local).total_seconds() / 60.0;

        int weekday = local.date().day_of_week().as_number();   // 0 = воскресенье
        if (weekday == 0 || weekday == 6) {
            st.reason = domain::toString(market) + " market closed (weekend)";
            return st;
        }

        auto tod = local.time_of_day();
        st.open = tod >= session.open && tod <= session.close;
        if (!st.open) {
            st.reason = domain::toString(market) + " market closed (outside " + session.label + ")";
        } else {
            st.reason = domain::toString(market) + " market open";
        }
        return st;
    }

    static bool isOpen(domain::Market market, TimePoint now) {
        return status(market, now).open;
    }

    /**
     * @brief До закрытия осталось от 0 до minutesBeforeClose минут
     *
     * false при minutesBeforeClose <= 0 и в выходные.
     */
    static bool isNearClose(domain::Market market, TimePoint now, int minutesBeforeClose) {
        if (minutesBeforeClose <= 0) {
            return false;
        }
        auto local = toLocal(now, sessionFor(market));
        int weekday = local.date().day_of_week().as_number();
        if (weekday == 0 || weekday == 6) {
            return false;
        }
        double delta = status(market, now).minutesToClose;
        return delta >= 0.0 && delta <= minutesBeforeClose;
    }

    static bool anyOpen(const std::vector<domain::Market>& markets, TimePoint now) {
        for (auto m : markets) {
            if (isOpen(m, now)) return true;
        }
        return false;
    }

    /**
     * @brief Рынок по бирже/валюте контракта (LSE или GBP -> UK)
     */
    static domain::Market marketOf(const std::string& exchange, const std::string& currency) {
        if (currency == "GBP" || exchange == "LSE") return domain::Market::UK;
        return domain::Market::US;
    }

private:
    struct Session {
        const char* posixTz;
        boost::posix_time::time_duration open;
        boost::posix_time::time_duration close;
        std::string label;
    };

    static Session sessionFor(domain::Market market) {
        using boost::posix_time::hours;
        using boost::posix_time::minutes;
        if (market == domain::Market::UK) {
            return {"GMT+00BST+01,M3.5.0/01:00,M10.5.0/02:00",
                    hours(8), hours(16) + minutes(30),
                    "08:00-16:30 Europe/London"};
        }
        return {"EST-05EDT+01,M3.2.0/02:00,M11.1.0/02:00",
                hours(9) + minutes(30), hours(16),
                "09:30-16:00 America/New_York"};
    }

    static boost::posix_time::ptime toLocal(TimePoint now, const Session& session) {
        boost::local_time::time_zone_ptr tz(
            new boost::local_time::posix_time_zone(session.posixTz));
        auto utc = boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(now));
        boost::local_time::local_date_time ldt(utc, tz);
        return ldt.local_time();
    }
};

} // namespace autotrader::application
