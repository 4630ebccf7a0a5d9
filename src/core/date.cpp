// SPDX-License-Identifier: MIT
/**
 * @file date.cpp
 * @brief Implementation of Date
 */

#include "core/date.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace tracker
{
    namespace
    {
        bool is_leap(int y)
        {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        int days_in_month(int y, int m)
        {
            static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && is_leap(y))
            {
                return 29;
            }
            return lengths[m - 1];
        }

        // Civil calendar <-> day count conversions, era based (400-year cycles)
        long days_from_civil(int y, int m, int d)
        {
            y -= m <= 2 ? 1 : 0;
            const long era = (y >= 0 ? y : y - 399) / 400;
            const long yoe = y - era * 400;
            const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        void civil_from_days(long z, int &y, int &m, int &d)
        {
            z += 719468;
            const long era = (z >= 0 ? z : z - 146096) / 146097;
            const long doe = z - era * 146097;
            const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long mp = (5 * doy + 2) / 153;
            d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
        }

        bool parse_fields(const std::string &iso, int &y, int &m, int &d)
        {
            if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-')
            {
                return false;
            }
            for (size_t i = 0; i < iso.size(); ++i)
            {
                if (i == 4 || i == 7)
                {
                    continue;
                }
                if (!std::isdigit(static_cast<unsigned char>(iso[i])))
                {
                    return false;
                }
            }
            y = std::stoi(iso.substr(0, 4));
            m = std::stoi(iso.substr(5, 2));
            d = std::stoi(iso.substr(8, 2));
            return m >= 1 && m <= 12 && d >= 1 && d <= days_in_month(y, m);
        }
    } // namespace

    Date::Date(int year, int month, int day)
    {
        if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
        {
            throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                        std::to_string(month) + "-" + std::to_string(day));
        }
        serial_ = days_from_civil(year, month, day);
    }

    Date Date::from_string(const std::string &iso)
    {
        int y = 0, m = 0, d = 0;
        if (!parse_fields(iso, y, m, d))
        {
            throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): '" + iso + "'");
        }
        return Date(y, m, d);
    }

    Date Date::from_serial(long serial)
    {
        Date date;
        date.serial_ = serial;
        return date;
    }

    bool Date::is_valid(const std::string &iso)
    {
        int y = 0, m = 0, d = 0;
        return parse_fields(iso, y, m, d);
    }

    int Date::year() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        return y;
    }

    int Date::month() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        return m;
    }

    int Date::day() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        return d;
    }

    std::string Date::to_string() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
        return buf;
    }

    std::ostream &operator<<(std::ostream &os, const Date &date)
    {
        return os << date.to_string();
    }

    void to_json(nlohmann::json &j, const Date &date)
    {
        j = date.to_string();
    }

    void from_json(const nlohmann::json &j, Date &date)
    {
        date = Date::from_string(j.get<std::string>());
    }

} // namespace tracker
