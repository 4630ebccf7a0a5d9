// SPDX-License-Identifier: MIT
/**
 * @file date.hpp
 * @brief Calendar date value type used by the ledger, price and valuation layers.
 *
 * Dates are stored as a day count relative to 1970-01-01 so that day
 * arithmetic and ordering are integer operations.
 */

#ifndef TRACKER_CORE_DATE_HPP
#define TRACKER_CORE_DATE_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace tracker
{
    /**
     * @class Date
     * @brief Proleptic Gregorian calendar date with day resolution.
     */
    class Date
    {
    public:
        /// 1970-01-01
        Date() = default;

        /**
         * @brief Construct from calendar fields.
         * @throws std::invalid_argument if the fields do not name a real day.
         */
        Date(int year, int month, int day);

        /**
         * @brief Parse a YYYY-MM-DD string.
         * @throws std::invalid_argument on malformed input.
         */
        static Date from_string(const std::string &iso);

        /// Date from a day count relative to 1970-01-01.
        static Date from_serial(long serial);

        /// True if the string is shaped like YYYY-MM-DD and names a real day.
        static bool is_valid(const std::string &iso);

        int year() const;
        int month() const;
        int day() const;

        /// Days since 1970-01-01.
        long serial() const { return serial_; }

        /// YYYY-MM-DD
        std::string to_string() const;

        Date add_days(long days) const { return from_serial(serial_ + days); }

        /// Signed number of days from this date to @p other.
        long days_until(const Date &other) const { return other.serial_ - serial_; }

        bool operator==(const Date &o) const { return serial_ == o.serial_; }
        bool operator!=(const Date &o) const { return serial_ != o.serial_; }
        bool operator<(const Date &o) const { return serial_ < o.serial_; }
        bool operator<=(const Date &o) const { return serial_ <= o.serial_; }
        bool operator>(const Date &o) const { return serial_ > o.serial_; }
        bool operator>=(const Date &o) const { return serial_ >= o.serial_; }

    private:
        long serial_ = 0;
    };

    std::ostream &operator<<(std::ostream &os, const Date &date);

    void to_json(nlohmann::json &j, const Date &date);
    void from_json(const nlohmann::json &j, Date &date);

} // namespace tracker

#endif // TRACKER_CORE_DATE_HPP
