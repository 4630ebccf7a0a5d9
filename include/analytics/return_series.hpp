// SPDX-License-Identifier: MIT
/**
 * @file return_series.hpp
 * @brief Builders for the simple-return series fed to risk metrics.
 */

#ifndef TRACKER_ANALYTICS_RETURN_SERIES_HPP
#define TRACKER_ANALYTICS_RETURN_SERIES_HPP

#include <Eigen/Dense>
#include <vector>

namespace tracker
{
    namespace analytics
    {
        /**
         * @brief Day-over-day simple returns of a close series.
         *
         * Produces one return per consecutive pair whose earlier close is
         * positive and both closes are finite; other pairs are skipped.
         */
        Eigen::VectorXd market_returns(const std::vector<double> &prices);

        /**
         * @brief Returns measured from the investor's average cost.
         *
         * The first return compares the first close with @p average_cost, each
         * later one compares with the previous close. Pairs whose reference is
         * not positive are skipped.
         */
        Eigen::VectorXd cost_basis_returns(const std::vector<double> &prices, double average_cost);

    } // namespace analytics
} // namespace tracker

#endif // TRACKER_ANALYTICS_RETURN_SERIES_HPP
