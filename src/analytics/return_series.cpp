// SPDX-License-Identifier: MIT
/**
 * @file return_series.cpp
 * @brief Implementation of the return-series builders
 */

#include "analytics/return_series.hpp"

#include <cmath>

namespace tracker
{
    namespace analytics
    {
        namespace
        {
            Eigen::VectorXd returns_from(double reference, const std::vector<double> &prices,
                                         size_t first)
            {
                std::vector<double> out;
                out.reserve(prices.size());

                double prev = reference;
                for (size_t i = first; i < prices.size(); ++i)
                {
                    double price = prices[i];
                    if (std::isfinite(price) && std::isfinite(prev) && prev > 0.0)
                    {
                        out.push_back((price - prev) / prev);
                    }
                    prev = price;
                }

                Eigen::VectorXd result(static_cast<Eigen::Index>(out.size()));
                for (size_t i = 0; i < out.size(); ++i)
                {
                    result(static_cast<Eigen::Index>(i)) = out[i];
                }
                return result;
            }
        } // namespace

        Eigen::VectorXd market_returns(const std::vector<double> &prices)
        {
            if (prices.size() < 2)
            {
                return Eigen::VectorXd();
            }
            return returns_from(prices.front(), prices, 1);
        }

        Eigen::VectorXd cost_basis_returns(const std::vector<double> &prices, double average_cost)
        {
            return returns_from(average_cost, prices, 0);
        }

    } // namespace analytics
} // namespace tracker
