/**
 * @file statistics.cpp
 * @brief Implementation of statistical primitives
 */

#include "finperf/analytics/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>
#include <stdexcept>
#include <string>

namespace finperf
{
    namespace analytics
    {

        namespace
        {
            constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

            void require_same_length(const Eigen::VectorXd &a, const Eigen::VectorXd &b,
                                     const std::string &context)
            {
                if (a.size() != b.size())
                {
                    throw std::invalid_argument(context + ": series lengths differ (" +
                                                std::to_string(a.size()) + " vs " +
                                                std::to_string(b.size()) + ")");
                }
            }

            void require_table(const Eigen::MatrixXd &table)
            {
                if (table.rows() == 0 || table.cols() == 0)
                {
                    throw std::invalid_argument("Return table is empty");
                }
            }
        } // namespace

        nlohmann::json FrontierPoint::to_json() const
        {
            return nlohmann::json::array({expected_return, volatility});
        }

        // ============================================================================
        // Univariate statistics
        // ============================================================================

        double mean(const Eigen::VectorXd &series)
        {
            if (series.size() == 0)
            {
                return kNaN;
            }
            return series.mean();
        }

        double population_std_dev(const Eigen::VectorXd &series)
        {
            if (series.size() == 0)
            {
                return kNaN;
            }
            const double mu = series.mean();
            const double variance = (series.array() - mu).square().sum() / static_cast<double>(series.size());
            return std::sqrt(variance);
        }

        double downside_deviation(const Eigen::VectorXd &series)
        {
            std::vector<double> downside;
            for (Eigen::Index i = 0; i < series.size(); ++i)
            {
                if (series(i) <= 0.0)
                {
                    downside.push_back(series(i));
                }
            }
            const Eigen::VectorXd downside_series =
                Eigen::Map<const Eigen::VectorXd>(downside.data(), static_cast<Eigen::Index>(downside.size()));
            return population_std_dev(downside_series);
        }

        RegressionResult ols_regression(const Eigen::VectorXd &x, const Eigen::VectorXd &y)
        {
            require_same_length(x, y, "ols_regression");
            if (x.size() == 0)
            {
                throw std::invalid_argument("ols_regression: empty series");
            }

            const double n = static_cast<double>(x.size());
            const double mean_x = x.mean();
            const double mean_y = y.mean();

            const Eigen::ArrayXd dx = x.array() - mean_x;
            const Eigen::ArrayXd dy = y.array() - mean_y;

            const double var_x = dx.square().sum() / n;
            const double cov_xy = (dx * dy).sum() / n;

            RegressionResult result;
            result.beta = cov_xy / var_x;
            result.alpha = mean_y - result.beta * mean_x;
            return result;
        }

        DrawdownResult maximum_drawdown(const Eigen::VectorXd &series)
        {
            DrawdownResult result;
            result.max_drawdown = 0.0;

            if (series.size() == 0)
            {
                return result;
            }

            result.rolling_drawdowns.reserve(series.size());

            double cumulative_sum = 0.0;
            double running_max = series(0);

            for (Eigen::Index i = 0; i < series.size(); ++i)
            {
                cumulative_sum += series(i);
                running_max = std::max(running_max, cumulative_sum);

                const double drawdown = running_max - cumulative_sum;
                result.rolling_drawdowns.push_back(-drawdown);
                if (drawdown > result.max_drawdown)
                {
                    result.max_drawdown = drawdown;
                }
            }

            return result;
        }

        double value_at_risk(const Eigen::VectorXd &series, double confidence_level)
        {
            if (series.size() == 0)
            {
                throw std::invalid_argument("value_at_risk: empty series");
            }
            if (!(confidence_level >= 0.0 && confidence_level <= 1.0))
            {
                throw std::invalid_argument("value_at_risk: confidence level must be in [0, 1], got " +
                                            std::to_string(confidence_level));
            }

            std::vector<double> sorted(series.data(), series.data() + series.size());
            std::sort(sorted.begin(), sorted.end());

            const auto index = static_cast<std::size_t>(
                std::floor((1.0 - confidence_level) * static_cast<double>(sorted.size() - 1)));
            return sorted[std::min(index, sorted.size() - 1)];
        }

        double expected_shortfall(const Eigen::VectorXd &series, double confidence_level)
        {
            const double var = value_at_risk(series, confidence_level);

            double tail_sum = 0.0;
            int tail_count = 0;
            for (Eigen::Index i = 0; i < series.size(); ++i)
            {
                if (series(i) < var)
                {
                    tail_sum += series(i);
                    ++tail_count;
                }
            }

            if (tail_count == 0)
            {
                return kNaN;
            }
            return tail_sum / static_cast<double>(tail_count);
        }

        double cumulative_return(const Eigen::VectorXd &series)
        {
            const double growth = (1.0 + series.array() / 100.0).prod();
            return (growth - 1.0) * 100.0;
        }

        std::vector<double> cumulative_returns_list(const Eigen::VectorXd &series)
        {
            std::vector<double> cumulative;
            cumulative.reserve(series.size());

            double growth = 1.0;
            for (Eigen::Index i = 0; i < series.size(); ++i)
            {
                growth *= 1.0 + series(i) / 100.0;
                cumulative.push_back(growth - 1.0);
            }
            return cumulative;
        }

        std::vector<double> linear_interpolation(std::vector<double> values)
        {
            const std::size_t len = values.size();

            for (std::size_t i = 0; i < len; ++i)
            {
                if (values[i] != 0.0)
                {
                    continue;
                }

                std::size_t left = i;
                std::size_t right = i;
                while (left > 0 && values[left] == 0.0)
                {
                    --left;
                }
                while (right < len - 1 && values[right] == 0.0)
                {
                    ++right;
                }

                const double left_value = values[left];
                const double right_value = values[right];

                if (left_value != 0.0 && right_value != 0.0)
                {
                    const double ratio = static_cast<double>(i - left) / static_cast<double>(right - left);
                    values[i] = left_value + (right_value - left_value) * ratio;
                }
                else if (left_value != 0.0)
                {
                    values[i] = left_value;
                }
                else if (right_value != 0.0)
                {
                    values[i] = right_value;
                }
            }

            return values;
        }

        // ============================================================================
        // Multivariate statistics
        // ============================================================================

        Eigen::MatrixXd covariance_matrix(const Eigen::MatrixXd &table)
        {
            require_table(table);

            const Eigen::RowVectorXd means = table.colwise().mean();
            const Eigen::MatrixXd centered = table.rowwise() - means;

            Eigen::MatrixXd covariance = centered.transpose() * centered;
            covariance /= static_cast<double>(table.rows());

            // Exact symmetry
            return 0.5 * (covariance + covariance.transpose());
        }

        Eigen::MatrixXd correlation_matrix(const Eigen::MatrixXd &table)
        {
            const Eigen::MatrixXd covariance = covariance_matrix(table);
            const Eigen::Index n = covariance.rows();
            const Eigen::VectorXd std_devs = covariance.diagonal().array().sqrt();

            Eigen::MatrixXd correlation = Eigen::MatrixXd::Zero(n, n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    if (std_devs(i) == 0.0 || std_devs(j) == 0.0)
                    {
                        continue;
                    }
                    if (i == j)
                    {
                        correlation(i, j) = 1.0;
                        continue;
                    }
                    const double rho = covariance(i, j) / (std_devs(i) * std_devs(j));
                    correlation(i, j) = std::max(-1.0, std::min(1.0, rho));
                }
            }

            return correlation;
        }

        Eigen::VectorXd mean_returns(const Eigen::MatrixXd &table)
        {
            require_table(table);
            return table.colwise().mean().transpose();
        }

        // ============================================================================
        // Portfolio aggregation
        // ============================================================================

        Eigen::VectorXd daily_portfolio_returns(const Eigen::VectorXd &weights,
                                                const Eigen::MatrixXd &table)
        {
            if (weights.size() != table.cols())
            {
                throw std::invalid_argument("daily_portfolio_returns: " + std::to_string(weights.size()) +
                                            " weights for " + std::to_string(table.cols()) + " columns");
            }
            return table * weights;
        }

        double mean_portfolio_return(const Eigen::VectorXd &weights,
                                     const Eigen::VectorXd &mean_returns)
        {
            require_same_length(weights, mean_returns, "mean_portfolio_return");
            return weights.dot(mean_returns);
        }

        double portfolio_std_dev(const Eigen::VectorXd &weights,
                                 const Eigen::MatrixXd &covariance)
        {
            if (covariance.rows() != weights.size() || covariance.cols() != weights.size())
            {
                throw std::invalid_argument("portfolio_std_dev: covariance is " +
                                            std::to_string(covariance.rows()) + "x" +
                                            std::to_string(covariance.cols()) + " for " +
                                            std::to_string(weights.size()) + " weights");
            }
            const double variance = weights.dot(covariance * weights);
            if (std::isnan(variance))
            {
                return kNaN;
            }
            return std::sqrt(std::max(variance, 0.0));
        }

        double portfolio_downside_dev(const Eigen::VectorXd &weights,
                                      const Eigen::MatrixXd &table)
        {
            const Eigen::VectorXd returns = daily_portfolio_returns(weights, table);
            if (returns.size() == 0)
            {
                return 0.0;
            }
            const double sum_sq = returns.array().min(0.0).square().sum();
            return std::sqrt(sum_sq / static_cast<double>(returns.size()));
        }

        // ============================================================================
        // Frontier extraction
        // ============================================================================

        std::vector<FrontierPoint> efficient_frontier_points(const std::vector<FrontierPoint> &points)
        {
            std::vector<FrontierPoint> candidates;
            candidates.reserve(points.size());
            std::set<std::pair<double, double>> seen;

            for (const auto &point : points)
            {
                if (!std::isfinite(point.expected_return) || !std::isfinite(point.volatility) ||
                    point.volatility <= 0.0)
                {
                    continue;
                }
                if (!seen.emplace(point.expected_return, point.volatility).second)
                {
                    continue;
                }
                candidates.push_back(point);
            }

            if (candidates.empty())
            {
                return candidates;
            }

            auto min_risk = candidates.begin();
            for (auto it = candidates.begin(); it != candidates.end(); ++it)
            {
                if (it->volatility < min_risk->volatility)
                {
                    min_risk = it;
                }
            }
            const double threshold = min_risk->expected_return / min_risk->volatility;

            std::vector<FrontierPoint> frontier;
            for (const auto &point : candidates)
            {
                if (point.expected_return / point.volatility >= threshold)
                {
                    frontier.push_back(point);
                }
            }
            return frontier;
        }

    } // namespace analytics
} // namespace finperf
