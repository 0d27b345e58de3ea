/**
 * @file gradient_descent.cpp
 * @brief Implementation of the numerical-gradient descent minimizer
 */

#include "finperf/optimizer/gradient_descent.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace finperf
{
    namespace optimizer
    {

        // ============================================================================
        // SolverOptions Implementation
        // ============================================================================

        void SolverOptions::validate() const
        {
            if (max_iterations <= 0)
            {
                throw std::invalid_argument("max_iterations must be positive, got " +
                                            std::to_string(max_iterations));
            }
            if (!(tolerance > 0.0))
            {
                throw std::invalid_argument("tolerance must be positive");
            }
            if (!(step_size > 0.0) || !(gradient_step > 0.0) || !(min_step > 0.0))
            {
                throw std::invalid_argument("step sizes must be positive");
            }
            if (min_step > step_size)
            {
                throw std::invalid_argument("min_step must not exceed step_size");
            }
        }

        nlohmann::json SolverOptions::to_json() const
        {
            return nlohmann::json{
                {"max_iterations", max_iterations},
                {"tolerance", tolerance},
                {"step_size", step_size},
                {"gradient_step", gradient_step},
                {"min_step", min_step},
                {"verbose", verbose}};
        }

        SolverOptions SolverOptions::from_json(const nlohmann::json &j)
        {
            SolverOptions options;
            options.max_iterations = j.value("max_iterations", 1000);
            options.tolerance = j.value("tolerance", 1e-6);
            options.step_size = j.value("step_size", 0.1);
            options.gradient_step = j.value("gradient_step", 1e-6);
            options.min_step = j.value("min_step", 1e-10);
            options.verbose = j.value("verbose", false);
            options.validate();
            return options;
        }

        std::string status_to_string(SolverStatus status)
        {
            switch (status)
            {
            case SolverStatus::CONVERGED:
                return "converged";
            case SolverStatus::STALLED:
                return "stalled";
            case SolverStatus::MAX_ITERATIONS_REACHED:
                return "max_iterations_reached";
            case SolverStatus::FAILED:
                return "failed";
            }
            return "unknown";
        }

        // ============================================================================
        // SolverResult Implementation
        // ============================================================================

        SolverResult::SolverResult()
            : objective_value(0.0),
              success(false),
              iterations(0),
              evaluations(0),
              status(SolverStatus::FAILED)
        {
        }

        // ============================================================================
        // GradientDescent Implementation
        // ============================================================================

        GradientDescent::GradientDescent(const SolverOptions &options)
            : options_(options)
        {
            options_.validate();
        }

        void GradientDescent::set_options(const SolverOptions &options)
        {
            options.validate();
            options_ = options;
        }

        SolverResult GradientDescent::minimize(const Objective &f, const Eigen::VectorXd &x0) const
        {
            if (x0.size() == 0)
            {
                throw std::invalid_argument("Initial point is empty");
            }

            SolverResult result;
            Eigen::VectorXd x = x0;
            double fx = f(x);
            int evaluations = 1;

            if (options_.verbose)
            {
                std::cout << "Starting gradient descent with " << x.size() << " variables, f = " << fx << "\n";
            }

            result.status = SolverStatus::MAX_ITERATIONS_REACHED;
            result.message = "Maximum iterations reached";
            result.iterations = options_.max_iterations;

            for (int iter = 0; iter < options_.max_iterations; ++iter)
            {
                Eigen::VectorXd gradient = compute_gradient(f, x, evaluations);

                if (!gradient.allFinite())
                {
                    result.status = SolverStatus::STALLED;
                    result.message = "Non-finite gradient";
                    result.iterations = iter;
                    break;
                }

                if (gradient.norm() < options_.tolerance)
                {
                    result.status = SolverStatus::CONVERGED;
                    result.message = "Converged";
                    result.iterations = iter;
                    break;
                }

                double step = line_search(f, x, fx, gradient, evaluations);
                if (step == 0.0)
                {
                    result.status = SolverStatus::STALLED;
                    result.message = "No descent step found";
                    result.iterations = iter;
                    break;
                }

                x = x - step * gradient;
                double f_new = f(x);
                ++evaluations;

                if (options_.verbose && iter % 100 == 0)
                {
                    std::cout << "Iter " << iter << ": f = " << f_new << ", |g| = " << gradient.norm() << "\n";
                }

                // Lack of progress
                if (std::abs(fx - f_new) < options_.tolerance * 1e-2)
                {
                    fx = f_new;
                    result.status = SolverStatus::CONVERGED;
                    result.message = "Converged (no progress)";
                    result.iterations = iter + 1;
                    break;
                }

                fx = f_new;
            }

            result.solution = x;
            result.objective_value = fx;
            result.evaluations = evaluations;
            result.success = result.status == SolverStatus::CONVERGED ||
                             result.status == SolverStatus::STALLED;

            if (options_.verbose)
            {
                std::cout << "Gradient descent finished: " << result.message
                          << " after " << result.iterations << " iterations, f = " << fx << "\n";
            }

            return result;
        }

        Eigen::VectorXd GradientDescent::compute_gradient(const Objective &f,
                                                          const Eigen::VectorXd &x,
                                                          int &evaluations) const
        {
            const double h = options_.gradient_step;
            Eigen::VectorXd gradient(x.size());
            Eigen::VectorXd probe = x;

            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                probe(i) = x(i) + h;
                const double forward = f(probe);
                probe(i) = x(i) - h;
                const double backward = f(probe);
                probe(i) = x(i);

                gradient(i) = (forward - backward) / (2.0 * h);
                evaluations += 2;
            }

            return gradient;
        }

        double GradientDescent::line_search(const Objective &f,
                                            const Eigen::VectorXd &x,
                                            double fx,
                                            const Eigen::VectorXd &gradient,
                                            int &evaluations) const
        {
            constexpr double kArmijo = 1e-4;
            const double slope = gradient.squaredNorm();

            for (double t = options_.step_size; t >= options_.min_step; t *= 0.5)
            {
                const double candidate = f(x - t * gradient);
                ++evaluations;
                if (candidate <= fx - kArmijo * t * slope)
                {
                    return t;
                }
            }
            return 0.0;
        }

    } // namespace optimizer
} // namespace finperf
