/**
 * @file gradient_descent.hpp
 * @brief Numerical-gradient descent minimizer
 *
 * Minimizes an arbitrary scalar function of a vector without analytic
 * derivatives:
 *
 *   g_i = (f(x + h e_i) - f(x - h e_i)) / 2h
 *   x  <- x - t g,  t chosen by backtracking from step_size
 *
 * A step is accepted when it gives sufficient decrease
 * f(x - t g) <= f(x) - 1e-4 t |g|^2. NaN losses never satisfy that test, so
 * a NaN region stops the search instead of corrupting the iterate.
 *
 * Thread Safety: minimize() is const and safe to call concurrently as long as
 * the objective is.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace finperf
{
    namespace optimizer
    {

        /**
         * @struct SolverOptions
         * @brief Options shared by the descent and QP solvers
         */
        struct SolverOptions
        {
            int max_iterations = 1000;   ///< Maximum iterations
            double tolerance = 1e-6;     ///< Gradient-norm convergence tolerance
            double step_size = 0.1;      ///< Initial line-search step
            double gradient_step = 1e-6; ///< Finite-difference step h
            double min_step = 1e-10;     ///< Smallest step tried before giving up
            bool verbose = false;        ///< Print progress

            SolverOptions() = default;

            /**
             * @throws std::invalid_argument if any option is out of range
             */
            void validate() const;

            nlohmann::json to_json() const;
            static SolverOptions from_json(const nlohmann::json &j);
        };

        /**
         * @enum SolverStatus
         * @brief Terminal state of a solve
         */
        enum class SolverStatus
        {
            CONVERGED,              ///< Gradient norm or progress below tolerance
            STALLED,                ///< No descent step found (kink, NaN region or flat)
            MAX_ITERATIONS_REACHED, ///< Iteration cap hit
            FAILED                  ///< Solver error (setup failure, infeasible, ...)
        };

        std::string status_to_string(SolverStatus status);

        /**
         * @struct SolverResult
         * @brief Result from a solver
         */
        struct SolverResult
        {
            Eigen::VectorXd solution; ///< Final iterate
            double objective_value;   ///< Loss at solution
            bool success;             ///< CONVERGED or STALLED
            int iterations;           ///< Iterations performed
            int evaluations;          ///< Objective evaluations
            SolverStatus status;      ///< Terminal state
            std::string message;      ///< Status message

            SolverResult();
        };

        /**
         * @class GradientDescent
         * @brief Central-difference gradient descent with backtracking line search
         *
         * Usage Example:
         * @code
         * GradientDescent solver;
         * auto result = solver.minimize(
         *     [](const Eigen::VectorXd &x) { return x.squaredNorm(); },
         *     Eigen::VectorXd::Ones(3));
         * @endcode
         */
        class GradientDescent
        {
        public:
            using Objective = std::function<double(const Eigen::VectorXd &)>;

            explicit GradientDescent(const SolverOptions &options = SolverOptions());

            ~GradientDescent() = default;

            /**
             * @brief Minimize f starting from x0
             *
             * Never throws for numerical reasons; inspect result.status.
             *
             * @throws std::invalid_argument if x0 is empty
             */
            SolverResult minimize(const Objective &f, const Eigen::VectorXd &x0) const;

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

        private:
            SolverOptions options_; ///< Solver configuration

            /**
             * @brief Central-difference gradient at x
             */
            Eigen::VectorXd compute_gradient(const Objective &f,
                                             const Eigen::VectorXd &x,
                                             int &evaluations) const;

            /**
             * @brief Backtracking step length, 0 when no acceptable step exists
             */
            double line_search(const Objective &f,
                               const Eigen::VectorXd &x,
                               double fx,
                               const Eigen::VectorXd &gradient,
                               int &evaluations) const;
        };

    } // namespace optimizer
} // namespace finperf
