/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library for the convex sub-problems that appear around the
 * descent optimizer: projecting weights onto categorical constraints and
 * tracing the minimum-variance frontier.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq                        (equality constraints)
 *                b_ineq_lower <= A_ineq x <= b_ineq_upper
 *                lower_bounds <= x <= upper_bounds    (box constraints)
 */

#pragma once

#include "finperf/optimizer/gradient_descent.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace finperf
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Dense quadratic programming problem specification
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric PSD
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::MatrixXd A_ineq;       ///< Two-sided inequality constraint matrix
            Eigen::VectorXd b_ineq_lower; ///< Lower bounds for A_ineq * x
            Eigen::VectorXd b_ineq_upper; ///< Upper bounds for A_ineq * x

            Eigen::VectorXd lower_bounds; ///< Lower bounds on x
            Eigen::VectorXd upper_bounds; ///< Upper bounds on x

            QuadraticProblem() = default;

            /**
             * @brief Validate problem specification
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using the OSQP library
         *
         * Usage Example:
         * @code
         * QuadraticProblem problem;
         * problem.P = 2.0 * Eigen::MatrixXd::Identity(n, n);
         * problem.q = -2.0 * target;
         * problem.A_eq = Eigen::MatrixXd::Ones(1, n);
         * problem.b_eq = Eigen::VectorXd::Ones(1);
         * problem.lower_bounds = Eigen::VectorXd::Zero(n);
         * problem.upper_bounds = Eigen::VectorXd::Ones(n);
         *
         * OSQPSolver solver;
         * SolverResult result = solver.solve(problem);
         * @endcode
         */
        class OSQPSolver
        {
        public:
            OSQPSolver();

            ~OSQPSolver() = default;

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

            /**
             * @brief Solve a quadratic programming problem
             * @return Solution with status, iterations and objective value;
             *         success is false when OSQP reports anything other than
             *         solved / solved inaccurate
             * @throws std::invalid_argument if the problem is ill-formed
             */
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_; ///< Solver configuration

            static constexpr double kDropTolerance = 1e-14; ///< Entries below this are structural zeros

            /**
             * @brief Owning buffers behind an OSQPCscMatrix
             */
            struct CscStorage
            {
                std::vector<OSQPFloat> values;
                std::vector<OSQPInt> indices;
                std::vector<OSQPInt> indptr;

                /// Non-owning view; valid while this storage is alive and unmodified
                OSQPCscMatrix view(Eigen::Index rows, Eigen::Index cols);
            };

            /**
             * @param upper_triangle Keep only the upper triangle (OSQP expects this for P)
             */
            static CscStorage to_csc(const Eigen::MatrixXd &dense, bool upper_triangle);

            /**
             * @brief Stack equality, inequality and box rows into one constraint block
             *
             *   A = [A_eq; A_ineq; I]
             *   l = [b_eq; b_ineq_lower; lb]
             *   u = [b_eq; b_ineq_upper; ub]
             *
             * Missing inequality or box bounds become -/+OSQP_INFTY.
             */
            static void stack_constraints(const QuadraticProblem &problem,
                                          Eigen::MatrixXd &A,
                                          Eigen::VectorXd &l,
                                          Eigen::VectorXd &u);
        };

    } // namespace optimizer
} // namespace finperf
