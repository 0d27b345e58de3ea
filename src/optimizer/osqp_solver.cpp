/**
 * @file osqp_solver.cpp
 * @brief Implementation of the OSQP solver wrapper
 */

#include "finperf/optimizer/osqp_solver.hpp"
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace finperf
{
    namespace optimizer
    {

        // ============================================================================
        // QuadraticProblem Implementation
        // ============================================================================

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite() || !q.allFinite())
            {
                throw std::invalid_argument("Objective terms contain NaN or Inf");
            }

            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw std::invalid_argument("Equality constraints contain NaN or Inf");
                }
            }

            if (A_ineq.rows() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw std::invalid_argument("A_ineq columns do not match problem dimension");
                }
                if ((b_ineq_lower.size() > 0 && b_ineq_lower.size() != A_ineq.rows()) ||
                    (b_ineq_upper.size() > 0 && b_ineq_upper.size() != A_ineq.rows()))
                {
                    throw std::invalid_argument("Inequality bound sizes do not match A_ineq rows");
                }
                if (!A_ineq.allFinite())
                {
                    throw std::invalid_argument("Inequality constraints contain NaN or Inf");
                }
            }

            if (lower_bounds.size() > 0 && lower_bounds.size() != n)
            {
                throw std::invalid_argument("Lower bounds size does not match problem dimension");
            }
            if (upper_bounds.size() > 0 && upper_bounds.size() != n)
            {
                throw std::invalid_argument("Upper bounds size does not match problem dimension");
            }
        }

        // ============================================================================
        // OSQPSolver Implementation
        // ============================================================================

        OSQPSolver::OSQPSolver()
        {
            options_.max_iterations = 10000;
            options_.tolerance = 1e-8;
        }

        void OSQPSolver::set_options(const SolverOptions &options)
        {
            options.validate();
            options_ = options;
        }

        OSQPCscMatrix OSQPSolver::CscStorage::view(Eigen::Index rows, Eigen::Index cols)
        {
            OSQPCscMatrix matrix;
            matrix.m = static_cast<OSQPInt>(rows);
            matrix.n = static_cast<OSQPInt>(cols);
            matrix.p = indptr.data();
            matrix.i = indices.data();
            matrix.x = values.data();
            matrix.nzmax = static_cast<OSQPInt>(values.size());
            matrix.nz = -1; // compressed column, not triplet
            return matrix;
        }

        OSQPSolver::CscStorage OSQPSolver::to_csc(const Eigen::MatrixXd &dense, bool upper_triangle)
        {
            CscStorage csc;
            csc.indptr.reserve(static_cast<size_t>(dense.cols()) + 1);
            csc.indptr.push_back(0);

            for (Eigen::Index j = 0; j < dense.cols(); ++j)
            {
                const Eigen::Index last_row = upper_triangle ? j + 1 : dense.rows();
                for (Eigen::Index i = 0; i < last_row; ++i)
                {
                    if (std::abs(dense(i, j)) > kDropTolerance)
                    {
                        csc.values.push_back(dense(i, j));
                        csc.indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                csc.indptr.push_back(static_cast<OSQPInt>(csc.values.size()));
            }
            return csc;
        }

        void OSQPSolver::stack_constraints(const QuadraticProblem &problem,
                                           Eigen::MatrixXd &A,
                                           Eigen::VectorXd &l,
                                           Eigen::VectorXd &u)
        {
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = problem.A_eq.rows();
            const Eigen::Index n_ineq = problem.A_ineq.rows();

            A = Eigen::MatrixXd::Zero(n_eq + n_ineq + n, n);
            l.resize(A.rows());
            u.resize(A.rows());

            if (n_eq > 0)
            {
                A.topRows(n_eq) = problem.A_eq;
                l.head(n_eq) = problem.b_eq;
                u.head(n_eq) = problem.b_eq;
            }

            if (n_ineq > 0)
            {
                A.middleRows(n_eq, n_ineq) = problem.A_ineq;
                l.segment(n_eq, n_ineq) = problem.b_ineq_lower.size() > 0
                                              ? problem.b_ineq_lower
                                              : Eigen::VectorXd(Eigen::VectorXd::Constant(n_ineq, -OSQP_INFTY));
                u.segment(n_eq, n_ineq) = problem.b_ineq_upper.size() > 0
                                              ? problem.b_ineq_upper
                                              : Eigen::VectorXd(Eigen::VectorXd::Constant(n_ineq, OSQP_INFTY));
            }

            A.bottomRows(n).setIdentity();
            l.tail(n) = problem.lower_bounds.size() > 0 ? problem.lower_bounds
                                                        : Eigen::VectorXd(Eigen::VectorXd::Constant(n, -OSQP_INFTY));
            u.tail(n) = problem.upper_bounds.size() > 0 ? problem.upper_bounds
                                                        : Eigen::VectorXd(Eigen::VectorXd::Constant(n, OSQP_INFTY));
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            const Eigen::Index n = problem.q.size();

            Eigen::MatrixXd A;
            Eigen::VectorXd l;
            Eigen::VectorXd u;
            stack_constraints(problem, A, l, u);
            const Eigen::Index m = A.rows();

            CscStorage P_storage = to_csc(problem.P, true);
            CscStorage A_storage = to_csc(A, false);
            OSQPCscMatrix P_csc = P_storage.view(n, n);
            OSQPCscMatrix A_csc = A_storage.view(m, n);

            // OSQPFloat is double in the default build; copy so the C API gets mutable buffers
            std::vector<OSQPFloat> q(problem.q.data(), problem.q.data() + n);
            std::vector<OSQPFloat> lower(l.data(), l.data() + m);
            std::vector<OSQPFloat> upper(u.data(), u.data() + m);

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = 1;

            SolverResult result;

            ::OSQPSolver *raw_work = nullptr;
            const OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                                 lower.data(), upper.data(),
                                                 static_cast<OSQPInt>(m), static_cast<OSQPInt>(n), &settings);
            std::unique_ptr<::OSQPSolver, OSQPInt (*)(::OSQPSolver *)> work(raw_work, &osqp_cleanup);

            if (exit_flag != 0 || !work)
            {
                result.status = SolverStatus::FAILED;
                result.message = "OSQP setup failed with code " + std::to_string(exit_flag);
                return result;
            }

            osqp_solve(work.get());

            result.solution = Eigen::Map<const Eigen::VectorXd>(work->solution->x, n);
            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.message = work->info->status;

            const OSQPInt status = work->info->status_val;
            result.success = status == OSQP_SOLVED || status == OSQP_SOLVED_INACCURATE;
            result.status = result.success ? SolverStatus::CONVERGED : SolverStatus::FAILED;

            if (!result.success && options_.verbose)
            {
                std::cerr << "Warning: OSQP finished with status '" << result.message << "'\n";
            }

            return result;
        }

    } // namespace optimizer
} // namespace finperf
