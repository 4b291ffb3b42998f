#include <cstddef>
#include <exception>
#include <latch>
#include <optional>
#include <utility>

namespace math_utils {

    template<typename T>
    void verify_correct_dimension(const matrix<T> &left, const matrix<T> &right) {
        if (left.cols() != right.rows()) {
            throw DimensionMismatch(left.cols(), right.rows());
        }
    }

    template<typename T>
    void verify_not_empty_matrices(const matrix<T> &left, const matrix<T> &right) {
        if (left.cols() == 0 && left.rows() > 0 && right.cols() > 0) {
            throw EmptyOperand(left.cols());
        }
    }

    template<multiplicative_accumulator T>
    void multiply_rows(const matrix<T> &left, const matrix<T> &right,
                       std::uint64_t first_row, std::uint64_t last_row,
                       std::vector<T> &out) {
        auto n = left.cols();
        auto cols = right.cols();
        const auto &a = left.data();
        const auto &b = right.data();

        out.reserve(out.size() + (last_row - first_row) * cols);
        for (std::uint64_t i = first_row; i < last_row; ++i) {
            auto row_offset = i * n;
            for (std::uint64_t j = 0; j < cols; ++j) {
                T sum = a[row_offset] * b[j];
                for (std::uint64_t k = 1; k < n; ++k) {
                    sum += a[row_offset + k] * b[k * cols + j];
                }
                out.push_back(std::move(sum));
            }
        }
    }

    namespace internal {
        template<multiplicative_accumulator T>
        WorkerReport<T> run_worker(std::uint64_t worker_index, const matrix<T> &left, const matrix<T> &right,
                                   std::uint64_t first_row, std::uint64_t last_row) {
            WorkerReport<T> report;
            report.worker_index = worker_index;
            try {
                multiply_rows(left, right, first_row, last_row, report.values);
            } catch (const std::exception &e) {
                report.values.clear();
                report.failed = true;
                report.cause = e.what();
            } catch (...) {
                report.values.clear();
                report.failed = true;
                report.cause = "unknown exception";
            }
            return report;
        }

        template<multiplicative_accumulator T>
        matrix<T> collect_reports(concurrency::Channel<WorkerReport<T>> &reports,
                                  const std::vector<std::uint64_t> &boundaries,
                                  std::uint64_t output_cols) {
            ResultStore<T> store(boundaries, output_cols);
            std::optional<TaskFailure> failure;

            for (std::uint64_t received = 0; received < store.num_workers(); ++received) {
                auto report = reports.read();
                if (!report.ok) {
                    throw InternalSynchronizationError(
                            "received " + std::to_string(received) + " of " +
                            std::to_string(store.num_workers()) + " worker reports");
                }

                auto &r = report.answer;
                if (r.failed) {
                    if (!failure.has_value() || r.worker_index < failure->worker_index()) {
                        failure.emplace(r.worker_index, r.cause);
                    }
                    continue;
                }
                store.put(r.worker_index, std::move(r.values));
            }

            if (failure.has_value()) {
                throw *failure;
            }
            if (reports.pending() != 0) {
                throw InternalSynchronizationError("more worker reports than workers");
            }
            return store.assemble();
        }

        inline std::shared_ptr<concurrency::safelatch> worker_latch(std::uint64_t num_workers, std::uint64_t rows) {
            if (num_workers > static_cast<std::uint64_t>(std::latch::max())) {
                throw InvalidWorkerCount(num_workers, rows);
            }
            return std::make_shared<concurrency::safelatch>(static_cast<std::ptrdiff_t>(num_workers));
        }

        // a thread the OS refuses to start fails the call as that worker.
        inline std::unique_ptr<concurrency::threadpool> start_pool(std::uint64_t num_workers) {
            try {
                return std::make_unique<concurrency::threadpool>(num_workers);
            } catch (const concurrency::SpawnError &e) {
                throw TaskFailure(e.thread_index(), e.what());
            }
        }

        template<multiplicative_accumulator T>
        matrix<T> dispatch_workers(const std::shared_ptr<const matrix<T>> &left_ptr,
                                   const std::shared_ptr<const matrix<T>> &right_ptr,
                                   const std::vector<std::uint64_t> &boundaries) {
            std::uint64_t num_workers = boundaries.size() - 1;

            auto reports = std::make_shared<concurrency::Channel<WorkerReport<T>>>();
            auto latch = worker_latch(num_workers, boundaries.back());

            auto pool = start_pool(num_workers);

            for (std::uint64_t w = 0; w < num_workers; ++w) {
                pool->submit(
                        {
                                .f = [w, first = boundaries[w], last = boundaries[w + 1],
                                        left_ptr, right_ptr, reports]() {
                                    reports->write(run_worker<T>(w, *left_ptr, *right_ptr, first, last));
                                },
                                .wg = latch,
                                .name = "multiply_rows#" + std::to_string(w),
                        }
                );
            }
            latch->wait();
            // joins every worker, after this the channel has no writers left.
            pool.reset();

            if (!latch->done_waiting()) {
                throw InternalSynchronizationError("latch released before every worker counted down");
            }
            reports->close();

            return collect_reports<T>(*reports, boundaries, right_ptr->cols());
        }
    }

    template<multiplicative_accumulator T>
    matrix<T> multiply(const std::shared_ptr<const matrix<T>> &left_ptr,
                       const std::shared_ptr<const matrix<T>> &right_ptr,
                       std::uint64_t num_workers) {
        verify_correct_dimension(*left_ptr, *right_ptr);
        auto boundaries = partition(num_workers, left_ptr->rows());
        verify_not_empty_matrices(*left_ptr, *right_ptr);

        if (num_workers > 1) {
            return internal::dispatch_workers<T>(left_ptr, right_ptr, boundaries);
        }

        auto report = internal::run_worker<T>(0, *left_ptr, *right_ptr, 0, left_ptr->rows());
        if (report.failed) {
            throw TaskFailure(0, report.cause);
        }
        return matrix<T>(left_ptr->rows(), right_ptr->cols(), std::move(report.values));
    }

    template<multiplicative_accumulator T>
    matrix<T> multiply(const matrix<T> &left, const matrix<T> &right, std::uint64_t num_workers) {
        // non-owning handles: every worker is joined before multiply returns.
        std::shared_ptr<const matrix<T>> left_ptr(std::shared_ptr<const matrix<T>>(), &left);
        std::shared_ptr<const matrix<T>> right_ptr(std::shared_ptr<const matrix<T>>(), &right);
        return multiply<T>(left_ptr, right_ptr, num_workers);
    }
}
