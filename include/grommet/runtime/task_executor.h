//
// Worker pool that drives query execution. Requests, sibling fields and subscription pulls all run here; the
// host thread only ever submits work and receives results.
//

#ifndef GROMMET_RUNTIME_TASK_EXECUTOR_H
#define GROMMET_RUNTIME_TASK_EXECUTOR_H

#include <grommet/grommet_export.h>
#include <grommet/grommet_forward_declarations.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace grommet {
    struct GROMMET_EXPORT RuntimeConfig {
        // One dedicated executor thread instead of a pool.
        bool use_current_thread{false};
        // Pool size; defaults to the hardware concurrency.
        std::optional<size_t> worker_threads;

        /**
         * @throws RuntimeThreadsConflict when use_current_thread is combined with worker_threads
         * @throws ValidationError when worker_threads is zero
         */
        void validate() const;

        [[nodiscard]] size_t thread_count() const;
    };

    /**
     * Shared cancellation flag. Copies observe the same flag, so the request owner keeps one copy and every
     * resolver invocation of that request sees the other.
     *
     * Threads blocking on something other than the executor register a callback with on_cancel() to be woken as
     * soon as the request is cancelled.
     */
    class GROMMET_EXPORT CancellationToken {
        struct State {
            std::atomic<bool> cancelled{false};
            std::mutex mutex;
            std::condition_variable condition;
            std::vector<std::pair<size_t, std::function<void()>>> callbacks;
            size_t next_id{1};
            // Id of the callback cancel() is running, 0 when none.
            size_t running{0};
        };

    public:
        using callback_type = std::function<void()>;

        // Keeps a callback registered; the destructor unregisters it, waiting for it if it is running.
        class GROMMET_EXPORT Registration {
        public:
            Registration() = default;

            Registration(const Registration &) = delete;

            Registration &operator=(const Registration &) = delete;

            Registration(Registration &&other) noexcept;

            Registration &operator=(Registration &&) = delete;

            ~Registration();

        private:
            friend class CancellationToken;

            Registration(std::shared_ptr<State> state, size_t id) : _state{std::move(state)}, _id{id} {}

            std::shared_ptr<State> _state;
            size_t _id{0};
        };

        CancellationToken();

        // Sets the flag and runs every registered callback once, on the calling thread.
        void cancel() const;

        [[nodiscard]] bool is_cancelled() const { return _state->cancelled.load(std::memory_order_acquire); }

        // @throws Cancelled once cancel() has been called on any copy
        void throw_if_cancelled() const;

        // Runs callback when the token is cancelled, immediately when it already is.
        [[nodiscard]] Registration on_cancel(callback_type callback) const;

    private:
        std::shared_ptr<State> _state;
    };

    class GROMMET_EXPORT TaskExecutor {
    public:
        using task_type = std::function<void()>;

        explicit TaskExecutor(RuntimeConfig config = {});

        TaskExecutor(const TaskExecutor &) = delete;

        TaskExecutor &operator=(const TaskExecutor &) = delete;

        // Drains the queue and joins the workers. A worker dropping the last reference detaches instead.
        ~TaskExecutor();

        void submit(task_type task);

        [[nodiscard]] size_t worker_count() const { return _workers.size(); }

        [[nodiscard]] const RuntimeConfig &config() const { return _config; }

        // True when called from one of this executor's workers.
        [[nodiscard]] bool is_worker_thread() const;

        // The process wide executor, created with the default configuration on first use.
        static task_executor_s_ptr instance();

        /**
         * Replace the process wide executor. Requests already running keep the executor they started on; it
         * shuts down once the last of them completes.
         */
        static task_executor_s_ptr configure(RuntimeConfig config);

    private:
        // Outlives the executor when a worker drops the last reference and has to keep draining.
        struct Queue {
            std::mutex mutex;
            std::condition_variable condition;
            std::deque<task_type> tasks;
            bool stopping{false};
        };

        static void run_worker(std::shared_ptr<Queue> queue, const TaskExecutor *owner);

        RuntimeConfig _config;
        std::shared_ptr<Queue> _queue;
        std::vector<std::thread> _workers;
    };

    /**
     * Fork-join scope over a TaskExecutor. wait() runs any task no worker has claimed yet on the calling thread,
     * so nested groups cannot starve a small pool. Without an executor spawned tasks run immediately.
     */
    class GROMMET_EXPORT TaskGroup {
    public:
        explicit TaskGroup(task_executor_s_ptr executor);

        TaskGroup(const TaskGroup &) = delete;

        TaskGroup &operator=(const TaskGroup &) = delete;

        ~TaskGroup();

        void spawn(TaskExecutor::task_type task);

        // Blocks until every spawned task finished, then rethrows the first failure.
        void wait();

    private:
        struct State {
            std::mutex mutex;
            std::condition_variable condition;
            size_t pending{0};
            std::exception_ptr error;
        };

        struct Task {
            TaskExecutor::task_type fn;
            std::atomic<bool> claimed{false};
        };

        static void run(const std::shared_ptr<State> &state, const std::shared_ptr<Task> &task);

        task_executor_s_ptr _executor;
        std::shared_ptr<State> _state;
        std::vector<std::shared_ptr<Task>> _tasks;
    };
} // namespace grommet

#endif // GROMMET_RUNTIME_TASK_EXECUTOR_H
