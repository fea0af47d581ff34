#include <grommet/runtime/task_executor.h>
#include <grommet/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace grommet {
    namespace {
        thread_local const TaskExecutor *current_executor{nullptr};

        std::mutex &instance_mutex() {
            static std::mutex mutex;
            return mutex;
        }

        task_executor_s_ptr &instance_slot() {
            static task_executor_s_ptr executor;
            return executor;
        }
    } // namespace

    void RuntimeConfig::validate() const {
        if (use_current_thread && worker_threads.has_value()) { throw RuntimeThreadsConflict(); }
        if (worker_threads.has_value() && *worker_threads == 0) {
            throw_error<ValidationError>("worker_threads must be at least 1");
        }
    }

    size_t RuntimeConfig::thread_count() const {
        if (use_current_thread) { return 1; }
        if (worker_threads.has_value()) { return *worker_threads; }
        auto hardware = std::thread::hardware_concurrency();
        return hardware == 0 ? 1 : hardware;
    }

    CancellationToken::CancellationToken() : _state{std::make_shared<State>()} {}

    void CancellationToken::cancel() const {
        if (_state->cancelled.exchange(true, std::memory_order_acq_rel)) { return; }
        std::unique_lock lock(_state->mutex);
        while (!_state->callbacks.empty()) {
            auto [id, callback] = std::move(_state->callbacks.front());
            _state->callbacks.erase(_state->callbacks.begin());
            _state->running = id;
            lock.unlock();
            try {
                callback();
            } catch (const std::exception &e) {
                fmt::print(stderr, "grommet: cancellation callback failed: {}\n", e.what());
            }
            lock.lock();
            _state->running = 0;
            _state->condition.notify_all();
        }
    }

    void CancellationToken::throw_if_cancelled() const {
        if (is_cancelled()) { throw Cancelled(); }
    }

    CancellationToken::Registration CancellationToken::on_cancel(callback_type callback) const {
        {
            std::lock_guard lock(_state->mutex);
            if (!_state->cancelled.load(std::memory_order_acquire)) {
                auto id = _state->next_id++;
                _state->callbacks.emplace_back(id, std::move(callback));
                return Registration(_state, id);
            }
        }
        callback();
        return {};
    }

    CancellationToken::Registration::Registration(Registration &&other) noexcept
        : _state{std::move(other._state)}, _id{std::exchange(other._id, 0)} {}

    CancellationToken::Registration::~Registration() {
        if (!_state) { return; }
        std::unique_lock lock(_state->mutex);
        auto &callbacks = _state->callbacks;
        auto it = std::find_if(callbacks.begin(), callbacks.end(), [this](const auto &entry) {
            return entry.first == _id;
        });
        if (it != callbacks.end()) {
            callbacks.erase(it);
            return;
        }
        _state->condition.wait(lock, [this] { return _state->running != _id; });
    }

    TaskExecutor::TaskExecutor(RuntimeConfig config)
        : _config{std::move(config)}, _queue{std::make_shared<Queue>()} {
        _config.validate();
        auto count = _config.thread_count();
        _workers.reserve(count);
        for (size_t i = 0; i < count; ++i) { _workers.emplace_back(&TaskExecutor::run_worker, _queue, this); }
    }

    TaskExecutor::~TaskExecutor() {
        {
            std::lock_guard lock(_queue->mutex);
            _queue->stopping = true;
        }
        _queue->condition.notify_all();
        auto self = std::this_thread::get_id();
        for (auto &worker: _workers) {
            if (!worker.joinable()) { continue; }
            if (worker.get_id() == self) {
                worker.detach();
            } else {
                worker.join();
            }
        }
    }

    void TaskExecutor::submit(task_type task) {
        {
            std::lock_guard lock(_queue->mutex);
            if (_queue->stopping) { throw_error("Task executor is shutting down"); }
            _queue->tasks.push_back(std::move(task));
        }
        _queue->condition.notify_one();
    }

    bool TaskExecutor::is_worker_thread() const { return current_executor == this; }

    void TaskExecutor::run_worker(std::shared_ptr<Queue> queue, const TaskExecutor *owner) {
        current_executor = owner;
        while (true) {
            task_type task;
            {
                std::unique_lock lock(queue->mutex);
                queue->condition.wait(lock, [&queue] { return queue->stopping || !queue->tasks.empty(); });
                if (queue->tasks.empty()) { break; }
                task = std::move(queue->tasks.front());
                queue->tasks.pop_front();
            }
            try {
                task();
            } catch (const std::exception &e) {
                fmt::print(stderr, "grommet: unhandled error in executor task: {}\n", e.what());
            }
        }
        current_executor = nullptr;
    }

    task_executor_s_ptr TaskExecutor::instance() {
        std::lock_guard lock(instance_mutex());
        auto &slot = instance_slot();
        if (!slot) { slot = std::make_shared<TaskExecutor>(); }
        return slot;
    }

    task_executor_s_ptr TaskExecutor::configure(RuntimeConfig config) {
        auto executor = std::make_shared<TaskExecutor>(std::move(config));
        task_executor_s_ptr previous;
        {
            std::lock_guard lock(instance_mutex());
            previous = std::exchange(instance_slot(), executor);
        }
        // previous is released outside the lock, joining its workers if nothing else holds it
        return executor;
    }

    TaskGroup::TaskGroup(task_executor_s_ptr executor)
        : _executor{std::move(executor)}, _state{std::make_shared<State>()} {}

    TaskGroup::~TaskGroup() {
        try {
            wait();
        } catch (const std::exception &e) {
            fmt::print(stderr, "grommet: task group discarded error: {}\n", e.what());
        }
    }

    void TaskGroup::run(const std::shared_ptr<State> &state, const std::shared_ptr<Task> &task) {
        std::exception_ptr error;
        try {
            task->fn();
        } catch (...) {
            error = std::current_exception();
        }
        {
            std::lock_guard lock(state->mutex);
            if (error && !state->error) { state->error = error; }
            --state->pending;
        }
        state->condition.notify_all();
    }

    void TaskGroup::spawn(TaskExecutor::task_type fn) {
        auto task = std::make_shared<Task>();
        task->fn = std::move(fn);
        if (!_executor) {
            task->claimed = true;
            {
                std::lock_guard lock(_state->mutex);
                ++_state->pending;
            }
            run(_state, task);
            return;
        }

        {
            std::lock_guard lock(_state->mutex);
            ++_state->pending;
        }
        _tasks.push_back(task);
        try {
            _executor->submit([state = _state, task] {
                if (!task->claimed.exchange(true)) { run(state, task); }
            });
        } catch (const GrommetError &) {
            // Executor is shutting down; wait() runs the task inline.
        }
    }

    void TaskGroup::wait() {
        for (auto &task: _tasks) {
            if (!task->claimed.exchange(true)) { run(_state, task); }
        }
        _tasks.clear();

        std::unique_lock lock(_state->mutex);
        _state->condition.wait(lock, [this] { return _state->pending == 0; });
        if (_state->error) { std::rethrow_exception(std::exchange(_state->error, nullptr)); }
    }
} // namespace grommet
