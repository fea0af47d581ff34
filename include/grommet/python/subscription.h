//
// Python async iterators as engine subscription streams, and the stream handle handed back to python.
//

#ifndef GROMMET_PYTHON_SUBSCRIPTION_H
#define GROMMET_PYTHON_SUBSCRIPTION_H

#include <grommet/engine/resolver_context.h>
#include <grommet/engine/schema.h>
#include <grommet/python/field_context.h>
#include <grommet/python/host_value.h>

#include <atomic>
#include <mutex>

namespace grommet {
    /**
     * The iterator behind one subscription and its open/closed flag. Open until closed explicitly or the iterator
     * is exhausted; once closed every pull reports end of stream.
     */
    struct GROMMET_EXPORT SubscriptionState {
        void attach(host_value_ptr iterator);

        // nullptr once closed.
        [[nodiscard]] host_value_ptr iterator() const;

        // Idempotent. The iterator reference is dropped outside the state lock.
        void close();

        [[nodiscard]] bool is_closed() const { return _closed.load(std::memory_order_acquire); }

    private:
        mutable std::mutex _mutex;
        host_value_ptr _iterator;
        std::atomic<bool> _closed{false};
    };

    class GROMMET_EXPORT HostIteratorStream final : public engine::FieldStream {
    public:
        HostIteratorStream(subscription_state_s_ptr state, field_context_s_ptr field, host_scheduler_s_ptr scheduler,
                           CancellationToken cancellation);

        /**
         * Await the iterator's next item and convert it against the field's output type.
         * @throws HostException when __anext__ raises anything but StopAsyncIteration
         */
        std::optional<engine::FieldValue> next() override;

    private:
        subscription_state_s_ptr _state;
        field_context_s_ptr _field;
        host_scheduler_s_ptr _scheduler;
        CancellationToken _cancellation;
    };

    /**
     * Subscription resolver installed for every subscription field. Calls the field's resolver or, without one,
     * reads the field from the request root, then adapts the async iterator it produced. The result of a resolver
     * flagged is_async_gen is iterated as is; any other awaitable result is awaited first.
     *
     * @throws SubscriptionRequiresAsyncIterator when the result has neither __aiter__ nor __anext__
     */
    engine::field_stream_u_ptr resolve_subscription(const engine::ResolverContext &ctx,
                                                    const field_context_s_ptr &field);

    /**
     * Python handle over an engine response stream. Each __anext__ returns a future for the next response and
     * pulls on a worker; pulls are serialized. aclose() releases the iterator and is idempotent.
     */
    class GROMMET_EXPORT PySubscriptionStream {
    public:
        PySubscriptionStream(engine::response_stream_s_ptr stream, subscription_state_s_ptr state,
                             host_scheduler_s_ptr scheduler, CancellationToken cancellation,
                             task_executor_s_ptr executor);

        nb::object anext();

        nb::object aclose();

        [[nodiscard]] bool is_closed() const { return _state->is_closed(); }

        static void register_with_nanobind(nb::module_ &m);

    private:
        struct Shared {
            engine::response_stream_s_ptr stream;
            std::mutex pull_mutex;
        };

        std::shared_ptr<Shared> _shared;
        subscription_state_s_ptr _state;
        host_scheduler_s_ptr _scheduler;
        CancellationToken _cancellation;
        task_executor_s_ptr _executor;
    };
} // namespace grommet

#endif // GROMMET_PYTHON_SUBSCRIPTION_H
