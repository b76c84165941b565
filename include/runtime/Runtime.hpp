#pragma once
#include "Message.hpp"
#include "model/Model.hpp"
#include <atomic>
#include <deque>
#include <mutex>

// Drains the message queue once per tick and folds every message through
// the root model's update().
//
// Producers (key reader, ticker, reload trigger) may enqueue from any
// thread. tick() must only be called from the single driver thread.
// A tick sees exactly the messages queued when it started; anything
// enqueued while it runs, including Batch re-enqueues, waits for the next.
class Runtime {
public:
    Runtime() = default;

    void enqueue(Message message);

    // Returns the model after all drained messages. An exception from
    // update() propagates; the message that raised it is consumed and the
    // ones after it are put back at the front of the queue.
    ModelPtr tick(ModelPtr model);

    // Did the last tick drain anything other than None?
    bool render() const { return shouldRender_; }

    bool running() const { return running_; }
    bool stopped() const { return !running_; }
    void start();
    void stop();

    size_t pending() const {
        std::lock_guard lock(mtx_);
        return queue_.size();
    }

private:
    void execute(const Command& command);
    void requeueAfterFailure(const std::deque<Message>& drained, size_t failed);

    std::deque<Message> queue_;
    mutable std::mutex  mtx_;
    std::atomic<bool>   running_{false};
    bool                shouldRender_ = false;
};
