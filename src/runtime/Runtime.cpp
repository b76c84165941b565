#include "runtime/Runtime.hpp"
#include <spdlog/spdlog.h>

void Runtime::enqueue(Message message) {
    std::lock_guard lock(mtx_);
    queue_.push_back(std::move(message));
}

ModelPtr Runtime::tick(ModelPtr model) {
    std::deque<Message> drained;
    {
        std::lock_guard lock(mtx_);
        drained.swap(queue_);
    }

    bool renderDue = false;
    size_t next = 0;
    try {
        for (; next < drained.size(); next++) {
            const Message& message = drained[next];
            auto result = model->update(message);
            if (!result.model)
                throw TeacupError(model->typeName() + "::update(" +
                                  message.describe() + ") returned no model");
            model = std::move(result.model);
            execute(result.command);

            if (!message.isNone())
                renderDue = true;
        }
    } catch (...) {
        requeueAfterFailure(drained, next);
        shouldRender_ = renderDue;
        throw;
    }

    shouldRender_ = renderDue;
    return model;
}

void Runtime::requeueAfterFailure(const std::deque<Message>& drained,
                                  size_t failed) {
    spdlog::debug("update failed on {}, requeueing {} later messages",
                  drained[failed].toJson().dump(),
                  drained.size() - failed - 1);

    // Unprocessed messages go back ahead of anything queued meanwhile
    std::lock_guard lock(mtx_);
    queue_.insert(queue_.begin(), drained.begin() + failed + 1, drained.end());
}

void Runtime::start() {
    running_ = true;
}

void Runtime::stop() {
    running_ = false;
}

void Runtime::execute(const Command& command) {
    switch (command.type) {
        case Message::Type::None:
            break;
        case Message::Type::Exit:
            spdlog::debug("Exit command received, stopping runtime");
            stop();
            break;
        case Message::Type::Batch: {
            std::lock_guard lock(mtx_);
            for (auto& m : command.messages)
                queue_.push_back(m);
            spdlog::debug("Batch re-enqueued {} messages", command.messages.size());
            break;
        }
        case Message::Type::Reload:
        case Message::Type::Resize:
            // Informational; application update() logic acts on these
            break;
        case Message::Type::Tick:
        case Message::Type::KeyPress:
        case Message::Type::Custom:
            break;
    }
}
