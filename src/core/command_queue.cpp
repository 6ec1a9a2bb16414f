#include "listen_along/core/command_queue.hpp"

namespace listen_along::core {

std::string to_string(Command::Type type) {
    switch (type) {
        case Command::Type::Tick: return "tick";
        case Command::Type::Pause: return "pause";
        case Command::Type::Resume: return "resume";
        case Command::Type::Clear: return "clear";
        case Command::Type::Join: return "join";
        case Command::Type::Exit: return "exit";
    }
    return "unknown";
}

void CommandQueue::push(Command command) {
    {
        std::lock_guard lock(m_mutex);
        m_commands.push_back(std::move(command));
    }
    m_cv.notify_one();
}

std::optional<Command> CommandQueue::wait_pop_until(Clock::time_point deadline) {
    std::unique_lock lock(m_mutex);
    if (!m_cv.wait_until(lock, deadline, [this] { return !m_commands.empty(); })) {
        return std::nullopt;
    }

    auto command = std::move(m_commands.front());
    m_commands.pop_front();
    return command;
}

std::optional<Command> CommandQueue::try_pop() {
    std::lock_guard lock(m_mutex);
    if (m_commands.empty()) {
        return std::nullopt;
    }

    auto command = std::move(m_commands.front());
    m_commands.pop_front();
    return command;
}

std::size_t CommandQueue::size() const {
    std::lock_guard lock(m_mutex);
    return m_commands.size();
}

} // namespace listen_along::core
