#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace listen_along::core {

struct Command {
    enum class Type {
        Tick,      // run a tick now
        Pause,
        Resume,
        Clear,
        Join,      // payload: invite secret
        Exit
    };

    Type type;
    std::string payload;

    static Command join(std::string secret) {
        return Command{Type::Join, std::move(secret)};
    }
};

std::string to_string(Command::Type type);

// Multi-producer, single-consumer. Producers are the tray, signal
// handling and the join listener; the consumer is the presence loop.
class CommandQueue {
public:
    using Clock = std::chrono::steady_clock;

    void push(Command command);

    // Blocks until a command arrives or the deadline passes.
    std::optional<Command> wait_pop_until(Clock::time_point deadline);
    std::optional<Command> try_pop();

    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Command> m_commands;
};

} // namespace listen_along::core
