#pragma once

#include "listen_along/core/command_queue.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace listen_along {
namespace services {
    class Arbitrator;
}
namespace core {

class PresenceReconciler;

/**
 * @brief Single worker thread that runs ticks and applies commands.
 *
 * Ticks and commands run on the same thread, so a command never interleaves
 * with a tick. The next tick is due one interval after the previous one
 * finished. The reconciler is shut down when the loop ends, whichever way
 * it ends.
 */
class PresenceLoop {
public:
    using JoinHandler = std::function<void(const std::string& secret)>;

    PresenceLoop(std::shared_ptr<services::Arbitrator> arbitrator,
                 std::shared_ptr<PresenceReconciler> reconciler,
                 std::shared_ptr<CommandQueue> commands,
                 std::chrono::milliseconds interval,
                 JoinHandler on_join = nullptr);
    ~PresenceLoop();

    PresenceLoop(const PresenceLoop&) = delete;
    PresenceLoop& operator=(const PresenceLoop&) = delete;

    void start();

    // Enqueues Exit and joins. Safe to call more than once.
    void stop();

    bool is_running() const { return m_running; }

    // Runs on the calling thread; used by the worker and by tests.
    void run_tick();
    // Returns false for Exit.
    bool apply(const Command& command);

private:
    std::shared_ptr<services::Arbitrator> m_arbitrator;
    std::shared_ptr<PresenceReconciler> m_reconciler;
    std::shared_ptr<CommandQueue> m_commands;
    std::chrono::milliseconds m_interval;
    JoinHandler m_on_join;

    std::mutex m_lifecycle_mutex;
    std::jthread m_thread;
    std::atomic<bool> m_running{false};

    void run();
    void release();
};

} // namespace core
} // namespace listen_along
