#include "listen_along/core/presence_loop.hpp"
#include "listen_along/core/presence_reconciler.hpp"
#include "listen_along/services/source/source_adapter.hpp"
#include "listen_along/utils/logger.hpp"

namespace listen_along {
namespace core {

PresenceLoop::PresenceLoop(std::shared_ptr<services::Arbitrator> arbitrator,
                           std::shared_ptr<PresenceReconciler> reconciler,
                           std::shared_ptr<CommandQueue> commands,
                           std::chrono::milliseconds interval,
                           JoinHandler on_join)
    : m_arbitrator(std::move(arbitrator))
    , m_reconciler(std::move(reconciler))
    , m_commands(std::move(commands))
    , m_interval(interval)
    , m_on_join(std::move(on_join)) {}

PresenceLoop::~PresenceLoop() {
    stop();
}

void PresenceLoop::start() {
    std::lock_guard lock(m_lifecycle_mutex);
    if (m_thread.joinable()) {
        return;
    }

    LOG_INFO("PresenceLoop", "Starting presence loop (interval " +
             std::to_string(m_interval.count()) + " ms)");
    m_running = true;
    m_thread = std::jthread([this] { run(); });
}

void PresenceLoop::stop() {
    std::lock_guard lock(m_lifecycle_mutex);
    if (m_thread.joinable()) {
        m_commands->push(Command{Command::Type::Exit, {}});
        m_thread.join();
        return;
    }
    // Never started, or already finished: release is idempotent
    release();
}

void PresenceLoop::run() {
    auto deadline = CommandQueue::Clock::now();

    while (true) {
        auto command = m_commands->wait_pop_until(deadline);
        if (command) {
            const bool is_tick = command->type == Command::Type::Tick;
            if (!apply(*command)) {
                break;
            }
            if (is_tick) {
                deadline = CommandQueue::Clock::now() + m_interval;
            }
            continue;
        }

        run_tick();
        deadline = CommandQueue::Clock::now() + m_interval;
    }

    release();
    m_running = false;
    LOG_INFO("PresenceLoop", "Presence loop stopped");
}

void PresenceLoop::run_tick() {
    try {
        m_reconciler->tick(m_arbitrator->select());
    } catch (const std::exception& e) {
        LOG_ERROR("PresenceLoop", "Tick failed: " + std::string(e.what()));
    }
}

bool PresenceLoop::apply(const Command& command) {
    LOG_DEBUG("PresenceLoop", "Command: " + to_string(command.type));

    try {
        switch (command.type) {
            case Command::Type::Tick:
                run_tick();
                break;
            case Command::Type::Pause:
                m_reconciler->pause();
                break;
            case Command::Type::Resume:
                m_reconciler->resume();
                break;
            case Command::Type::Clear:
                m_reconciler->clear();
                break;
            case Command::Type::Join:
                if (m_on_join) {
                    m_on_join(command.payload);
                }
                break;
            case Command::Type::Exit:
                return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("PresenceLoop", "Command " + to_string(command.type) + " failed: " + e.what());
    }
    return true;
}

void PresenceLoop::release() {
    try {
        m_reconciler->shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("PresenceLoop", "Presence release failed: " + std::string(e.what()));
    }
}

} // namespace core
} // namespace listen_along
