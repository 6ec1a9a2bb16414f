#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace listen_along::services {

class DiscordIpc;

/**
 * @brief Receives "Join" clicks on our Rich Presence.
 *
 * Holds a second IPC connection, separate from the presence session, and
 * subscribes to ACTIVITY_JOIN and ACTIVITY_JOIN_REQUEST. Join secrets are
 * handed to the callback; join requests are accepted when auto_accept is set.
 * Reconnects on its own until stopped.
 */
class DiscordJoinListener {
public:
    using JoinCallback = std::function<void(const std::string& secret)>;

    struct Options {
        bool auto_accept = true;
        std::chrono::seconds no_pipe_retry{10};
        std::chrono::seconds error_retry{5};
        std::chrono::milliseconds read_timeout{1000};
    };

    // What a DISPATCH message asks of us. Missing or null fields read as empty.
    struct JoinEvent {
        enum class Kind { None, Join, JoinRequest };

        Kind kind = Kind::None;
        std::string secret;
        std::string user_id;
        std::string username;
    };

    static JoinEvent parse_event(const nlohmann::json& message);

    DiscordJoinListener(std::string client_id, JoinCallback on_join, Options options);
    ~DiscordJoinListener();

    DiscordJoinListener(const DiscordJoinListener&) = delete;
    DiscordJoinListener& operator=(const DiscordJoinListener&) = delete;

    void start();
    void stop();
    bool is_running() const { return m_thread.joinable(); }

private:
    std::string m_client_id;
    JoinCallback m_on_join;
    Options m_options;

    std::mutex m_wait_mutex;
    std::condition_variable_any m_wait_cv;
    std::jthread m_thread;

    void run(std::stop_token stop);
    bool subscribe(DiscordIpc& ipc);
    void event_loop(DiscordIpc& ipc, std::stop_token stop);
    void handle_message(DiscordIpc& ipc, const nlohmann::json& message);

    // Returns false if stop was requested during the wait.
    bool wait_for(std::stop_token stop, std::chrono::seconds delay);
};

} // namespace listen_along::services
