#include <SDL2/SDL.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "rummi/core/ServerConfig.hpp"
#include "rummi/net/Dispatcher.hpp"
#include "rummi/persistence/FileStateStore.hpp"
#include "rummi/persistence/GameStatePersistence.hpp"
#include "rummi/session/GameRegistry.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
    g_running = 0;
}

std::string AddrToKey(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

std::optional<rummi::core::ServerConfig> LoadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot open config %s", path.c_str());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return rummi::core::ServerConfig::Deserialize(buffer.str());
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid config %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }
}

bool ParsePositive(const char* flag, const char* text, std::int64_t& out) {
    try {
        const long long value = std::stoll(text);
        if (value <= 0) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s must be positive", flag);
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid argument for %s", flag);
        return false;
    }
}

// Defaults, then the config file, then command line flags.
std::optional<rummi::core::ServerConfig> BuildConfig(int argc, char* argv[]) {
    std::string config_path;
    if (const char* env = std::getenv("RUMMI_CONFIG")) {
        config_path = env;
    }
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            config_path = argv[i + 1];
        }
    }

    rummi::core::ServerConfig config;
    if (!config_path.empty()) {
        auto loaded = LoadConfigFile(config_path);
        if (!loaded) {
            return std::nullopt;
        }
        config = *loaded;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--port" && has_value) {
            std::int64_t port = 0;
            if (!ParsePositive("--port", argv[++i], port) || port > 65535) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Port must be in range 1-65535");
                return std::nullopt;
            }
            config.port = static_cast<int>(port);
        } else if (arg == "--turn-ms" && has_value) {
            if (!ParsePositive("--turn-ms", argv[++i], config.turn_duration_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--grace-ms" && has_value) {
            if (!ParsePositive("--grace-ms", argv[++i], config.grace_period_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--vote-ms" && has_value) {
            if (!ParsePositive("--vote-ms", argv[++i], config.vote_timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--save-root" && has_value) {
            config.save_root = argv[++i];
        } else if (arg == "--debug-hand") {
            config.debug_hand = true;
        } else if (arg == "--verbose") {
            config.log_verbose = true;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring argument %s", arg.c_str());
        }
    }
    return config;
}

void Send(int sockfd, const std::map<std::string, sockaddr_in>& clients,
          rummi::net::Dispatcher& dispatcher, rummi::net::Outbox outbox) {
    // Recovery after a failed send can queue further messages.
    while (!outbox.empty()) {
        rummi::net::Outbox followups;
        for (const auto& message : outbox) {
            auto it = clients.find(message.client_key);
            if (it == clients.end()) {
                continue;
            }
            const std::string text = rummi::net::EncodeOutbound(message.body);
            if (text.size() > rummi::net::kMaxMessageSize) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Dropping %zu byte message to %s",
                            text.size(), message.client_key.c_str());
                continue;
            }
            if (sendto(sockfd, text.data(), text.size(), 0,
                       reinterpret_cast<const sockaddr*>(&it->second), sizeof(it->second)) < 0) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "sendto %s failed: %s",
                            message.client_key.c_str(), std::strerror(errno));
                auto more = dispatcher.onSendFailed(message.client_key, rummi::core::Clock::now());
                followups.insert(followups.end(), more.begin(), more.end());
            }
        }
        outbox = std::move(followups);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (SDL_Init(0) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    auto config = BuildConfig(argc, argv);
    if (!config) {
        SDL_Quit();
        return 1;
    }
    if (config->log_verbose) {
        SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_VERBOSE);
    }

    int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "socket: %s", std::strerror(errno));
        SDL_Quit();
        return 1;
    }
    sockaddr_in serv_addr{};
    serv_addr.sin_family = AF_INET;
    serv_addr.sin_addr.s_addr = INADDR_ANY;
    serv_addr.sin_port = htons(static_cast<std::uint16_t>(config->port));
    if (bind(sockfd, reinterpret_cast<sockaddr*>(&serv_addr), sizeof(serv_addr)) < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "bind: %s", std::strerror(errno));
        close(sockfd);
        SDL_Quit();
        return 1;
    }

    auto store = std::make_unique<rummi::persistence::FileStateStore>(config->save_root);
    if (!store->Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Save root %s unavailable, games live in memory",
                    store->root().string().c_str());
    }
    SDL_Log("Saving games under %s", store->root().string().c_str());

    rummi::session::RecoveryCoordinator storage_recovery;
    rummi::persistence::GameStatePersistence persistence(std::move(store), storage_recovery);
    rummi::session::GameRegistry registry(rummi::session::RoomSettingsFrom(*config));
    rummi::net::Dispatcher dispatcher(registry, &persistence,
                                      rummi::core::Millis(config->heartbeat_timeout_ms));
    dispatcher.restoreSavedGames(rummi::core::Clock::now());

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    SDL_Log("Rummi UDP server running on port %d", config->port);

    std::map<std::string, sockaddr_in> clients;
    std::string buffer(rummi::net::kMaxMessageSize + 1, '\0');
    const rummi::core::Millis tick_interval(config->tick_interval_ms);
    auto last_tick = rummi::core::Clock::now();

    while (g_running) {
        pollfd pfd{sockfd, POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(tick_interval.count()));
        if (ready < 0 && errno != EINTR) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "poll: %s", std::strerror(errno));
            break;
        }

        if (ready > 0 && (pfd.revents & POLLIN) != 0) {
            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            const ssize_t n = recvfrom(sockfd, buffer.data(), buffer.size(), 0,
                                       reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (n < 0) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "recvfrom: %s", std::strerror(errno));
            } else {
                const std::string key = AddrToKey(client_addr);
                clients[key] = client_addr;
                auto outbox = dispatcher.handle(
                    key, std::string(buffer.data(), static_cast<std::size_t>(n)),
                    rummi::core::Clock::now());
                Send(sockfd, clients, dispatcher, std::move(outbox));
            }
        }

        const auto now = rummi::core::Clock::now();
        if (now - last_tick >= tick_interval) {
            last_tick = now;
            auto outbox = dispatcher.tick(now);
            Send(sockfd, clients, dispatcher, std::move(outbox));
            for (auto it = clients.begin(); it != clients.end();) {
                if (!dispatcher.playerOf(it->first)) {
                    it = clients.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    SDL_Log("Shutting down, %zu games in progress", registry.size());
    close(sockfd);
    SDL_Quit();
    return 0;
}
