#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#define ENET_IMPLEMENTATION
#include "enet.h"

#include "Console/ConVar.hpp"
#include "Utils/Log.hpp"
#include "PeerNetworkManager.hpp"
#include "Session.hpp"

EXTERN_CONVAR(net_port);
EXTERN_CONVAR(net_max_peers);
EXTERN_CONVAR(developer);

static const char* CONFIG_FILE = "spraynet.cfg";
static std::atomic<bool> s_running{true};

static void handle_signal(int)
{
    s_running = false;
}

static void print_usage(const char* program)
{
    LOG_APP_INFO("Usage: {0} host [port] | {0} join <address> [port]", program);
}

int main(int argc, char* argv[])
{
    Spraynet::CLog::Init("spraynet.log");
    Spraynet::InitializeDefaultCVars();

    if (!Spraynet::ConVarRegistry::get().loadConfig(CONFIG_FILE)) {
        LOG_APP_INFO("No {0} found, using defaults", CONFIG_FILE);
    }
    if (g_cvar_developer.getInt() > 0) {
        Spraynet::CLog::SetLevel(spdlog::level::trace);
        for (Spraynet::ConVarBase* cvar : Spraynet::ConVarRegistry::get().getAll()) {
            LOG_APP_TRACE("{0} = \"{1}\"", cvar->getName(), cvar->getValueString());
        }
    }

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const bool hosting = std::strcmp(argv[1], "host") == 0;
    const bool joining = std::strcmp(argv[1], "join") == 0;
    if ((!hosting && !joining) || (joining && argc < 3)) {
        print_usage(argv[0]);
        return 1;
    }

    uint16_t port = static_cast<uint16_t>(g_cvar_net_port.getInt());
    const int port_arg = hosting ? 2 : 3;
    if (argc > port_arg) {
        port = static_cast<uint16_t>(std::atoi(argv[port_arg]));
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const Spraynet::NetworkIdentity identity = Spraynet::PeerNetworkManager::generateIdentity();
    Spraynet::PeerNetworkManager network(identity);
    if (!network.initialize()) {
        LOG_APP_ERROR("Failed to initialize network");
        return 1;
    }

    bool started = hosting
        ? network.hostSession(port, static_cast<uint32_t>(g_cvar_net_max_peers.getInt()))
        : network.joinSession(argv[2], port);
    if (!started) {
        LOG_APP_ERROR("Failed to start session");
        return 1;
    }

    Spraynet::Session session(network, identity);

    using Clock = std::chrono::steady_clock;
    const Clock::time_point start = Clock::now();
    auto seconds_since_start = [&start]() {
        return std::chrono::duration<double>(Clock::now() - start).count();
    };

    network.setOnPacket([&](const uint8_t* data, size_t size) {
        session.handlePacket(data, size, seconds_since_start());
    });
    network.setOnMemberJoined([&](Spraynet::NetworkIdentity member) {
        session.onMemberJoined(member);
    });
    network.setOnMemberLeft([&](Spraynet::NetworkIdentity member) {
        session.onMemberLeft(member);
    });
    network.setOnDisconnected([]() {
        LOG_APP_WARN("Lost connection to the session");
        s_running = false;
    });

    session.getSprays().setNotifyCallback([](const std::string& message) {
        LOG_APP_WARN("[notice] {0}", message);
    });

    Spraynet::SprayManager& sprays = session.getSprays();
    if (sprays.reloadLibrary() > 0) {
        sprays.getLibrary().select(sprays.getLibrary().getFiles().front().name);
        LOG_APP_INFO("Using spray '{0}'", sprays.getLibrary().getCurrent()->getShortName());
    }

    const auto frame = std::chrono::milliseconds(16);
    double last_time = seconds_since_start();
    double next_spray = 2.0;
    double next_rocket = 3.0;
    Spraynet::EntityId rocket = Spraynet::INVALID_ENTITY_ID;
    double rocket_spawned = 0.0;
    Spraynet::ReplicationManager& replication = session.getReplication();

    while (s_running) {
        const double now = seconds_since_start();
        const float delta_time = static_cast<float>(now - last_time);
        last_time = now;

        network.update(delta_time);
        session.update(now);

        // Demo traffic: a spray every few seconds once someone else is around
        if (network.getMemberCount() > 0 && now >= next_spray) {
            sprays.createLocalSpray(glm::vec3(static_cast<float>(now), 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
            next_spray = now + 5.0;
        }

        // ... and a rocket that flies for two seconds
        if (rocket == Spraynet::INVALID_ENTITY_ID && network.getMemberCount() > 0 && now >= next_rocket) {
            rocket = replication.spawnLocal(Spraynet::EntityKind::Grenade, glm::vec3(0.0f), glm::vec3(0.0f), now);
            rocket_spawned = now;
        }
        if (rocket != Spraynet::INVALID_ENTITY_ID) {
            Spraynet::OwnableEntity* entity = replication.find(rocket);
            const float age = static_cast<float>(now - rocket_spawned);
            if (entity == nullptr || age > 2.0f) {
                replication.killEntity(rocket);
                rocket = Spraynet::INVALID_ENTITY_ID;
                next_rocket = now + 5.0;
            } else if (entity->isOwner()) {
                entity->setTransform(glm::vec3(0.0f, 1.0f, age * 20.0f), glm::vec3(0.0f, age * 90.0f, 0.0f));
            }
        }

        std::this_thread::sleep_for(frame);
    }

    LOG_APP_INFO("Shutting down...");
    const Spraynet::NetworkStats& net_stats = network.getStats();
    const Spraynet::NetworkStats& session_stats = session.getStats();
    LOG_APP_INFO("Sent {0} packets ({1} bytes), received {2} ({3} bytes), dropped {4} in transport and {5} in session",
        net_stats.packets_sent, net_stats.bytes_sent, net_stats.packets_received, net_stats.bytes_received,
        net_stats.packets_dropped, session_stats.packets_dropped);
    session.shutdown();
    network.shutdown();

    if (!Spraynet::ConVarRegistry::get().saveArchiveCvars(CONFIG_FILE)) {
        LOG_APP_WARN("Could not write {0}", CONFIG_FILE);
    }
    Spraynet::CLog::Shutdown();
    return 0;
}
