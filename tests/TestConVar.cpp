#include <catch2/catch_test_macros.hpp>

#include "Console/ConVar.hpp"
#include "TestHelpers.hpp"

#include <fstream>

EXTERN_CONVAR(net_snapshot_interval);
EXTERN_CONVAR(net_transfer_timeout);
EXTERN_CONVAR(cl_spray_directory);

namespace Spraynet {

TEST_CASE("Default cvars are registered", "[config]")
{
    InitializeDefaultCVars();
    ConVarRegistry& registry = ConVarRegistry::get();

    REQUIRE(registry.find("net_snapshot_interval") == &g_cvar_net_snapshot_interval);
    REQUIRE(g_cvar_net_snapshot_interval.getFloat() == 0.0625f);
    REQUIRE(CVAR_FLOAT(net_transfer_timeout) == 10.0f);
    REQUIRE(CVAR_STRING(cl_spray_directory) == "sprays");
    REQUIRE_FALSE(CVAR_BOOL(cl_disable_sprays));
    REQUIRE(registry.find("no_such_cvar") == nullptr);
}

TEST_CASE("Bounded cvars clamp assignments", "[config]")
{
    g_cvar_net_transfer_timeout.setFloat(1000.0f);
    REQUIRE(g_cvar_net_transfer_timeout.getFloat() == 120.0f);

    g_cvar_net_transfer_timeout.setFloat(0.0f);
    REQUIRE(g_cvar_net_transfer_timeout.getFloat() == 1.0f);

    g_cvar_net_transfer_timeout.reset();
    REQUIRE(g_cvar_net_transfer_timeout.getFloat() == 10.0f);
}

TEST_CASE("Change callbacks see old and new values", "[config]")
{
    ConVarBase cvar("test_callback_cvar", 5, ConVarFlags::NONE, "");
    int old_seen = 0;
    int new_seen = 0;
    cvar.addChangeCallback([&](ConVarBase*, const ConVarValue& old_value, const ConVarValue& new_value) {
        old_seen = std::get<int>(old_value);
        new_seen = std::get<int>(new_value);
    });

    REQUIRE(cvar.setFromString("9"));
    REQUIRE(old_seen == 5);
    REQUIRE(new_seen == 9);
    REQUIRE_FALSE(cvar.setFromString("nine"));
    REQUIRE(cvar.getInt() == 9);
}

TEST_CASE("Prefix lookup is sorted and case-insensitive", "[config]")
{
    InitializeDefaultCVars();
    auto matches = ConVarRegistry::get().findMatching("NET_");
    REQUIRE(matches.size() >= 4);
    REQUIRE(matches.front()->getName() == "net_max_peers");
    for (ConVarBase* cvar : matches) {
        REQUIRE(cvar->getName().rfind("net_", 0) == 0);
    }
    REQUIRE(ConVarRegistry::get().findMatching("zz_nothing").empty());
}

TEST_CASE("Config files set values by name", "[config]")
{
    Test::TempDirectory dir;
    const std::string path = dir.string() + "/spraynet.cfg";
    {
        std::ofstream file(path);
        file << "// comment\n";
        file << "net_snapshot_interval 0.125\n";
        file << "cl_spray_directory \"my sprays\"\n";
        file << "unknown_cvar 1\n";
    }

    REQUIRE(ConVarRegistry::get().loadConfig(path));
    REQUIRE(g_cvar_net_snapshot_interval.getFloat() == 0.125f);
    REQUIRE(g_cvar_cl_spray_directory.getString() == "my sprays");

    g_cvar_net_snapshot_interval.reset();
    g_cvar_cl_spray_directory.reset();

    REQUIRE_FALSE(ConVarRegistry::get().loadConfig(dir.string() + "/missing.cfg"));
}

TEST_CASE("Archive cvars survive a save and load", "[config]")
{
    Test::TempDirectory dir;
    const std::string path = dir.string() + "/saved.cfg";

    g_cvar_net_transfer_timeout.setFloat(30.0f);
    REQUIRE(ConVarRegistry::get().saveArchiveCvars(path));
    g_cvar_net_transfer_timeout.reset();

    REQUIRE(ConVarRegistry::get().loadConfig(path));
    REQUIRE(g_cvar_net_transfer_timeout.getFloat() == 30.0f);
    g_cvar_net_transfer_timeout.reset();
}

} // namespace Spraynet
