// Default ConVar definitions
#include "ConVar.hpp"

// Replication
CONVAR_BOUNDED(net_snapshot_interval, 0.0625f, 0.01f, 1.0f, ::Spraynet::ConVarFlags::ARCHIVE,
               "Seconds between owner snapshots; also the interpolation window");

CONVAR_BOUNDED(net_transfer_timeout, 10.0f, 1.0f, 120.0f, ::Spraynet::ConVarFlags::ARCHIVE,
               "Seconds a chunked transfer may stay incomplete before it is dropped and re-requested");

// Transport
CONVAR(net_port, 27015, ::Spraynet::ConVarFlags::ARCHIVE,
       "Port used when hosting or joining a session");

CONVAR_BOUNDED(net_max_peers, 16, 1, 64, ::Spraynet::ConVarFlags::ARCHIVE,
               "Maximum participants accepted by the host");

// Sprays
CONVAR(cl_disable_sprays, false, ::Spraynet::ConVarFlags::ARCHIVE | ::Spraynet::ConVarFlags::NOTIFY,
       "Do not show sprays of other participants (they are still cached)");

CONVAR(cl_spray_directory, "sprays", ::Spraynet::ConVarFlags::ARCHIVE,
       "Directory scanned for png/jpg/jpeg spray images");

CONVAR_BOUNDED(cl_spray_replace_lifetime, 3.0f, 0.0f, 60.0f, ::Spraynet::ConVarFlags::ARCHIVE,
               "Remaining lifetime given to a participant's previous spray when a new one is placed");

// Developer/debug cvars
CONVAR(developer, 0, ::Spraynet::ConVarFlags::ARCHIVE | ::Spraynet::ConVarFlags::NOTIFY,
       "Developer mode - trace logging");

namespace Spraynet {

void InitializeDefaultCVars()
{
    // Referencing the globals keeps this translation unit linked in
    (void)g_cvar_net_snapshot_interval;
    (void)g_cvar_net_transfer_timeout;
}

} // namespace Spraynet
