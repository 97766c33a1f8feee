// GemGame Net
// enet_library.cpp - ENet initialisation

#include <gemgame/core/logger.hpp>
#include <gemgame/net/enet_library.hpp>
#include <gemgame/net/net_error.hpp>

#include <enet/enet.h>

#include <mutex>

namespace gemgame::net {

namespace {

std::mutex g_enet_mutex;
int g_enet_users = 0;

}  // namespace

EnetLibrary::EnetLibrary() {
    std::lock_guard lock(g_enet_mutex);
    if (g_enet_users == 0) {
        if (enet_initialize() != 0) {
            throw NetworkError(NetErrorKind::ConnectionFault, "couldn't initialise ENet");
        }
        GEMGAME_LOG_DEBUG(core::log_category::NETWORK, "ENet {}.{}.{} initialised", ENET_VERSION_MAJOR,
                          ENET_VERSION_MINOR, ENET_VERSION_PATCH);
    }
    ++g_enet_users;
}

EnetLibrary::~EnetLibrary() {
    std::lock_guard lock(g_enet_mutex);
    if (--g_enet_users == 0) {
        enet_deinitialize();
    }
}

}  // namespace gemgame::net
