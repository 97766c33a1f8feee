// GemGame Net
// enet_library.hpp - Reference-counted ENet initialisation

#pragma once

namespace gemgame::net {

// enet_initialize on the first live instance, enet_deinitialize after the
// last. Throws NetworkError when ENet cannot start.
class EnetLibrary {
public:
    EnetLibrary();
    ~EnetLibrary();

    EnetLibrary(const EnetLibrary&) = delete;
    EnetLibrary& operator=(const EnetLibrary&) = delete;
};

// Channel every message travels on
inline constexpr unsigned char MESSAGE_CHANNEL = 0;
inline constexpr unsigned char CHANNEL_COUNT = 1;

}  // namespace gemgame::net
