#pragma once

#define ASSETMIND_VERSION "1.4.0"
#define ASSETMIND_PROTOCOL_VERSION_MAJOR 1
#define ASSETMIND_PROTOCOL_VERSION_MINOR 2

namespace assetmind {
namespace version {

// Same major, and a server minor at least as new as the client's
inline bool protocol_compatible(int major, int minor) {
    return major == ASSETMIND_PROTOCOL_VERSION_MAJOR &&
           minor <= ASSETMIND_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace assetmind
