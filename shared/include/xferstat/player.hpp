#pragma once

#include <string>

namespace xferstat
{

    // Remote player a transfer is performed for. Owned by the caller; statuses
    // only keep a shared reference to it.
    struct Player
    {
        std::string id;
        std::string name;
        std::string address;
    };

} // namespace xferstat
