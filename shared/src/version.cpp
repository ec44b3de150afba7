#include "snapvault/version.hpp"

#ifndef SNAPVAULT_VERSION
#define SNAPVAULT_VERSION "0.0.0"
#endif

namespace snapvault
{

    std::string_view version() noexcept
    {
        return SNAPVAULT_VERSION;
    }

} // namespace snapvault
