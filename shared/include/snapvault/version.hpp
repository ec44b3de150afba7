/**
 * SnapVault - Build version string.
 */
#pragma once

#include <string_view>

namespace snapvault
{

    std::string_view version() noexcept;

} // namespace snapvault
