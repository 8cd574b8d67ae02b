#pragma once

#include <string_view>

namespace xferstat
{

    std::string_view version() noexcept;

} // namespace xferstat
