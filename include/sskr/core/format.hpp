#pragma once

#include <fmt/core.h>

namespace sskr::compat {
    using fmt::format;
}
