#pragma once

#include <fmt/core.h>

namespace ratchetcore::compat {
    using fmt::format;
}
