#pragma once

#include <nlohmann/json.hpp>

namespace bytestream {
    using json = nlohmann::json;
}
