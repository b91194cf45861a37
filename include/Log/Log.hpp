#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace logsys {
    void Init(bool verbose);                 // colored stderr sink, "mazegen"
}
