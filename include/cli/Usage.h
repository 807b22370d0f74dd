#pragma once

#include <string>

namespace pyinfer::cli {
    std::string Usage();
} // namespace pyinfer::cli
