/**
 * @file
 * @brief HasName mixin for the named frames (modules, defs and classes).
 */
#pragma once

#include <string>

namespace pyinfer::ast {

// Module name is dotted; def and class names are the last component of qualifiedName().
struct HasName {
    std::string name;
};

}
