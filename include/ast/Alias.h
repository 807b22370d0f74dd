#pragma once

#include <string>
#include <vector>

namespace pyinfer::ast {
    struct Alias {
        std::string name;
        std::string asname; // empty if none
    };

    // Name bound by an alias: the asname, else the first dotted component.
    std::string boundName(const Alias &alias);

    // Map a bound name back to the imported name; throws NotFoundError.
    std::string realName(const std::vector<Alias> &names, const std::string &asname);
}
