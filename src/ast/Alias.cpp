/***
 * Name: pyinfer::ast::boundName / realName
 * Purpose: Translate between imported names and the names an import binds.
 * Theory of Operation:
 *   An unaliased dotted import (`import a.b`) binds its first component.
 *   A star import maps any bound name to itself.
 */
#include "ast/Alias.h"
#include "pyinfer/exceptions/not_found_error.h"

namespace pyinfer::ast {

std::string boundName(const Alias &alias) {
    if (!alias.asname.empty()) { return alias.asname; }
    return alias.name.substr(0, alias.name.find('.'));
}

std::string realName(const std::vector<Alias> &names, const std::string &asname) {
    for (const auto &alias : names) {
        if (alias.name == "*") { return asname; }
        if (alias.asname.empty()) {
            const std::string head = alias.name.substr(0, alias.name.find('.'));
            if (head == asname) { return head; }
        } else if (alias.asname == asname) {
            return alias.name;
        }
    }
    throw exceptions::NotFoundError(asname);
}

} // namespace pyinfer::ast
