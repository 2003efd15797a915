#include "stubgen/type_expr.hpp"

namespace jstub::stubgen {

auto TypeExpr::to_string() const -> std::string {
    if (type_args.empty() && !name.empty()) {
        return name;
    }
    std::string out = name + "[";
    for (size_t i = 0; i < type_args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += type_args[i].to_string();
    }
    out += "]";
    return out;
}

} // namespace jstub::stubgen
