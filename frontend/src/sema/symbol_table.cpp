// frontend/src/sema/symbol_table.cpp
#include <olympiac/sema/SymbolTable.hpp>

#include <sstream>


namespace olympiac::sema {

    std::string to_string(const TableSnapshot& snap) {
        std::ostringstream os;
        for (const auto& scope : snap) {
            os << "[scope " << scope.level << "]:\n";
            for (const auto& e : scope.entries) {
                os << "  - " << e.name << ": " << e.type << " (line " << e.line << ")\n";
            }
        }
        return os.str();
    }

} // namespace olympiac::sema
