// routes command
// Prints the built-in route table in evaluation order

#include "cli/commands.h"
#include "routing/route_table.h"
#include <iomanip>
#include <iostream>

namespace cqr::cli::commands {

int routes() {
    std::cout << std::left
              << std::setw(4) << "#"
              << std::setw(32) << "ROUTE"
              << std::setw(12) << "SERVER"
              << "EXAMPLE"
              << std::endl;

    int index = 1;
    for (const auto& route : RouteTable::defaults().routes()) {
        std::cout << std::left
                  << std::setw(4) << index++
                  << std::setw(32) << route.id
                  << std::setw(12) << to_string(route.backend)
                  << route.example
                  << std::endl;
    }
    return 0;
}

}  // namespace cqr::cli::commands
