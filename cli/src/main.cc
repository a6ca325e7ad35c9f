#include "seed_catalog.hpp"
#include "store_menu.hpp"
#include "storefront/logging.hpp"
#include <iostream>

int main() {
    auto store = catalog::make_seed_store();
    storefront::log_info("cli", "store_cli_started", {{"products", store.size()}});

    storefront::StoreMenu menu(store, std::cin, std::cout);
    menu.run();

    std::cout << "\nBye!" << std::endl;
    return 0;
}
