#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include "store.hpp"

namespace storefront {

/**
 * Interactive text menu over a Store. Reads choices from `in` and writes
 * prompts and results to `out`; returns from run() on "4" or end of input.
 */
class StoreMenu {
public:
    StoreMenu(catalog::Store& store, std::istream& in, std::ostream& out)
        : store_(store), in_(in), out_(out) {}

    void run();

private:
    void show_products(const std::vector<catalog::ProductPtr>& products);
    void show_total_stock();
    void make_order();
    bool read_line(const std::string& prompt, std::string& line);

    static std::optional<int32_t> parse_int(const std::string& text);

    catalog::Store& store_;
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace storefront
