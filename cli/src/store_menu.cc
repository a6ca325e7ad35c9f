#include "store_menu.hpp"
#include "storefront/logging.hpp"
#include "storefront/validation_error.hpp"
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <vector>

namespace storefront {

namespace {

const char* kStoreMenu =
    "\n   Store Menu\n"
    "   ----------\n"
    "1. List all products in store\n"
    "2. Show total amount in store\n"
    "3. Make an order\n"
    "4. Quit\n"
    "Please choose a number: ";

}  // namespace

void StoreMenu::run() {
    std::string choice;
    while (read_line(kStoreMenu, choice)) {
        auto number = parse_int(choice);
        if (!number) {
            out_ << "Error with your choice! Try again!\n";
            continue;
        }
        switch (*number) {
            case 1:
                show_products(store_.active_products());
                break;
            case 2:
                show_total_stock();
                break;
            case 3:
                make_order();
                break;
            case 4:
                return;
            default:
                out_ << "Error with your choice! Try again!\n";
                break;
        }
    }
}

void StoreMenu::show_products(const std::vector<catalog::ProductPtr>& products) {
    out_ << "\n-----\n";
    int line = 0;
    for (const auto& product : products) {
        out_ << ++line << ". " << product->describe() << "\n";
    }
    out_ << "-----\n";
}

void StoreMenu::show_total_stock() {
    out_ << "\nTotal of " << store_.total_stock() << " items in store\n";
}

void StoreMenu::make_order() {
    auto products = store_.active_products();
    show_products(products);
    out_ << "When you want to finish order, enter empty text.\n";

    std::vector<catalog::OrderLine> lines;
    std::string number_text;
    std::string amount_text;
    while (read_line("Which product # do you want? ", number_text) &&
           read_line("What amount do you want? ", amount_text)) {
        if (number_text.empty() || amount_text.empty()) break;

        auto number = parse_int(number_text);
        if (!number || *number < 1 || static_cast<size_t>(*number) > products.size()) {
            out_ << "\n- Product-Index # out of bounds ! -\n\n";
            continue;
        }
        auto amount = parse_int(amount_text);
        if (!amount || *amount <= 0) {
            out_ << "\n- Error adding product ! -\n\n";
            continue;
        }
        lines.push_back({products[*number - 1], *amount});
        out_ << "\nProduct added to list!\n\n";
    }

    if (lines.empty()) return;

    try {
        auto settlement = store_.settle_order(lines);
        for (const auto& failure : settlement.failures) {
            log_warn("cli", "order_line_rejected",
                {{"product", failure.product}, {"reason", error_kind_name(failure.kind)}});
            out_ << "Skipped line " << failure.line + 1 << ": " << failure.message << "\n";
        }
        out_ << "********\nOrder made! Total payment $" << std::fixed << std::setprecision(2)
             << settlement.total << "\n";
        out_.unsetf(std::ios_base::floatfield);
        out_ << std::setprecision(6);
    } catch (const ValidationError& e) {
        log_warn("cli", "order_refused", {{"reason", error_kind_name(e.kind())}});
        out_ << "Error:\n\t" << e.what() << "\n";
    }
}

bool StoreMenu::read_line(const std::string& prompt, std::string& line) {
    out_ << prompt << std::flush;
    if (!std::getline(in_, line)) return false;
    // Trim surrounding whitespace so "  2 " parses and "   " counts as blank.
    auto begin = line.find_first_not_of(" \t\r");
    auto end = line.find_last_not_of(" \t\r");
    line = begin == std::string::npos ? std::string() : line.substr(begin, end - begin + 1);
    return true;
}

std::optional<int32_t> StoreMenu::parse_int(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<int32_t>(value);
}

}  // namespace storefront
