#include "store.hpp"
#include <algorithm>
#include <iterator>
#include <utility>

namespace catalog {

using namespace storefront;

Store::Store(std::vector<ProductPtr> products) {
    for (const auto& product : products) {
        if (!product) throw ValidationError::invalid_configuration("Can only add products to the store");
    }
    products_ = std::move(products);
}

void Store::add_product(ProductPtr product) {
    if (!product) throw ValidationError::invalid_configuration("Can only add a product to the store");
    products_.push_back(std::move(product));
}

void Store::remove_product(const std::string& name) {
    products_.erase(std::remove_if(products_.begin(), products_.end(),
                                   [&](const ProductPtr& p) { return p->name() == name; }),
                    products_.end());
}

Store Store::merge(const Store& other) const {
    Store merged(products_);
    for (const auto& product : other.products_) {
        if (contains(product->name())) throw ValidationError::duplicate_product(product->name());
        merged.products_.push_back(product);
    }
    return merged;
}

bool Store::contains(const std::string& name) const {
    return std::any_of(products_.begin(), products_.end(),
                       [&](const ProductPtr& p) { return p->name() == name; });
}

int64_t Store::total_stock() const {
    int64_t total = 0;
    for (const auto& product : products_) {
        if (product->tracks_stock()) total += product->stock();
    }
    return total;
}

std::vector<ProductPtr> Store::active_products() const {
    std::vector<ProductPtr> active;
    std::copy_if(products_.begin(), products_.end(), std::back_inserter(active),
                 [](const ProductPtr& p) { return p->active(); });
    return active;
}

Settlement Store::settle_order(const std::vector<OrderLine>& lines) {
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!line.product) {
            throw ValidationError::invalid_configuration(
                "Order line " + std::to_string(i + 1) + " has no product");
        }
        if (line.quantity < 1) throw ValidationError::invalid_quantity(line.product->name(), line.quantity);
    }

    Settlement settlement;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        try {
            settlement.total += line.product->purchase(line.quantity);
        } catch (const ValidationError& e) {
            if (!e.recoverable()) throw;
            settlement.failures.push_back(
                {i, line.product->name(), line.quantity, e.kind(), e.what()});
        }
    }
    return settlement;
}

}  // namespace catalog
