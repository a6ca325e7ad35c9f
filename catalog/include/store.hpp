#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "product.hpp"
#include "storefront/validation_error.hpp"

namespace catalog {

struct OrderLine {
    ProductPtr product;
    int32_t quantity;
};

struct LineFailure {
    size_t line;
    std::string product;
    int32_t requested;
    storefront::ErrorKind kind;
    std::string message;
};

struct Settlement {
    double total = 0.0;
    std::vector<LineFailure> failures;

    bool complete() const { return failures.empty(); }
};

/**
 * An ordered, in-memory collection of products. Entries are shared handles,
 * so the same product may appear in several stores and order lines.
 */
class Store {
public:
    Store() = default;
    explicit Store(std::vector<ProductPtr> products);

    // Appends without a uniqueness check.
    void add_product(ProductPtr product);

    // Removes every entry with exactly this name. Unknown names are ignored.
    void remove_product(const std::string& name);

    /**
     * New store holding this store's products followed by those of `other`.
     * Throws DuplicateProduct on the first name that already exists here.
     */
    Store merge(const Store& other) const;
    Store operator+(const Store& other) const { return merge(other); }

    bool contains(const std::string& name) const;
    bool contains(const Product& product) const { return contains(product.name()); }

    // Sum of stock over stock-tracked products; unlimited products count as 0.
    int64_t total_stock() const;

    // Active products in insertion order.
    std::vector<ProductPtr> active_products() const;
    const std::vector<ProductPtr>& products() const { return products_; }
    size_t size() const { return products_.size(); }

    /**
     * Applies each line in order and returns the accumulated total.
     *
     * Lines refused for stock, maximum or availability reasons are recorded in
     * Settlement::failures and contribute nothing; the rest of the order still
     * goes through. A line without a product or with a non-positive quantity
     * aborts the whole order before any stock is touched.
     */
    Settlement settle_order(const std::vector<OrderLine>& lines);

private:
    std::vector<ProductPtr> products_;
};

}  // namespace catalog
