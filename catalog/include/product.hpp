#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "promotion.hpp"

namespace catalog {

enum class ProductKind { Standard, Unlimited, Limited };

class Product;
using ProductPtr = std::shared_ptr<Product>;

/**
 * A sellable item. The three variants share one purchase algorithm that
 * branches on kind() for the stock and per-order maximum checks.
 *
 * Availability is derived rather than stored: a product is active while it
 * is enabled and has stock left; unlimited products are always active.
 */
class Product {
    struct Key {
        explicit Key() = default;
    };

public:
    // Reported by stock() for products that do not track stock.
    static constexpr int32_t kUnlimitedStock = -1;

    static ProductPtr standard(const std::string& name, double price, int32_t stock);
    static ProductPtr unlimited(const std::string& name, double price);
    static ProductPtr limited(const std::string& name, double price, int32_t stock,
                              int32_t maximum);

    const std::string& name() const { return name_; }
    double price() const { return price_; }
    ProductKind kind() const { return kind_; }
    bool tracks_stock() const { return kind_ != ProductKind::Unlimited; }
    int32_t stock() const { return tracks_stock() ? stock_ : kUnlimitedStock; }
    // Zero unless the product is Limited.
    int32_t maximum() const { return maximum_; }

    // Unlimited products ignore deactivate() and always report active.
    bool active() const { return !tracks_stock() || (enabled_ && stock_ > 0); }
    void activate() { enabled_ = true; }
    void deactivate() { enabled_ = false; }

    void set_stock(int32_t stock);

    const std::optional<Promotion>& promotion() const { return promotion_; }
    void set_promotion(const Promotion& promotion) { promotion_ = promotion; }
    void clear_promotion() { promotion_.reset(); }

    /**
     * Buys `quantity` units and returns the line total.
     *
     * Checks run in this order: invalid quantity, inactive product, per-order
     * maximum, stock. Stock is only decremented once every check has passed.
     */
    double purchase(int32_t quantity);

    // Price of `quantity` units with the promotion applied, without buying.
    double quote(int32_t quantity) const;

    std::string describe() const;

    bool operator<(const Product& other) const { return price_ < other.price_; }
    bool operator>(const Product& other) const { return price_ > other.price_; }

    // Reachable only through the named factories above.
    Product(Key, ProductKind kind, std::string name, double price, int32_t stock,
            int32_t maximum);

private:
    ProductKind kind_;
    std::string name_;
    double price_;
    int32_t stock_;
    int32_t maximum_;
    bool enabled_ = true;
    std::optional<Promotion> promotion_;
};

}  // namespace catalog
