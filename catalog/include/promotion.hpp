#pragma once

#include <cstdint>
#include <string>

namespace catalog {

enum class PromotionKind { SecondHalfPrice, ThirdOneFree, PercentOff };

/**
 * A pricing rule attached to a product. Promotions hold no mutable state;
 * apply() is a pure function of unit price and quantity.
 */
class Promotion {
public:
    static Promotion second_half_price(const std::string& name);
    static Promotion third_one_free(const std::string& name);
    static Promotion percent_off(const std::string& name, double percent);

    /**
     * Total price of `quantity` units at `unit_price` under this promotion.
     * Quantity validation is the caller's job.
     */
    double apply(double unit_price, int32_t quantity) const;

    std::string describe() const { return "'" + name_ + "'"; }

    const std::string& name() const { return name_; }
    PromotionKind kind() const { return kind_; }
    double percent() const { return percent_; }

private:
    Promotion(PromotionKind kind, std::string name, double percent);

    PromotionKind kind_;
    std::string name_;
    double percent_ = 0.0;
};

}  // namespace catalog
