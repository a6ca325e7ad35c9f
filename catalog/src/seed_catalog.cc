#include "seed_catalog.hpp"

namespace catalog {

Store make_seed_store() {
    auto macbook = Product::standard("MacBook Air M2", 1450, 100);
    auto earbuds = Product::standard("Bose QuietComfort Earbuds", 250, 500);
    auto pixel = Product::standard("Google Pixel 7", 500, 250);
    auto license = Product::unlimited("Windows License", 125);
    auto shipping = Product::limited("Shipping", 10, 250, 1);

    macbook->set_promotion(Promotion::second_half_price("Second Half price!"));
    earbuds->set_promotion(Promotion::third_one_free("Third One Free!"));
    license->set_promotion(Promotion::percent_off("30% Off!", 30));

    return Store({macbook, earbuds, pixel, license, shipping});
}

}  // namespace catalog
