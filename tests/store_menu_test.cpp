#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "store_menu.hpp"

using namespace storefront;
using catalog::Product;
using catalog::ProductPtr;
using catalog::Store;

// =============================================================================
// Test Fixture
// =============================================================================

class StoreMenuTest : public ::testing::Test {
protected:
    void SetUp() override {
        pixel = Product::standard("Google Pixel 7", 500, 250);
        shipping = Product::limited("Shipping", 10, 250, 1);
        store = Store({pixel, shipping});
    }

    std::string run(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        StoreMenu menu(store, in, out);
        menu.run();
        return out.str();
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    ProductPtr pixel;
    ProductPtr shipping;
    Store store;
};

// =============================================================================
// Menu Tests
// =============================================================================

TEST_F(StoreMenuTest, ListProducts_ShouldNumberFromOne) {
    auto output = run("1\n4\n");

    EXPECT_TRUE(contains(output, "1. Google Pixel 7, Price: $500"));
    EXPECT_TRUE(contains(output, "2. Shipping, Price: $10"));
}

TEST_F(StoreMenuTest, TotalStock_ShouldPrintSum) {
    auto output = run("2\n4\n");

    EXPECT_TRUE(contains(output, "Total of 500 items in store"));
}

TEST_F(StoreMenuTest, InvalidChoice_ShouldAskAgain) {
    auto output = run("abc\n9\n4\n");

    EXPECT_TRUE(contains(output, "Error with your choice! Try again!"));
}

TEST_F(StoreMenuTest, EndOfInput_ShouldQuit) {
    EXPECT_NO_THROW(run("1\n"));
}

// =============================================================================
// Order Tests
// =============================================================================

TEST_F(StoreMenuTest, MakeOrder_ShouldTranslateIndexAndPrintTotal) {
    auto output = run("3\n1\n2\n\n\n4\n");

    EXPECT_TRUE(contains(output, "Product added to list!"));
    EXPECT_TRUE(contains(output, "Order made! Total payment $1000.00"));
    EXPECT_EQ(pixel->stock(), 248);
}

TEST_F(StoreMenuTest, MakeOrder_RefusedLine_ShouldPrintNoticeAndContinue) {
    auto output = run("3\n2\n3\n1\n1\n\n\n4\n");

    EXPECT_TRUE(contains(output, "Skipped line 1"));
    EXPECT_TRUE(contains(output, "limited to 1 per order"));
    EXPECT_TRUE(contains(output, "Order made! Total payment $500.00"));
    EXPECT_EQ(shipping->stock(), 250);
}

TEST_F(StoreMenuTest, MakeOrder_BadIndexOrAmount_ShouldRejectBeforeOrdering) {
    auto output = run("3\n0\n1\n5\n1\n1\n0\n1\nx\n\n\n4\n");

    EXPECT_TRUE(contains(output, "Product-Index # out of bounds"));
    EXPECT_TRUE(contains(output, "Error adding product"));
    EXPECT_FALSE(contains(output, "Order made!"));
    EXPECT_EQ(pixel->stock(), 250);
}
