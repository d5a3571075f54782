#include <catch2/catch_test_macros.hpp>

#include "content_item.h"

TEST_CASE("ItemTray", "[content_item]") {
    ItemTray source;
    source.items = {{1, "Form", "menu_card"}, {2, "Medkit", "supply"}};
    ItemTray destination;

    SECTION("TransferMovesExactlyOnce") {
        REQUIRE(TransferItem(source, destination, 1));
        REQUIRE_FALSE(TrayContains(source, 1));
        REQUIRE(destination.items.size() == 1);
        REQUIRE(destination.items.front().label == "Form");
        REQUIRE(source.items.size() == 1);
    }

    SECTION("UnknownItemIsRefused") {
        REQUIRE_FALSE(TransferItem(source, destination, 42));
        REQUIRE(source.items.size() == 2);
        REQUIRE(destination.items.empty());
    }

    SECTION("CategoryFilterRefusesAndKeepsItem") {
        destination.acceptedCategories = {"weapon", "menu_card"};
        REQUIRE_FALSE(TransferItem(source, destination, 2));
        REQUIRE(TrayContains(source, 2));
        REQUIRE(TransferItem(source, destination, 1));
    }

    SECTION("FullTrayRefuses") {
        destination.columns = 1;
        destination.rows = 1;
        destination.items = {{9, "Beans", "supply"}};
        REQUIRE(TrayCapacity(destination) == 1);
        REQUIRE_FALSE(TrayAccepts(destination, source.items.front()));
        REQUIRE_FALSE(TransferItem(source, destination, 1));
        REQUIRE(source.items.size() == 2);
    }

    SECTION("SameTrayIsRefused") {
        REQUIRE_FALSE(TransferItem(source, source, 1));
        REQUIRE(source.items.size() == 2);
    }

    SECTION("FindReturnsNullForMissing") {
        REQUIRE(FindTrayItem(source, 2) != nullptr);
        REQUIRE(FindTrayItem(source, 3) == nullptr);
    }
}
