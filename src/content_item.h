#pragma once

#include <optional>
#include <string>
#include <vector>

struct ContentItem
{
    int id = -1;
    std::string label;
    std::string category;
};

// Fixed-capacity grid of items inside a window. Items occupy slots in order.
struct ItemTray
{
    int columns = 6;
    int rows = 4;
    // Empty means every category is accepted.
    std::vector<std::string> acceptedCategories;
    std::vector<ContentItem> items;
};

int TrayCapacity(const ItemTray &tray);
bool TrayAccepts(const ItemTray &tray, const ContentItem &item);
bool TrayContains(const ItemTray &tray, int itemId);
const ContentItem *FindTrayItem(const ItemTray &tray, int itemId);

// Moves itemId from source to destination. Nothing changes unless the item is
// in source and destination accepts it.
bool TransferItem(ItemTray &source, ItemTray &destination, int itemId);
