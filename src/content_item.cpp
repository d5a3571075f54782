#include "content_item.h"

#include <algorithm>

int TrayCapacity(const ItemTray &tray)
{
    return tray.columns * tray.rows;
}

bool TrayAccepts(const ItemTray &tray, const ContentItem &item)
{
    if (static_cast<int>(tray.items.size()) >= TrayCapacity(tray))
    {
        return false;
    }
    if (tray.acceptedCategories.empty())
    {
        return true;
    }
    return std::find(tray.acceptedCategories.begin(), tray.acceptedCategories.end(), item.category) !=
           tray.acceptedCategories.end();
}

const ContentItem *FindTrayItem(const ItemTray &tray, int itemId)
{
    for (const auto &item : tray.items)
    {
        if (item.id == itemId)
        {
            return &item;
        }
    }
    return nullptr;
}

bool TrayContains(const ItemTray &tray, int itemId)
{
    return FindTrayItem(tray, itemId) != nullptr;
}

bool TransferItem(ItemTray &source, ItemTray &destination, int itemId)
{
    if (&source == &destination)
    {
        return false;
    }

    auto it = std::find_if(source.items.begin(), source.items.end(),
                           [itemId](const ContentItem &item) { return item.id == itemId; });
    if (it == source.items.end() || !TrayAccepts(destination, *it))
    {
        return false;
    }

    destination.items.push_back(std::move(*it));
    source.items.erase(it);
    return true;
}
