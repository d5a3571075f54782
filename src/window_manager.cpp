#include "window_manager.h"

#include <algorithm>
#include <utility>

WindowId WindowManager::Spawn(Window window)
{
    window.id = nextId_++;
    window.closeRequested = false;
    window.dragging = false;

    const WindowId id = window.id;
    const bool focusable = window.focusable;
    windows_.push_back(std::move(window));
    zOrder_.push_back(id);

    if (focusable)
    {
        focused_ = id;
    }
    return id;
}

PointerResult WindowManager::PointerDown(Vector2 point)
{
    pointer_ = point;
    PointerResult result;

    const bool modal = HasModal();
    for (auto it = zOrder_.rbegin(); it != zOrder_.rend(); ++it)
    {
        Window *window = Find(*it);
        if (!window || (modal && !window->modal))
        {
            continue;
        }

        const WindowRegion region = WindowRegionAt(*window, point);
        if (region == WindowRegion::None)
        {
            continue;
        }

        result.window = window->id;
        result.kind = KindOf(*window);
        result.region = region;

        if (region == WindowRegion::CloseButton)
        {
            result.closed = Close(window->id);
            return result;
        }

        if (region == WindowRegion::TitleBar)
        {
            if (window->draggable)
            {
                window->dragging = true;
                window->dragOffset = Vector2{point.x - window->frame.x, point.y - window->frame.y};
                dragged_ = window->id;
            }
            Focus(window->id);
            return result;
        }

        Focus(window->id);
        const int itemId = TrayItemAt(*window, point);
        const ItemTray *tray = WindowTray(*window);
        const ContentItem *item = tray ? FindTrayItem(*tray, itemId) : nullptr;
        if (item)
        {
            carry_.active = true;
            carry_.source = window->id;
            carry_.item = *item;
            result.carryStarted = true;
            return result;
        }

        result.action = HandleContentClick(*window, point);
        return result;
    }

    return result;
}

void WindowManager::PointerMove(Vector2 point)
{
    pointer_ = point;
    if (dragged_ == NoWindow)
    {
        return;
    }

    Window *window = Find(dragged_);
    if (!window)
    {
        dragged_ = NoWindow;
        return;
    }
    MoveWindowTo(*window, Vector2{point.x - window->dragOffset.x, point.y - window->dragOffset.y});
}

DropResult WindowManager::PointerUp()
{
    DropResult result;

    if (carry_.active)
    {
        result.wasCarrying = true;
        result.source = carry_.source;
        result.item = carry_.item;

        // A modal that appeared mid-carry cancels the drop.
        const WindowId targetId = HasModal() ? NoWindow : WindowAt(pointer_);
        Window *source = Find(carry_.source);
        Window *target = Find(targetId);
        if (source && target && target != source && AcceptsDrop(*target, carry_.item, pointer_))
        {
            ItemTray *sourceTray = WindowTray(*source);
            ItemTray *targetTray = WindowTray(*target);
            if (sourceTray && targetTray && TransferItem(*sourceTray, *targetTray, carry_.item.id))
            {
                result.transferred = true;
                result.destination = targetId;
            }
        }
        else if (target && target != source)
        {
            result.destination = targetId;
        }
    }

    if (Window *window = Find(dragged_))
    {
        window->dragging = false;
    }
    dragged_ = NoWindow;
    carry_ = ItemCarry{};
    return result;
}

WindowId WindowManager::CycleFocus()
{
    if (HasModal())
    {
        return focused_;
    }

    std::vector<WindowId> focusable;
    for (const auto &window : windows_)
    {
        if (window.focusable && window.visible)
        {
            focusable.push_back(window.id);
        }
    }
    if (focusable.empty())
    {
        focused_ = NoWindow;
        return focused_;
    }

    auto current = std::find(focusable.begin(), focusable.end(), focused_);
    WindowId next = focusable.front();
    if (current != focusable.end())
    {
        ++current;
        next = current == focusable.end() ? focusable.front() : *current;
    }

    Focus(next);
    return focused_;
}

void WindowManager::Focus(WindowId id)
{
    const Window *window = Find(id);
    if (!window)
    {
        return;
    }

    Raise(id);
    if (window->focusable)
    {
        focused_ = id;
    }
}

bool WindowManager::Close(WindowId id)
{
    auto it = std::find_if(windows_.begin(), windows_.end(), [id](const Window &w) { return w.id == id; });
    if (it == windows_.end())
    {
        return false;
    }

    if (dragged_ == id)
    {
        dragged_ = NoWindow;
    }
    if (carry_.active && carry_.source == id)
    {
        carry_ = ItemCarry{};
    }

    windows_.erase(it);
    zOrder_.erase(std::remove(zOrder_.begin(), zOrder_.end(), id), zOrder_.end());

    if (focused_ == id)
    {
        RefocusTopmost();
    }
    return true;
}

WindowAction WindowManager::KeyTyped(int codepoint)
{
    Window *window = Find(focused_);
    if (!window)
    {
        return WindowAction{};
    }
    return HandleContentKey(*window, codepoint);
}

std::vector<WindowId> WindowManager::Update(float dt)
{
    std::vector<WindowId> closing;
    for (auto &window : windows_)
    {
        UpdateWindow(window, dt);
        if (window.closeRequested)
        {
            closing.push_back(window.id);
        }
    }

    for (const WindowId id : closing)
    {
        Close(id);
    }
    return closing;
}

void WindowManager::DrawAll() const
{
    for (const WindowId id : zOrder_)
    {
        if (const Window *window = Find(id))
        {
            DrawWindow(*window, id == focused_);
        }
    }

    if (carry_.active)
    {
        DrawCarriedItem(carry_.item, pointer_);
    }
}

Window *WindowManager::Find(WindowId id)
{
    for (auto &window : windows_)
    {
        if (window.id == id)
        {
            return &window;
        }
    }
    return nullptr;
}

const Window *WindowManager::Find(WindowId id) const
{
    for (const auto &window : windows_)
    {
        if (window.id == id)
        {
            return &window;
        }
    }
    return nullptr;
}

Window *WindowManager::FindFirst(WindowKind kind)
{
    for (auto &window : windows_)
    {
        if (KindOf(window) == kind)
        {
            return &window;
        }
    }
    return nullptr;
}

const Window *WindowManager::FindFirst(WindowKind kind) const
{
    for (const auto &window : windows_)
    {
        if (KindOf(window) == kind)
        {
            return &window;
        }
    }
    return nullptr;
}

WindowId WindowManager::WindowAt(Vector2 point) const
{
    const bool modal = HasModal();
    for (auto it = zOrder_.rbegin(); it != zOrder_.rend(); ++it)
    {
        const Window *window = Find(*it);
        if (window && (!modal || window->modal) && WindowHitTest(*window, point))
        {
            return window->id;
        }
    }
    return NoWindow;
}

std::vector<WindowId> WindowManager::ZOrderTopFirst() const
{
    return std::vector<WindowId>(zOrder_.rbegin(), zOrder_.rend());
}

std::vector<WindowId> WindowManager::InsertionOrder() const
{
    std::vector<WindowId> ids;
    ids.reserve(windows_.size());
    for (const auto &window : windows_)
    {
        ids.push_back(window.id);
    }
    return ids;
}

bool WindowManager::HasModal() const
{
    return std::any_of(windows_.begin(), windows_.end(),
                       [](const Window &w) { return w.modal && w.visible; });
}

void WindowManager::Raise(WindowId id)
{
    auto it = std::find(zOrder_.begin(), zOrder_.end(), id);
    if (it == zOrder_.end())
    {
        return;
    }
    zOrder_.erase(it);
    zOrder_.push_back(id);
}

void WindowManager::RefocusTopmost()
{
    focused_ = NoWindow;
    for (auto it = zOrder_.rbegin(); it != zOrder_.rend(); ++it)
    {
        const Window *window = Find(*it);
        if (window && window->focusable && window->visible)
        {
            focused_ = window->id;
            return;
        }
    }
}
