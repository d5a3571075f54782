#pragma once

#include "window.h"

#include <cstddef>
#include <vector>

struct PointerResult
{
    WindowId window = NoWindow;
    WindowKind kind = WindowKind::Popup;
    WindowRegion region = WindowRegion::None;
    bool closed = false;
    bool carryStarted = false;
    WindowAction action;
};

struct DropResult
{
    bool wasCarrying = false;
    bool transferred = false;
    WindowId source = NoWindow;
    WindowId destination = NoWindow;
    ContentItem item;
};

// Owns every live window. Insertion order drives Tab cycling, z-order drives
// drawing and hit testing. Spawn and focus always raise to the very top; a
// live modal window only filters which windows take pointer input.
// All calls happen on the frame thread.
class WindowManager
{
public:
    WindowId Spawn(Window window);

    PointerResult PointerDown(Vector2 point);
    void PointerMove(Vector2 point);
    DropResult PointerUp();

    WindowId CycleFocus();
    void Focus(WindowId id);
    bool Close(WindowId id);
    WindowAction KeyTyped(int codepoint);

    // Advances content timers and popup lifetimes, then removes every window
    // that asked to close. Returns the ids removed.
    std::vector<WindowId> Update(float dt);
    void DrawAll() const;

    Window *Find(WindowId id);
    const Window *Find(WindowId id) const;
    Window *FindFirst(WindowKind kind);
    const Window *FindFirst(WindowKind kind) const;
    // Topmost window under the point that may take pointer input.
    WindowId WindowAt(Vector2 point) const;

    std::vector<WindowId> ZOrderTopFirst() const;
    std::vector<WindowId> InsertionOrder() const;
    WindowId Focused() const { return focused_; }
    WindowId Dragged() const { return dragged_; }
    bool CarryingItem() const { return carry_.active; }
    bool HasModal() const;
    size_t Count() const { return windows_.size(); }
    bool Empty() const { return windows_.empty(); }

private:
    struct ItemCarry
    {
        bool active = false;
        WindowId source = NoWindow;
        ContentItem item;
    };

    void Raise(WindowId id);
    void RefocusTopmost();

    std::vector<Window> windows_;
    std::vector<WindowId> zOrder_;
    WindowId focused_ = NoWindow;
    WindowId dragged_ = NoWindow;
    ItemCarry carry_;
    Vector2 pointer_{};
    WindowId nextId_ = 1;
};
