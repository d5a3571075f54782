#pragma once

#include "window_content.h"

#include "raylib.h"

#include <string>

using WindowId = int;
inline constexpr WindowId NoWindow = -1;

inline constexpr float TitleBarHeight = 40.0f;
inline constexpr float CloseButtonSize = 20.0f;
inline constexpr float TraySlotSize = 60.0f;
inline constexpr float TraySlotPadding = 5.0f;

enum class WindowRegion
{
    None,
    TitleBar,
    CloseButton,
    Content
};

struct Window
{
    WindowId id = NoWindow;
    std::string title;
    Rectangle frame{};
    // While a modal window is live only modal windows take pointer input.
    bool modal = false;
    bool chrome = true;
    bool focusable = true;
    bool closable = true;
    bool draggable = true;
    bool resizable = false;
    bool visible = true;
    bool closeRequested = false;
    // Seconds until the window closes itself; negative means no limit.
    float lifetime = -1.0f;

    bool dragging = false;
    Vector2 dragOffset{};

    WindowContent content;
};

Window MakeWindow(std::string title, Rectangle frame, WindowContent content);

WindowKind KindOf(const Window &window);

Rectangle TitleBarRect(const Window &window);
Rectangle CloseButtonRect(const Window &window);
Rectangle ContentRect(const Window &window);

bool WindowHitTest(const Window &window, Vector2 point);
WindowRegion WindowRegionAt(const Window &window, Vector2 point);

void MoveWindowTo(Window &window, Vector2 topLeft);
void ResizeWindow(Window &window, float width, float height);
void RequestClose(Window &window);

ItemTray *WindowTray(Window &window);
const ItemTray *WindowTray(const Window &window);
Rectangle TraySlotRect(const Window &window, int slot);
// Id of the tray item under point, or -1.
int TrayItemAt(const Window &window, Vector2 point);
// True when point is inside the tray's content area and the tray takes item.
bool AcceptsDrop(const Window &window, const ContentItem &item, Vector2 point);

WindowAction HandleContentClick(Window &window, Vector2 point);
WindowAction HandleContentKey(Window &window, int codepoint);
void UpdateWindow(Window &window, float dt);

void DrawWindow(const Window &window, bool focused);
void DrawCarriedItem(const ContentItem &item, Vector2 point);

// Per-kind layout shared by hit testing and drawing.
inline constexpr int InboxVisibleRows = 8;
inline constexpr float OutlookSidebarWidth = 150.0f;
inline constexpr float MessagesSidebarWidth = 200.0f;
Rectangle InboxRowRect(const Window &window, int visibleRow);
Rectangle ConversationRowRect(const Window &window, int row);
Rectangle SlackChannelRect(const Window &window, int row);
Rectangle ReplyButtonRect(const Window &window);
Rectangle ResponseOptionRect(const Window &window, int index);
Rectangle SendButtonRect(const Window &window);
Rectangle AnswerButtonRect(const Window &window);
Rectangle HangUpButtonRect(const Window &window);
