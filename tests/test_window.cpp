#include <catch2/catch_test_macros.hpp>

#include "window.h"

namespace {

Vector2 Center(Rectangle r)
{
    return Vector2{r.x + r.width * 0.5f, r.y + r.height * 0.5f};
}

InboxEntry Entry(int id, std::vector<std::string> responses)
{
    InboxEntry entry;
    entry.id = id;
    entry.email = EmailTemplate{"boss@conference.org", "Numbers", "Send the numbers.", std::move(responses)};
    return entry;
}

} // namespace

TEST_CASE("Window geometry", "[window]") {
    Window window = MakeWindow("Test", Rectangle{100, 100, 400, 300}, ActivityLogContent{});

    SECTION("RegionsResolveCloseBeforeTitle") {
        REQUIRE(WindowRegionAt(window, Center(CloseButtonRect(window))) == WindowRegion::CloseButton);
        REQUIRE(WindowRegionAt(window, Vector2{150, 110}) == WindowRegion::TitleBar);
        REQUIRE(WindowRegionAt(window, Vector2{150, 200}) == WindowRegion::Content);
        REQUIRE(WindowRegionAt(window, Vector2{50, 50}) == WindowRegion::None);
    }

    SECTION("NonClosableWindowHasNoCloseRegion") {
        window.closable = false;
        REQUIRE(WindowRegionAt(window, Center(CloseButtonRect(window))) == WindowRegion::TitleBar);
    }

    SECTION("HiddenWindowIsNotHit") {
        window.visible = false;
        REQUIRE_FALSE(WindowHitTest(window, Vector2{150, 200}));
    }

    SECTION("ChromelessContentFillsFrame") {
        window.chrome = false;
        const Rectangle content = ContentRect(window);
        REQUIRE(content.y == 100.0f);
        REQUIRE(content.height == 300.0f);
        REQUIRE(WindowRegionAt(window, Vector2{150, 110}) == WindowRegion::Content);
    }

    SECTION("ResizeOnlyWhenResizable") {
        ResizeWindow(window, 800, 600);
        REQUIRE(window.frame.width == 400.0f);

        window.resizable = true;
        ResizeWindow(window, 10, 10);
        REQUIRE(window.frame.width == 160.0f);
        REQUIRE(window.frame.height == TitleBarHeight + 60.0f);
    }

    SECTION("RequestCloseRespectsClosable") {
        window.closable = false;
        RequestClose(window);
        REQUIRE_FALSE(window.closeRequested);
        window.closable = true;
        RequestClose(window);
        REQUIRE(window.closeRequested);
    }

    SECTION("KindFollowsContent") {
        REQUIRE(KindOf(window) == WindowKind::ActivityLog);
        REQUIRE(WindowTray(window) == nullptr);
    }
}

TEST_CASE("Window content behavior", "[window]") {

    SECTION("InboxClickMarksReadAndOpens") {
        OutlookContent outlook;
        InboxEntry entry = Entry(7, {"OK"});
        entry.blinking = true;
        outlook.inbox.push_back(entry);
        Window window = MakeWindow("Outlook", Rectangle{0, 0, 700, 500}, std::move(outlook));

        const WindowAction action = HandleContentClick(window, Center(InboxRowRect(window, 0)));
        REQUIRE(action.type == ActionType::OpenEmail);
        REQUIRE(action.inboxId == 7);
        const InboxEntry &clicked = std::get<OutlookContent>(window.content).inbox.front();
        REQUIRE(clicked.read);
        REQUIRE_FALSE(clicked.blinking);
    }

    SECTION("ReplyTypesOneLetterPerKey") {
        ReplyContent reply;
        reply.entry = Entry(3, {"Hi", "Sure thing."});
        Window window = MakeWindow("Reply", Rectangle{0, 0, 600, 450}, std::move(reply));

        REQUIRE(HandleContentClick(window, Center(SendButtonRect(window))).type == ActionType::None);
        HandleContentKey(window, 'x');
        HandleContentKey(window, 'y');
        const auto &typed = std::get<ReplyContent>(window.content);
        REQUIRE(typed.typed == "Hi");
        REQUIRE(typed.complete);

        HandleContentKey(window, 'z');
        REQUIRE(typed.typed == "Hi");

        const WindowAction send = HandleContentClick(window, Center(SendButtonRect(window)));
        REQUIRE(send.type == ActionType::SendReply);
        REQUIRE(send.inboxId == 3);
        REQUIRE(send.text == "Hi");
    }

    SECTION("ChoosingAnotherResponseRestartsTyping") {
        ReplyContent reply;
        reply.entry = Entry(3, {"Hi", "Sure thing."});
        Window window = MakeWindow("Reply", Rectangle{0, 0, 600, 450}, std::move(reply));
        HandleContentKey(window, 'a');

        HandleContentClick(window, Center(ResponseOptionRect(window, 1)));
        const auto &content = std::get<ReplyContent>(window.content);
        REQUIRE(content.responseIndex == 1);
        REQUIRE(content.typed.empty());
        REQUIRE_FALSE(content.complete);
    }

    SECTION("EmailViewOffersReplyUntilReplied") {
        Window window = MakeWindow("Numbers", Rectangle{0, 0, 700, 500}, EmailViewContent{Entry(5, {"OK"})});
        REQUIRE(HandleContentClick(window, Center(ReplyButtonRect(window))).type == ActionType::OpenReply);

        std::get<EmailViewContent>(window.content).entry.replied = true;
        REQUIRE(HandleContentClick(window, Center(ReplyButtonRect(window))).type == ActionType::None);
    }

    SECTION("AnsweredCallTypesScriptAndCloses") {
        PhoneCallContent call;
        call.script = PhoneScript{"Jar", "(555) 345-6789", {{Speaker::Caller, "Hey"}, {Speaker::Player, "Hi"}}};
        Window window = MakeWindow("Incoming Call", Rectangle{0, 0, 400, 200}, std::move(call));

        UpdateWindow(window, 5.0f);
        REQUIRE_FALSE(window.closeRequested);

        const WindowAction answer = HandleContentClick(window, Center(AnswerButtonRect(window)));
        REQUIRE(answer.type == ActionType::AnswerCall);
        REQUIRE(window.frame.height == 300.0f);

        // "Hey" types in 0.15 s; the turn then pauses for 0.8 s.
        UpdateWindow(window, 0.1f);
        REQUIRE(std::get<PhoneCallContent>(window.content).typedChars == 2);
        UpdateWindow(window, 1.0f);
        REQUIRE(std::get<PhoneCallContent>(window.content).turn == 1);
        UpdateWindow(window, 1.0f);
        REQUIRE(std::get<PhoneCallContent>(window.content).finished);
        REQUIRE(window.closeRequested);
    }

    SECTION("ToastClickDismissesWithInboxLink") {
        PopupContent popup;
        popup.inboxId = 12;
        Window window = MakeWindow("Incoming Mail", Rectangle{0, 0, 350, 80}, std::move(popup));
        const WindowAction action = HandleContentClick(window, Vector2{100, 60});
        REQUIRE(action.type == ActionType::DismissPopup);
        REQUIRE(action.inboxId == 12);
    }

    SECTION("LifetimeExpiryRequestsClose") {
        Window window = MakeWindow("Banner", Rectangle{0, 0, 600, 60}, PopupContent{PopupStyle::Milestone});
        window.lifetime = 3.0f;
        UpdateWindow(window, 2.9f);
        REQUIRE_FALSE(window.closeRequested);
        UpdateWindow(window, 0.2f);
        REQUIRE(window.closeRequested);
    }
}
