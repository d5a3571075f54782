#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

inline constexpr const char *ChannelRegularEmail = "regular";
inline constexpr const char *ChannelCongratulation = "congratulatory";
inline constexpr const char *ChannelPhone = "phone";
inline constexpr const char *ChannelMessages = "messages";
inline constexpr const char *ChannelDiscord = "discord";
inline constexpr const char *ChannelSlack = "slack";
inline constexpr const char *ChannelActivity = "activity";

struct EmailTemplate
{
    std::string sender;
    std::string subject;
    std::string message;
    std::vector<std::string> responses;
};

enum class Speaker
{
    Caller,
    Player
};

struct PhoneTurn
{
    Speaker speaker = Speaker::Caller;
    std::string text;
};

struct PhoneScript
{
    std::string callerName;
    std::string callerNumber;
    std::vector<PhoneTurn> turns;
};

struct ChatLine
{
    std::string contact;
    std::string text;
};

// Read-only after startup. Lookups with an index outside a channel return the
// channel's placeholder entry instead of failing.
class ContentStore
{
public:
    static ContentStore BuiltIn();

    // Replace the email channels with the document at path. On a missing or
    // malformed document the current channels are kept and false is returned.
    bool LoadEmails(const std::string &path);
    bool LoadPhoneCalls(const std::string &path);

    void SetEmailChannel(const std::string &channel, std::vector<EmailTemplate> emails);
    void SetPhoneScripts(std::vector<PhoneScript> scripts);
    void SetChatChannel(const std::string &channel, std::vector<ChatLine> lines);

    size_t ChannelSize(const std::string &channel) const;

    const EmailTemplate &Email(const std::string &channel, int index) const;
    const PhoneScript &Phone(int index) const;
    const ChatLine &Chat(const std::string &channel, int index) const;
    const std::string &Activity(int index) const;
    const std::vector<ChatLine> &ChatChannel(const std::string &channel) const;

    static const EmailTemplate &PlaceholderEmail();
    static const PhoneScript &PlaceholderPhoneScript();
    static const ChatLine &PlaceholderChat();

private:
    std::map<std::string, std::vector<EmailTemplate>> emails_;
    std::vector<PhoneScript> phoneScripts_;
    std::map<std::string, std::vector<ChatLine>> chat_;
    std::vector<std::string> activities_;
};

std::vector<PhoneTurn> DefaultConversation();
