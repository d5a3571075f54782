#include "content_store.h"

#include "raylib.h"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::vector<PhoneTurn> DefaultConversation()
{
    return {
        {Speaker::Caller, "Hey, how is the conference planning going?"},
        {Speaker::Player, "Great! I have been on it all day."},
        {Speaker::Caller, "Need a hand with anything?"},
        {Speaker::Player, "Nope, totally under control."},
        {Speaker::Caller, "Alright, keep it up!"},
    };
}

static std::vector<EmailTemplate> DefaultRegularEmails()
{
    return {
        {"conference@org.com", "Conference Planning Update",
         "Hi Matt, can you send over the latest planning numbers before Friday?",
         {"Sure thing.", "On it.", "Will do."}},
        {"finance@conference.org", "Budget Review Needed",
         "The budget sheet has a few cells in red. Could you take a look when you get a minute?",
         {"Looking now.", "Thanks for flagging.", "I'll check it."}},
        {"venue@conference.org", "Venue Confirmation",
         "Please confirm the room count for the second day so we can hold the space.",
         {"Confirmed.", "Let me double check.", "Thanks!"}},
    };
}

static std::vector<EmailTemplate> DefaultCongratulations()
{
    return {
        {"sponsors@conference.org", "Amazing fundraising progress",
         "Matt, the sponsorship numbers look fantastic. Calvelli's outreach has been outstanding!",
         {"Thank you!", "Calvelli has been working hard.", "We appreciate it."}},
        {"media@conference.org", "Media partnerships secured",
         "Calvelli got in touch and we are thrilled to partner on the conference. Great work!",
         {"Thanks!", "Calvelli is very professional.", "Excited to work with you."}},
        {"volunteers@conference.org", "Volunteer schedule looks great",
         "Every volunteer knows where to be. Calvelli sorted the whole rota in an afternoon.",
         {"Great to hear!", "Calvelli is very organized.", "Thanks for letting me know."}},
    };
}

static std::vector<PhoneScript> DefaultPhoneScripts()
{
    return {
        {"Michael Miske", "(555) 123-4567", DefaultConversation()},
        {"Jar", "(555) 345-6789", DefaultConversation()},
        {"Halle", "(555) 456-7890", DefaultConversation()},
        {"Anne", "(555) 789-0123", DefaultConversation()},
    };
}

static std::vector<ChatLine> DefaultMessages()
{
    return {
        {"seong-ah", "Hey Matt!"},
        {"jar", "How's the conference planning going?"},
        {"halle", "Can you check this?"},
        {"mama velli", "Call me when you have a second"},
        {"fleece", "Are you there?"},
        {"seong-ah", "Can you look at the schedule?"},
        {"jar", "Did you see my message?"},
        {"halle", "We need your input"},
    };
}

static std::vector<ChatLine> DefaultDiscord()
{
    return {
        {"calvelli", "Hey Matt, can you check the budget spreadsheet?"},
        {"calvelli", "Matt, did you send those emails yet?"},
        {"calvelli", "We need to update the sponsor list"},
        {"calvelli", "When are the donation forms going to be done?"},
        {"calvelli", "Can you look at the calendar? Meeting soon"},
        {"calvelli", "Matt, are you there? We need to discuss the conference"},
        {"calvelli", "Hey Matt, I need your help with something"},
        {"calvelli", "We're running out of time on this"},
    };
}

static std::vector<ChatLine> DefaultSlack()
{
    return {
        {"# general", "Reminder: all-hands moved to 3pm"},
        {"# conference-planning", "calvelli: venue contract signed"},
        {"# fundraising", "calvelli: two new sponsors this morning"},
        {"# random", "who took the good stapler"},
    };
}

static std::vector<std::string> DefaultActivities()
{
    return {
        "Calvelli secured a $5,000 sponsorship",
        "Calvelli finalized the venue booking",
        "Calvelli sent out 50 fundraising emails",
        "Calvelli updated the budget spreadsheet",
        "Calvelli confirmed 3 keynote speakers",
        "Calvelli organized the catering menu",
        "Calvelli set up the registration system",
        "Calvelli coordinated with 10 vendors",
        "Calvelli drafted the conference schedule",
        "Calvelli booked the AV equipment",
        "Calvelli arranged transportation logistics",
        "Calvelli prepared the welcome packets",
    };
}

ContentStore ContentStore::BuiltIn()
{
    ContentStore store;
    store.emails_[ChannelRegularEmail] = DefaultRegularEmails();
    store.emails_[ChannelCongratulation] = DefaultCongratulations();
    store.phoneScripts_ = DefaultPhoneScripts();
    store.chat_[ChannelMessages] = DefaultMessages();
    store.chat_[ChannelDiscord] = DefaultDiscord();
    store.chat_[ChannelSlack] = DefaultSlack();
    store.activities_ = DefaultActivities();
    return store;
}

static EmailTemplate ParseEmail(const json &j)
{
    EmailTemplate email;
    email.sender = j.value("sender", std::string{});
    email.subject = j.value("subject", std::string{});
    email.message = j.value("message", std::string{});
    if (j.contains("responses"))
    {
        email.responses = j.at("responses").get<std::vector<std::string>>();
    }
    return email;
}

bool ContentStore::LoadEmails(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TraceLog(LOG_WARNING, "CONTENT: could not open %s, using built-in emails", path.c_str());
        return false;
    }

    std::map<std::string, std::vector<EmailTemplate>> loaded;
    try
    {
        const auto j = json::parse(f);
        if (!j.is_object())
        {
            TraceLog(LOG_WARNING, "CONTENT: %s is not a channel map, using built-in emails", path.c_str());
            return false;
        }

        for (const auto &channel : j.items())
        {
            auto &list = loaded[channel.key()];
            for (const auto &record : channel.value())
            {
                list.push_back(ParseEmail(record));
            }
        }
    }
    catch (const json::exception &e)
    {
        TraceLog(LOG_WARNING, "CONTENT: parse error in %s: %s", path.c_str(), e.what());
        return false;
    }

    emails_ = std::move(loaded);
    TraceLog(LOG_INFO, "CONTENT: loaded %i email channels from %s", static_cast<int>(emails_.size()), path.c_str());
    return true;
}

bool ContentStore::LoadPhoneCalls(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TraceLog(LOG_WARNING, "CONTENT: could not open %s, using built-in callers", path.c_str());
        return false;
    }

    std::vector<PhoneScript> loaded;
    try
    {
        const auto j = json::parse(f);
        const json conversations = j.value("conversations", json::object());

        for (const auto &caller : j.at("callers"))
        {
            PhoneScript script;
            script.callerName = caller.at("name").get<std::string>();
            script.callerNumber = caller.value("number", std::string{});

            if (conversations.contains(script.callerName))
            {
                for (const auto &turn : conversations.at(script.callerName))
                {
                    const std::string speaker = turn.value("speaker", std::string{"caller"});
                    script.turns.push_back(PhoneTurn{
                        speaker == "player" ? Speaker::Player : Speaker::Caller,
                        turn.at("text").get<std::string>()});
                }
            }
            if (script.turns.empty())
            {
                script.turns = DefaultConversation();
            }
            loaded.push_back(std::move(script));
        }
    }
    catch (const json::exception &e)
    {
        TraceLog(LOG_WARNING, "CONTENT: parse error in %s: %s", path.c_str(), e.what());
        return false;
    }

    phoneScripts_ = std::move(loaded);
    TraceLog(LOG_INFO, "CONTENT: loaded %i callers from %s", static_cast<int>(phoneScripts_.size()), path.c_str());
    return true;
}

void ContentStore::SetEmailChannel(const std::string &channel, std::vector<EmailTemplate> emails)
{
    emails_[channel] = std::move(emails);
}

void ContentStore::SetPhoneScripts(std::vector<PhoneScript> scripts)
{
    phoneScripts_ = std::move(scripts);
}

void ContentStore::SetChatChannel(const std::string &channel, std::vector<ChatLine> lines)
{
    chat_[channel] = std::move(lines);
}

size_t ContentStore::ChannelSize(const std::string &channel) const
{
    if (channel == ChannelPhone)
    {
        return phoneScripts_.size();
    }
    if (channel == ChannelActivity)
    {
        return activities_.size();
    }

    const auto emailIt = emails_.find(channel);
    if (emailIt != emails_.end())
    {
        return emailIt->second.size();
    }
    const auto chatIt = chat_.find(channel);
    if (chatIt != chat_.end())
    {
        return chatIt->second.size();
    }
    return 0;
}

const EmailTemplate &ContentStore::Email(const std::string &channel, int index) const
{
    const auto it = emails_.find(channel);
    if (it == emails_.end() || index < 0 || static_cast<size_t>(index) >= it->second.size())
    {
        return PlaceholderEmail();
    }
    return it->second[static_cast<size_t>(index)];
}

const PhoneScript &ContentStore::Phone(int index) const
{
    if (index < 0 || static_cast<size_t>(index) >= phoneScripts_.size())
    {
        return PlaceholderPhoneScript();
    }
    return phoneScripts_[static_cast<size_t>(index)];
}

const ChatLine &ContentStore::Chat(const std::string &channel, int index) const
{
    const auto it = chat_.find(channel);
    if (it == chat_.end() || index < 0 || static_cast<size_t>(index) >= it->second.size())
    {
        return PlaceholderChat();
    }
    return it->second[static_cast<size_t>(index)];
}

const std::string &ContentStore::Activity(int index) const
{
    static const std::string placeholder = "Calvelli did something important";
    if (index < 0 || static_cast<size_t>(index) >= activities_.size())
    {
        return placeholder;
    }
    return activities_[static_cast<size_t>(index)];
}

const std::vector<ChatLine> &ContentStore::ChatChannel(const std::string &channel) const
{
    static const std::vector<ChatLine> empty;
    const auto it = chat_.find(channel);
    return it == chat_.end() ? empty : it->second;
}

const EmailTemplate &ContentStore::PlaceholderEmail()
{
    static const EmailTemplate email{
        "it-helpdesk@conference.org",
        "(no subject)",
        "This message could not be displayed.",
        {"OK"}};
    return email;
}

const PhoneScript &ContentStore::PlaceholderPhoneScript()
{
    static const PhoneScript script{"Unknown Caller", "(555) 000-0000", DefaultConversation()};
    return script;
}

const ChatLine &ContentStore::PlaceholderChat()
{
    static const ChatLine line{"unknown", "ping"};
    return line;
}
