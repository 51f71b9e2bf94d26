#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include "commands.hpp"
#include "events.hpp"
#include "tsqueue.hpp"

//backend's run has finished, the connection is gone
struct RunFinished {
    std::string reason;
};

//everything the actor loop can be woken by. events and commands share one mailbox,
//so waiting on "whichever comes first" is a single pop
using ActorInput = std::variant<InboundEvent, Command, RunFinished>;
using Mailbox = TSQueue<ActorInput>;

//caller side handle onto the actor's mailbox. copies share one token, when the last
//copy goes away the mailbox is closed and the actor sees "no more senders"
class CommandSender {
public:
    CommandSender() = default;
    explicit CommandSender(std::shared_ptr<Mailbox> mailbox);

    // blocks while the mailbox is full. false if the actor has stopped taking commands
    bool send(Command cmd) const;

    bool valid() const { return token_ != nullptr; }
    explicit operator bool() const { return valid(); }

private:
    struct Token {
        std::shared_ptr<Mailbox> mailbox;
        ~Token() { if (mailbox) mailbox->close(); }
    };
    std::shared_ptr<Token> token_;
};

std::shared_ptr<Mailbox> make_mailbox(std::size_t command_capacity);
