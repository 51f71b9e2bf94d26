#include "../include/command_channel.hpp"

CommandSender::CommandSender(std::shared_ptr<Mailbox> mailbox)
    : token_(std::make_shared<Token>()) {
    token_->mailbox = std::move(mailbox);
}

bool CommandSender::send(Command cmd) const {
    if (!token_ || !token_->mailbox) return false;
    return token_->mailbox->push(ActorInput{std::move(cmd)});
}

std::shared_ptr<Mailbox> make_mailbox(std::size_t command_capacity) {
    return std::make_shared<Mailbox>(command_capacity);
}
