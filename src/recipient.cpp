#include "../include/recipient.hpp"

#include <algorithm>
#include <iterator>

std::string normalize_recipient(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    std::copy_if(raw.begin(), raw.end(), std::back_inserter(out),
                 [](char c){ return c != '+' && c != ' ' && c != '-'; });
    return out;
}

Jid make_user_jid(const std::string& raw) {
    return Jid{normalize_recipient(raw), kUserServer};
}
