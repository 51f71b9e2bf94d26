#pragma once
#include <string>
#include "message_types.hpp"

// server part of every user address
inline constexpr const char* kUserServer = "s.whatsapp.net";

// drops '+', ' ' and '-' so "+1 555-0100" becomes "15550100"
std::string normalize_recipient(const std::string& raw);

Jid make_user_jid(const std::string& raw);
