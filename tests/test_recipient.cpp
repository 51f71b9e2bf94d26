#include <catch2/catch.hpp>

#include "recipient.hpp"

TEST_CASE("recipient numbers lose '+', spaces and dashes", "[recipient]") {
    CHECK(normalize_recipient("+1 555-0100") == "15550100");
    CHECK(normalize_recipient("44 20-7946 0958") == "442079460958");
    CHECK(normalize_recipient("15550100") == "15550100");
    CHECK(normalize_recipient("") == "");
}

TEST_CASE("other characters are left alone", "[recipient]") {
    CHECK(normalize_recipient("(555) 0100") == "(555)0100");
}

TEST_CASE("user jid uses the messaging server domain", "[recipient]") {
    Jid jid = make_user_jid("+1 555-0100");
    CHECK(jid.user == "15550100");
    CHECK(jid.server == "s.whatsapp.net");
    CHECK(jid.str() == "15550100@s.whatsapp.net");
}
