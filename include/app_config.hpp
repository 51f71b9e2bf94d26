#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

struct AppConfig {
    std::string data_dir;                 // holds the session store, see store_path()
    std::string bind_address = "127.0.0.1";
    uint16_t    port = 9002;              // websocket port for the ui
    std::size_t command_capacity = 32;
    long        reply_timeout_ms = 0;     // 0 = wait for the session forever
    bool        debug = false;
    bool        help = false;

    std::string store_path() const { return data_dir + "/session.db"; }

    bool validate() const {
        if (data_dir.empty()) return false;
        if (port == 0) return false;
        if (command_capacity == 0) return false;
        if (reply_timeout_ms < 0) return false;
        return true;
    }
};

// fills cfg from argv, false + error text on a bad or unknown option
bool parse_args(int argc, char* argv[], AppConfig& cfg, std::string& error);

// $HOME/.local/share/msgbridge, or ./msgbridge-data when HOME is unset
std::string default_data_dir();
