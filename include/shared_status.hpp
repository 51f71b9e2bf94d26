#pragma once
#include <mutex>

//authentication/readiness flags. any thread may read, only the session actor writes
class SharedStatus {
public:
    struct Snapshot {
        bool authenticated = false;
        bool ready = false;

        bool operator==(const Snapshot& o) const { return authenticated == o.authenticated && ready == o.ready; }
    };

    Snapshot snapshot() const {
        std::lock_guard<std::mutex> lk(m_);
        return s_;
    }

    bool is_ready() const {
        std::lock_guard<std::mutex> lk(m_);
        return s_.ready;
    }

    bool is_authenticated() const {
        std::lock_guard<std::mutex> lk(m_);
        return s_.authenticated;
    }

    void set_authenticated(bool v) {
        std::lock_guard<std::mutex> lk(m_);
        s_.authenticated = v;
    }

    void set(bool authenticated, bool ready) {
        std::lock_guard<std::mutex> lk(m_);
        s_.authenticated = authenticated;
        s_.ready = ready;
    }

    void reset() { set(false, false); }

private:
    mutable std::mutex m_;
    Snapshot s_;
};
