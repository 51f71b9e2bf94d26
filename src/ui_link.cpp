#include "../include/ui_link.hpp"

#include <atomic>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

class Client;

// what a connection needs from the server, kept narrow so Client doesn't see Impl
struct ClientHost {
    virtual ~ClientHost() = default;
    virtual void deliver(UiFrame frame) = 0;
    virtual void forget(uint64_t id) = 0;
    virtual std::string greeting() = 0;
};

//one connected shell. lives on the io thread, kept alive by its pending handlers
class Client : public std::enable_shared_from_this<Client> {
public:
    Client(uint64_t id, tcp::socket sock, ClientHost& host, std::size_t max_frame)
        : id_(id), ws_(std::move(sock)), host_(host), max_frame_(max_frame) {}

    uint64_t id() const { return id_; }

    void open() {
        ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(ws::stream_base::decorator([](ws::response_type& res) {
            res.set(http::field::server, "msgbridge");
        }));
        ws_.read_message_max(max_frame_);
        ws_.async_accept(beast::bind_front_handler(&Client::on_handshake, shared_from_this()));
    }

    // queue a frame, writes go out one at a time in order
    void push(std::string text) {
        pending_.push_back(std::move(text));
        if (pending_.size() == 1) write_next();
    }

    void kill() {
        beast::error_code ec;
        ws_.next_layer().shutdown(tcp::socket::shutdown_both, ec);
        ws_.next_layer().close(ec);
    }

private:
    void on_handshake(beast::error_code ec) {
        if (ec) return drop("handshake", ec);
        std::cout << "[UI LINK] client " << id_ << " connected" << std::endl;

        std::string hello = host_.greeting();
        if (!hello.empty()) push(std::move(hello));
        read_next();
    }

    void read_next() {
        ws_.async_read(in_, beast::bind_front_handler(&Client::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == ws::error::closed) {
            std::cout << "[UI LINK] client " << id_ << " left" << std::endl;
            host_.forget(id_);
            return;
        }
        if (ec) return drop("read", ec);

        if (!ws_.got_text()) {
            std::cerr << "[UI LINK] client " << id_ << " sent a binary frame, ignored" << std::endl;
        } else {
            host_.deliver(UiFrame{id_, beast::buffers_to_string(in_.data())});
        }
        in_.consume(in_.size());
        read_next();
    }

    void write_next() {
        ws_.text(true);
        ws_.async_write(asio::buffer(pending_.front()),
                        beast::bind_front_handler(&Client::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return drop("write", ec);
        pending_.pop_front();
        if (!pending_.empty()) write_next();
    }

    void drop(const char* what, beast::error_code ec) {
        std::cerr << "[UI LINK] client " << id_ << " " << what << ": " << ec.message() << std::endl;
        host_.forget(id_);
    }

    uint64_t id_;
    ws::stream<tcp::socket> ws_;
    ClientHost& host_;
    std::size_t max_frame_;
    beast::flat_buffer in_;
    std::deque<std::string> pending_;
};

} // namespace

struct UiLink::Impl : ClientHost {
    TSQueue<UiFrame>& inbox;
    GreetingFn greeting_fn;

    asio::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread th;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> bound_port{0};
    std::size_t max_frame = 0;

    mutable std::mutex clients_mx;
    std::unordered_map<uint64_t, std::shared_ptr<Client>> clients;
    uint64_t next_id = 1;   // io thread only

    explicit Impl(TSQueue<UiFrame>& q) : inbox(q) {}
    ~Impl() override { stop(); }

    bool start(const UiLinkConfig& cfg) {
        if (running) return true;
        max_frame = cfg.max_frame_bytes;

        try {
            tcp::endpoint ep(asio::ip::make_address(cfg.address), cfg.port);
            acceptor = std::make_unique<tcp::acceptor>(ioc, ep);
            bound_port = acceptor->local_endpoint().port();
        } catch (const std::exception& e) {
            std::cerr << "[UI LINK] cannot listen on " << cfg.address << ":" << cfg.port
                      << ": " << e.what() << std::endl;
            acceptor.reset();
            return false;
        }

        running = true;
        accept_next();
        th = std::thread([this] {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                std::cerr << "[UI LINK] io thread stopped: " << e.what() << std::endl;
            }
        });

        std::cout << "[UI LINK] listening on ws://" << cfg.address << ":" << bound_port << "/" << std::endl;
        return true;
    }

    void stop() {
        if (!running.exchange(false)) return;

        asio::post(ioc, [this] {
            beast::error_code ec;
            if (acceptor) {
                acceptor->close(ec);
                acceptor.reset();
            }
            std::lock_guard<std::mutex> lk(clients_mx);
            for (auto& [id, c] : clients) c->kill();
            clients.clear();
        });
        // queued behind the close above, leftover handlers die with the context
        asio::post(ioc, [this] { ioc.stop(); });
        if (th.joinable()) th.join();
    }

    void accept_next() {
        acceptor->async_accept([this](beast::error_code ec, tcp::socket sock) {
            if (!acceptor) return;
            if (ec) {
                std::cerr << "[UI LINK] accept: " << ec.message() << std::endl;
            } else {
                auto c = std::make_shared<Client>(next_id++, std::move(sock), *this, max_frame);
                {
                    std::lock_guard<std::mutex> lk(clients_mx);
                    clients.emplace(c->id(), c);
                }
                c->open();
            }
            if (running) accept_next();
        });
    }

    // ClientHost, all called on the io thread
    void deliver(UiFrame frame) override {
        if (!inbox.push_nowait(std::move(frame)))
            std::cerr << "[UI LINK] request dropped, inbox closed" << std::endl;
    }

    void forget(uint64_t id) override {
        std::lock_guard<std::mutex> lk(clients_mx);
        clients.erase(id);
    }

    std::string greeting() override { return greeting_fn ? greeting_fn() : std::string(); }

    std::shared_ptr<Client> find(uint64_t id) {
        std::lock_guard<std::mutex> lk(clients_mx);
        auto it = clients.find(id);
        return it == clients.end() ? nullptr : it->second;
    }
};

UiLink::UiLink(TSQueue<UiFrame>& inbox) : impl_(std::make_unique<Impl>(inbox)) {}
UiLink::~UiLink() = default;

void UiLink::set_greeting(GreetingFn fn) { impl_->greeting_fn = std::move(fn); }

bool UiLink::start(const UiLinkConfig& cfg) { return impl_->start(cfg); }
void UiLink::stop() { impl_->stop(); }

//reply for one client. a client that has gone away in the meantime is skipped
void UiLink::send_to(uint64_t client, std::string text) {
    asio::post(impl_->ioc, [impl = impl_.get(), client, text = std::move(text)]() mutable {
        if (auto c = impl->find(client)) c->push(std::move(text));
    });
}

void UiLink::broadcast(std::string text) {
    asio::post(impl_->ioc, [impl = impl_.get(), text = std::move(text)] {
        std::vector<std::shared_ptr<Client>> all;
        {
            std::lock_guard<std::mutex> lk(impl->clients_mx);
            for (auto& [id, c] : impl->clients) all.push_back(c);
        }
        for (auto& c : all) c->push(text);
    });
}

uint16_t UiLink::port() const { return impl_->bound_port.load(); }

std::size_t UiLink::clients() const {
    std::lock_guard<std::mutex> lk(impl_->clients_mx);
    return impl_->clients.size();
}
