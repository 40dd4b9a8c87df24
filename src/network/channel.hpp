#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <glog/logging.h>
#include <boost/asio.hpp>
#include <memory>
#include <random>

#include "../core/message.hpp"

class Sender;

class IChannel {
public:
    virtual void set_handler(std::function<void(Message)>) = 0;
    virtual Sender get_sender() = 0;
    // false if the channel no longer accepts messages
    virtual bool send(Message) = 0;
    virtual void handle_messages() = 0;
    virtual void stop() = 0;
    virtual void set_timer(std::chrono::milliseconds, std::function<void()>) = 0;
    virtual void post(std::function<void()>) = 0;
    virtual ~IChannel() = default;

public:
    constexpr static auto default_handler = [](Message) { return; };

    std::function<void(Message)> handler_{default_handler};

    std::atomic<bool> is_stopped_{false};
};


class Sender {
public:
    Sender(IChannel& channel) : channel_(channel) {
    }

    bool send(Message msg) {
        return channel_.send(std::move(msg));
    }

private:
    IChannel& channel_;
};

//////////////////////////////////////////// TimerChannel ///////////////////////////////////////////////

namespace asio = boost::asio;

/*  Inbox of one node. Messages, timers and posted tasks all run on the
    io_context, which is driven by a single thread in handle_messages(). */
class TimerChannel : public IChannel {
public:
    explicit TimerChannel(std::chrono::microseconds avg_delay = DEFAULT_DELAY)
        : avg_delay_(avg_delay), ctx_(1), ctx_guard_(make_work_guard(ctx_)) {
    }

    TimerChannel(const TimerChannel&) = delete;
    TimerChannel& operator=(const TimerChannel&) = delete;

    TimerChannel(TimerChannel&&) = delete;
    TimerChannel& operator=(TimerChannel&&) = delete;

    void set_handler(std::function<void(Message)> handler) override {
        handler_ = handler;
    }

    Sender get_sender() override {
        return Sender(*this);
    }

    bool send(Message msg) override {
        if (is_stopped_) {
            return false;
        }

        auto timer = std::make_shared<asio::steady_timer>(ctx_);
        timer->expires_after(get_delay());
        timer->async_wait([this, timer, msg = std::move(msg)] (const boost::system::error_code& ec) {
            if (ec || this->is_stopped_) {
                return;
            }

            handler_(msg);
        });
        return true;
    }

    void handle_messages() override {
        ctx_.run();
    }

    void stop() override {
        this->is_stopped_ = true;
        ctx_guard_.reset();
        ctx_.stop();
    }

    void set_timer(std::chrono::milliseconds timeout, std::function<void()> handler) override {
        auto timer = std::make_shared<asio::steady_timer>(ctx_);
        timer->expires_after(timeout);
        timer->async_wait([timer, handler = std::move(handler)] (const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            handler();
        });
    }

    void post(std::function<void()> task) override {
        asio::post(ctx_, std::move(task));
    }

private:
    std::chrono::microseconds get_delay() const {
        if (avg_delay_.count() == 0) {
            return avg_delay_;
        }

        // senders call this from their own threads
        thread_local std::mt19937 gen = std::mt19937(std::random_device()());
        auto rand_engine = std::uniform_int_distribution<int64_t>(
            avg_delay_.count() - avg_delay_.count() / 2,
            avg_delay_.count() + avg_delay_.count() / 2
        );
        return std::chrono::microseconds(rand_engine(gen));
    }

private:
    static constexpr std::chrono::microseconds DEFAULT_DELAY{1000};

    std::chrono::microseconds avg_delay_;
    asio::io_context ctx_;
    asio::executor_work_guard<asio::io_context::executor_type> ctx_guard_;
};
