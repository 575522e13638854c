#include "serial_gateway.hpp"

SerialGateway::SerialGateway() {
    worker_ = std::jthread([this] { run(); });
    worker_id_ = worker_.get_id();
}

SerialGateway::~SerialGateway() {
    shutdown();
    join();
}

bool SerialGateway::post(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void SerialGateway::shutdown() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void SerialGateway::join() {
    if (on_worker_thread()) return;

    std::lock_guard lock(join_mutex_);
    if (worker_.joinable()) {
        worker_.join();
        worker_id_ = std::thread::id{};
    }
}

bool SerialGateway::is_shut_down() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t SerialGateway::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

bool SerialGateway::on_worker_thread() const {
    return std::this_thread::get_id() == worker_id_.load();
}

void SerialGateway::run() {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return; // closed and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}
