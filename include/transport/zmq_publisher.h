#pragma once

#include "transport/publisher.h"

#include <memory>
#include <mutex>
#include <string>

namespace show_ingest::transport {

// ZeroMQ PUB socket sending two-frame messages [subject, payload].
// Endpoints with a wildcard host ("tcp://*:5556") or ipc:// are bound,
// anything else is connected to.
class ZmqPublisher : public Publisher {
   public:
    ZmqPublisher();
    ~ZmqPublisher() override;

    ZmqPublisher(const ZmqPublisher&) = delete;
    ZmqPublisher& operator=(const ZmqPublisher&) = delete;

    bool initialize(const std::string& endpoint);
    void close();

    bool publish(const std::string& subject, const std::string& payload) override;

    const char* name() const override {
        return "zmq";
    }

    static bool shouldBind(const std::string& endpoint);

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::mutex sendMutex_;  // zmq sockets are not thread-safe
};

}  // namespace show_ingest::transport
