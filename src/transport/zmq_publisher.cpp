#include "transport/zmq_publisher.h"

#include "logging/logger.h"

#include <zmq.hpp>

namespace show_ingest::transport {

struct ZmqPublisher::Impl {
    zmq::context_t context{1};
    std::unique_ptr<zmq::socket_t> pubSocket;
    std::string endpoint;
};

ZmqPublisher::ZmqPublisher() : impl_(std::make_unique<Impl>()) {}

ZmqPublisher::~ZmqPublisher() {
    close();
}

bool ZmqPublisher::shouldBind(const std::string& endpoint) {
    if (endpoint.find("ipc://") == 0 || endpoint.find("inproc://") == 0) {
        return true;
    }
    return endpoint.find("://*") != std::string::npos;
}

bool ZmqPublisher::initialize(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    try {
        impl_->endpoint = endpoint;
        impl_->pubSocket = std::make_unique<zmq::socket_t>(impl_->context, zmq::socket_type::pub);
        impl_->pubSocket->set(zmq::sockopt::linger, 0);
        if (shouldBind(endpoint)) {
            impl_->pubSocket->bind(endpoint);
            LOG_INFO("[ZMQ] PUB socket bound on {}", endpoint);
        } else {
            impl_->pubSocket->connect(endpoint);
            LOG_INFO("[ZMQ] PUB socket connected to {}", endpoint);
        }
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("[ZMQ] PUB init error on {}: {}", endpoint, e.what());
        impl_->pubSocket.reset();
        return false;
    }
}

void ZmqPublisher::close() {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (impl_ && impl_->pubSocket) {
        impl_->pubSocket->close();
        impl_->pubSocket.reset();
        LOG_INFO("[ZMQ] PUB socket closed");
    }
}

bool ZmqPublisher::publish(const std::string& subject, const std::string& payload) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!impl_->pubSocket) {
        return false;
    }

    try {
        auto first = impl_->pubSocket->send(zmq::buffer(subject),
                                            zmq::send_flags::sndmore | zmq::send_flags::dontwait);
        if (!first) {
            return false;
        }
        auto second = impl_->pubSocket->send(zmq::buffer(payload), zmq::send_flags::dontwait);
        return second.has_value();
    } catch (const zmq::error_t& e) {
        LOG_ERROR("[ZMQ] PUB error: {}", e.what());
        return false;
    }
}

}  // namespace show_ingest::transport
