/**
 * \file VirtualTransportRegistry.cpp
 * \brief Endpoint directory for the in-process transport.
 * \ingroup virtual_backend
 */
#include "VirtualTransportRegistry.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"

namespace transport {

VirtualTransportRegistry::VirtualTransportRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

VirtualTransportRegistry& VirtualTransportRegistry::instance() {
    static VirtualTransportRegistry registry;
    return registry;
}

std::shared_ptr<VirtualTransportRegistry::PendingQueue>
VirtualTransportRegistry::register_accepter(const Endpoint& endpoint) {
    if (!endpoint.is_virtual()) {
        throw_transport_error(transport_errc::invalid_transport,
                              "register_accepter: " + endpoint.to_string() + " is not a virtual endpoint");
    }
    auto queue = std::make_shared<PendingQueue>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepters_.emplace(endpoint, queue).second) {
            throw_transport_error(transport_errc::already_registered,
                                  "register_accepter: " + endpoint.to_string());
        }
    }
    if (logger_) logger_->debug("VirtualTransportRegistry: accepter registered on " + endpoint.to_string());
    return queue;
}

std::shared_ptr<VirtualConnection> VirtualTransportRegistry::connect(const Endpoint& endpoint) {
    if (!endpoint.is_virtual()) {
        throw_transport_error(transport_errc::invalid_transport,
                              "connect: " + endpoint.to_string() + " is not a virtual endpoint");
    }
    std::shared_ptr<PendingQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accepters_.find(endpoint);
        if (it != accepters_.end()) queue = it->second;
    }
    if (!queue) {
        throw_transport_error(transport_errc::not_listening, "connect: " + endpoint.to_string());
    }

    auto [connector, accepter] = VirtualConnection::create_pair(endpoint, logger_);
    if (!queue->push(accepter)) {
        // Unregistered between the lookup and the hand-off.
        throw_transport_error(transport_errc::not_listening, "connect: " + endpoint.to_string());
    }
    return connector;
}

bool VirtualTransportRegistry::unregister_accepter(const Endpoint& endpoint) {
    std::shared_ptr<PendingQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accepters_.find(endpoint);
        if (it == accepters_.end()) return false;
        queue = std::move(it->second);
        accepters_.erase(it);
    }
    queue->shutdown();
    while (auto orphan = queue->try_pop()) {
        (*orphan)->close();
    }
    if (logger_) logger_->debug("VirtualTransportRegistry: accepter removed from " + endpoint.to_string());
    return true;
}

bool VirtualTransportRegistry::is_registered(const Endpoint& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepters_.count(endpoint) != 0;
}

std::vector<Endpoint> VirtualTransportRegistry::registered_endpoints() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Endpoint> out;
    out.reserve(accepters_.size());
    for (const auto& entry : accepters_) out.push_back(entry.first);
    return out;
}

} // namespace transport
