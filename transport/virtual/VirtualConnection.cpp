/**
 * \file VirtualConnection.cpp
 * \brief Queue-backed in-process connection.
 * \ingroup virtual_backend
 */
#include "VirtualConnection.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstring>

namespace transport {

VirtualConnection::VirtualConnection(Endpoint endpoint, std::string local_name, std::string remote_name,
                                     std::shared_ptr<ChunkQueue> inbound, std::shared_ptr<ChunkQueue> outbound,
                                     std::shared_ptr<Logger> logger)
    : endpoint_(std::move(endpoint)),
      local_name_(std::move(local_name)),
      remote_name_(std::move(remote_name)),
      inbound_(std::move(inbound)),
      outbound_(std::move(outbound)),
      logger_(logger),
      disconnect_(logger) {}

VirtualConnection::~VirtualConnection() {
    // The peer must not wait forever on an end nobody holds any more.
    inbound_->shutdown();
    outbound_->shutdown();
}

VirtualConnection::Pair VirtualConnection::create_pair(const Endpoint& endpoint, std::shared_ptr<Logger> logger) {
    auto to_accepter = std::make_shared<ChunkQueue>();
    auto to_connector = std::make_shared<ChunkQueue>();
    const std::string base = endpoint.to_string();
    auto connector = std::make_shared<VirtualConnection>(endpoint, base + "#connector", base + "#accepter",
                                                         to_connector, to_accepter, logger);
    auto accepter = std::make_shared<VirtualConnection>(endpoint, base + "#accepter", base + "#connector",
                                                        to_accepter, to_connector, logger);
    return {connector, accepter};
}

void VirtualConnection::read(void* buffer, std::size_t size, std::size_t& bytes_read,
                             std::error_code& error, const CancellationToken& cancel) {
    bytes_read = 0;
    error.clear();
    std::lock_guard<std::mutex> lock(read_mutex_);
    if (closed_.load()) {
        error = make_error_code(transport_errc::connection_closed);
        return;
    }
    while (offset_ >= current_.size()) {
        if (cancel.is_cancelled()) {
            error = make_error_code(transport_errc::cancelled);
            return;
        }
        auto chunk = inbound_->pop(cancel);
        if (!chunk) {
            if (cancel.is_cancelled()) {
                error = make_error_code(transport_errc::cancelled);
                return;
            }
            peer_closed_ = true;
            error = make_error_code(transport_errc::connection_closed);
            mark_disconnected();
            return;
        }
        current_ = std::move(*chunk);
        offset_ = 0;
    }
    const std::size_t n = std::min(size, current_.size() - offset_);
    std::memcpy(buffer, current_.data() + offset_, n);
    offset_ += n;
    bytes_read = n;
}

void VirtualConnection::write(const void* buffer, std::size_t size, std::size_t& bytes_written,
                              std::error_code& error) {
    bytes_written = 0;
    error.clear();
    if (closed_.load()) {
        error = make_error_code(transport_errc::connection_closed);
        return;
    }
    if (size == 0) return;
    const auto* bytes = static_cast<const std::uint8_t*>(buffer);
    if (!outbound_->push(std::vector<std::uint8_t>(bytes, bytes + size))) {
        // Peer closed: same outcome as writing into a reset socket.
        peer_closed_ = true;
        error = make_error_code(transport_errc::connection_closed);
        mark_disconnected();
        return;
    }
    bytes_written = size;
}

void VirtualConnection::close() {
    if (closed_.exchange(true)) return;
    inbound_->shutdown();
    outbound_->shutdown();
    if (logger_) logger_->debug("VirtualConnection: closed " + local_name_);
    mark_disconnected();
}

bool VirtualConnection::is_open() const {
    return !closed_.load() && !peer_closed_.load();
}

void VirtualConnection::on_disconnected(std::function<void()> callback) {
    disconnect_.subscribe(std::move(callback));
}

void VirtualConnection::mark_disconnected() {
    if (disconnect_.fire() && logger_) {
        logger_->debug("VirtualConnection: disconnected " + local_name_);
    }
}

} // namespace transport
