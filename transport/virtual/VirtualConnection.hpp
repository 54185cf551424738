/**
 * \file VirtualConnection.hpp
 * \brief In-process IConnection: two ends joined by a pair of byte-chunk queues.
 * \ingroup virtual_backend
 */
#pragma once

#include "transport/connection/IConnection.hpp"
#include "transport/connection/DisconnectNotifier.hpp"
#include "threadSafeQueue.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

class Logger;

namespace transport {

/**
 * \brief One end of an in-memory duplex byte stream.
 * \ingroup virtual_backend
 * \details Every write() becomes one chunk on the peer's inbound queue; read()
 * hands chunks out across calls, so byte order is preserved regardless of how
 * writes and reads are sized. Closing either end shuts both queues down: the
 * peer still drains what was written before, then sees `connection_closed`.
 */
class VirtualConnection : public IConnection {
public:
    using ChunkQueue = ThreadSafeQueue<std::vector<std::uint8_t>>;

    /** \brief Ends returned by create_pair(): `first` connects, `second` is accepted. */
    using Pair = std::pair<std::shared_ptr<VirtualConnection>, std::shared_ptr<VirtualConnection>>;

    VirtualConnection(Endpoint endpoint, std::string local_name, std::string remote_name,
                      std::shared_ptr<ChunkQueue> inbound, std::shared_ptr<ChunkQueue> outbound,
                      std::shared_ptr<Logger> logger = nullptr);

    ~VirtualConnection() override;

    VirtualConnection(const VirtualConnection&) = delete;
    VirtualConnection& operator=(const VirtualConnection&) = delete;

    /** \brief Build two connected ends for \p endpoint. */
    static Pair create_pair(const Endpoint& endpoint, std::shared_ptr<Logger> logger = nullptr);

    // IConnection
    void read(void* buffer, std::size_t size, std::size_t& bytes_read,
              std::error_code& error, const CancellationToken& cancel) override;
    void write(const void* buffer, std::size_t size, std::size_t& bytes_written,
               std::error_code& error) override;
    void close() override;
    bool is_open() const override;
    void on_disconnected(std::function<void()> callback) override;
    const Endpoint& endpoint() const override { return endpoint_; }
    std::string local_endpoint() const override { return local_name_; }
    std::string remote_endpoint() const override { return remote_name_; }
    std::string transport_name() const override { return "virtual"; }

    /** \brief Chunks written by the peer and not yet taken by read(). */
    std::size_t pending_chunks() const { return inbound_->size(); }

private:
    void mark_disconnected();

    const Endpoint endpoint_;
    const std::string local_name_;
    const std::string remote_name_;
    std::shared_ptr<ChunkQueue> inbound_;
    std::shared_ptr<ChunkQueue> outbound_;
    std::shared_ptr<Logger> logger_;
    DisconnectNotifier disconnect_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> peer_closed_{false};

    std::mutex read_mutex_;
    std::vector<std::uint8_t> current_;
    std::size_t offset_{0};
};

} // namespace transport
