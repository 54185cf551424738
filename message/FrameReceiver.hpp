/**
 * \file message/FrameReceiver.hpp
 * \brief Reads one complete frame from a connection.
 * \ingroup message_module
 */
#pragma once

#include "message/Frame.hpp"
#include "cancellation.hpp"

#include <cstddef>

namespace transport { struct IConnection; }

namespace FrameMessenger::Messaging {

/**
 * \brief Blocking frame reader.
 * \ingroup message_module
 *
 * Stateless apart from its size limit, so one receiver may serve many
 * connections. A frame is returned only once its header and the full payload
 * have arrived; a read interrupted part-way discards what was read.
 */
class FrameReceiver {
public:
    explicit FrameReceiver(std::size_t max_payload_size = Frame::kDefaultMaxPayloadSize)
        : max_payload_size_(max_payload_size) {}

    /**
     * \brief Block until one whole frame has been read.
     * \throws std::system_error with a transport_errc code:
     *  `connection_closed` (end of stream, including mid-frame),
     *  `cancelled`, `protocol_error` (negative length),
     *  `frame_too_large` (length above max_payload_size()),
     *  `io_error` (any other failure; the message carries the OS error text).
     */
    [[nodiscard]] Frame receive(transport::IConnection& connection, const CancellationToken& cancel = {}) const;

    [[nodiscard]] std::size_t max_payload_size() const noexcept { return max_payload_size_; }

private:
    std::size_t max_payload_size_;
};

} // namespace FrameMessenger::Messaging
