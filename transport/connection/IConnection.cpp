#include "IConnection.hpp"

#include <cstdint>

namespace transport {

std::size_t write_all(IConnection& connection, const void* buffer, std::size_t size,
                      std::error_code& error) {
    error.clear();
    const auto* bytes = static_cast<const std::uint8_t*>(buffer);
    std::size_t total = 0;
    while (total < size) {
        std::size_t written = 0;
        connection.write(bytes + total, size - total, written, error);
        if (error) return total;
        total += written;
    }
    return total;
}

std::size_t read_exact(IConnection& connection, void* buffer, std::size_t size,
                       std::error_code& error, const CancellationToken& cancel) {
    error.clear();
    auto* bytes = static_cast<std::uint8_t*>(buffer);
    std::size_t total = 0;
    while (total < size) {
        std::size_t n = 0;
        connection.read(bytes + total, size - total, n, error, cancel);
        if (error) return total;
        total += n;
    }
    return total;
}

} // namespace transport
