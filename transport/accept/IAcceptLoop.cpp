#include "IAcceptLoop.hpp"
#include "logger.hpp"

#include <exception>

namespace transport {

void deliver_connection(const std::shared_ptr<IConnection>& connection, const SocketConfiguration& config,
                        const ClientConnectedHandler& on_connected,
                        const ClientDisconnectedHandler& on_disconnected,
                        const std::shared_ptr<Logger>& logger, const std::string& component) {
    if (on_disconnected) {
        // Weak: the notifier lives inside the connection.
        std::weak_ptr<IConnection> weak = connection;
        connection->on_disconnected([weak, on_disconnected, logger, component]() {
            auto strong = weak.lock();
            if (!strong) return;
            try {
                on_disconnected(strong);
            } catch (const std::exception& e) {
                if (logger) logger->error(component + ": disconnect handler threw: " + e.what());
            } catch (...) {
                if (logger) logger->error(component + ": disconnect handler threw an unknown exception");
            }
        });
    }

    if (on_connected) {
        try {
            on_connected(connection, config);
        } catch (const std::exception& e) {
            if (logger) logger->error(component + ": connect handler threw: " + e.what());
        } catch (...) {
            if (logger) logger->error(component + ": connect handler threw an unknown exception");
        }
    }
}

} // namespace transport
