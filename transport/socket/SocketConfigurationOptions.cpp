/**
 * \file SocketConfigurationOptions.cpp
 * \brief Options provider for socket timeouts and buffer sizes.
 * \ingroup socket_backend
 */
#include "SocketConfigurationOptions.hpp"
#include <options/Options.hpp>

#include <atomic>
#include <mutex>
#include <string>

namespace
{
    std::mutex g_socket_opts_mtx;
    int g_connect_timeout_ms = 5000;
    int g_send_timeout_ms = 5000;
    int g_receive_timeout_ms = 5000;
    int g_send_buffer_size = 65536;
    int g_receive_buffer_size = 65536;
    std::atomic<bool> g_socket_opts_registered{false};

    void read_int(const nlohmann::json& section, const char* key, int& out)
    {
        if (section.contains(key) && section[key].is_number_integer()) {
            out = section[key].get<int>();
        }
    }
}

namespace transport
{
    namespace socket_opts
    {
        void register_options()
        {
            bool expected = false;
            if (!g_socket_opts_registered.compare_exchange_strong(expected, true))
                return;
            shared_opts::Options::add_provider([](CLI::App &app, const nlohmann::json &j)
            {
                const auto defaults = SocketConfiguration::defaults();
                int connect_ms = static_cast<int>(defaults.connect_timeout.count());
                int send_ms = static_cast<int>(defaults.send_timeout.count());
                int receive_ms = static_cast<int>(defaults.receive_timeout.count());
                int send_buf = defaults.send_buffer_size;
                int receive_buf = defaults.receive_buffer_size;

                if (j.contains("socket") && j["socket"].is_object()) {
                    const auto& sj = j["socket"];
                    read_int(sj, "connect_timeout_ms", connect_ms);
                    read_int(sj, "send_timeout_ms", send_ms);
                    read_int(sj, "receive_timeout_ms", receive_ms);
                    read_int(sj, "send_buffer_size", send_buf);
                    read_int(sj, "receive_buffer_size", receive_buf);
                }

                {
                    std::lock_guard<std::mutex> lk(g_socket_opts_mtx);
                    g_connect_timeout_ms = connect_ms;
                    g_send_timeout_ms = send_ms;
                    g_receive_timeout_ms = receive_ms;
                    g_send_buffer_size = send_buf;
                    g_receive_buffer_size = receive_buf;
                }

                app.add_option("--socket-connect-timeout-ms", g_connect_timeout_ms,
                               "Connect timeout in ms, 0 = none (default 5000)")
                    ->check(CLI::NonNegativeNumber)->group("Sockets");
                app.add_option("--socket-send-timeout-ms", g_send_timeout_ms,
                               "Send timeout in ms, 0 = none (default 5000)")
                    ->check(CLI::NonNegativeNumber)->group("Sockets");
                app.add_option("--socket-receive-timeout-ms", g_receive_timeout_ms,
                               "Receive timeout in ms for node types that use one, 0 = none (default 5000)")
                    ->check(CLI::NonNegativeNumber)->group("Sockets");
                app.add_option("--socket-send-buffer-size", g_send_buffer_size,
                               "SO_SNDBUF in bytes (default 65536)")
                    ->check(CLI::Range(1024, 64 * 1024 * 1024))->group("Sockets");
                app.add_option("--socket-receive-buffer-size", g_receive_buffer_size,
                               "SO_RCVBUF in bytes (default 65536)")
                    ->check(CLI::Range(1024, 64 * 1024 * 1024))->group("Sockets");
            });
        }

        SocketConfiguration get_socket_configuration()
        {
            std::lock_guard<std::mutex> lk(g_socket_opts_mtx);
            SocketConfiguration config;
            config.connect_timeout = std::chrono::milliseconds(g_connect_timeout_ms);
            config.send_timeout = std::chrono::milliseconds(g_send_timeout_ms);
            config.receive_timeout = std::chrono::milliseconds(g_receive_timeout_ms);
            config.send_buffer_size = g_send_buffer_size;
            config.receive_buffer_size = g_receive_buffer_size;
            return config;
        }
    }
} // namespace transport::socket_opts

namespace
{
    struct SocketConfigurationOptsAutoReg
    {
        SocketConfigurationOptsAutoReg() { transport::socket_opts::register_options(); }
    } socket_configuration_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
