#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

/**
 * \brief Process-wide option registry backed by CLI11 and a JSON config file.
 * \details Modules register a Provider (usually from a static auto-registration
 * object in their options .cpp). load_and_parse() reads `-c/--config` first,
 * hands the parsed JSON to every provider so it can seed defaults, and then
 * parses the command line, which overrides the file.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();

private:
    static std::mutex& providers_mutex();
};

} // namespace shared_opts
