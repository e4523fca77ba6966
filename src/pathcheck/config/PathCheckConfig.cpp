#include <pathcheck/config/PathCheckConfig.hpp>

#include <pathcheck/log/TaggedLogSink.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

using json = nlohmann::json;
using PC::Error;
using PC::Expected;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto parse_truthy(char const* value) -> bool {
    std::string_view text{value};
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text)
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto readBool(json const& object, char const* key, bool& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end())
        return {};
    if (!it->is_boolean())
        return std::unexpected(malformed(std::string("\"") + key + "\" must be a boolean"));
    out = it->get<bool>();
    return {};
}

auto readString(json const& object, char const* key, std::optional<std::string>& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return {};
    if (!it->is_string())
        return std::unexpected(malformed(std::string("\"") + key + "\" must be a string"));
    out = it->get<std::string>();
    return {};
}

auto parseLogSection(json const& log, PC::PathCheckConfig& config) -> Expected<void> {
    if (!log.is_object())
        return std::unexpected(malformed("\"log\" must be an object"));

    if (auto file = readString(log, "file", config.logFile); !file)
        return file;

    std::optional<std::string> mode;
    if (auto read = readString(log, "mode", mode); !read)
        return read;
    if (mode) {
        if (*mode == "write")
            config.logMode = PC::LogFileMode::Write;
        else if (*mode == "append")
            config.logMode = PC::LogFileMode::Append;
        else
            return std::unexpected(malformed("\"log.mode\" must be \"write\" or \"append\", got \"" + *mode + "\""));
    }

    if (auto timestamp = readBool(log, "timestamp", config.logTimestamp); !timestamp)
        return timestamp;

    if (auto it = log.find("debug"); it != log.end()) {
        if (!it->is_number_integer())
            return std::unexpected(malformed("\"log.debug\" must be an integer"));
        config.debugLevel = it->get<int>();
    }
    return {};
}

} // namespace

namespace PC {

auto parseConfig(std::string_view text) -> Expected<PathCheckConfig> {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded())
        return std::unexpected(malformed("configuration is not valid JSON"));
    if (!payload.is_object())
        return std::unexpected(malformed("configuration must be a JSON object"));

    PathCheckConfig config;
    if (auto simulate = readBool(payload, "simulate", config.simulate); !simulate)
        return std::unexpected(simulate.error());
    if (auto backup = readString(payload, "backup", config.backup); !backup)
        return std::unexpected(backup.error());
    if (auto it = payload.find("log"); it != payload.end()) {
        if (auto log = parseLogSection(*it, config); !log)
            return std::unexpected(log.error());
    }
    return config;
}

auto loadConfig(std::filesystem::path const& path) -> Expected<PathCheckConfig> {
    std::ifstream file(path);
    if (!file.is_open())
        return std::unexpected(systemError("Failed to open configuration " + path.string()));
    std::ostringstream contents;
    contents << file.rdbuf();

    auto config = parseConfig(contents.str());
    if (!config)
        return std::unexpected(withContext(path.string(), config.error()));
    return config;
}

auto applyEnvironment(PathCheckConfig& config) -> void {
    if (char const* noaction = std::getenv("PATHCHECK_NOACTION"))
        config.simulate = parse_truthy(noaction);
    if (char const* backup = std::getenv("PATHCHECK_BACKUP"))
        config.backup = std::string(backup);
    if (char const* logFile = std::getenv("PATHCHECK_LOG_FILE"); logFile && *logFile)
        config.logFile = std::string(logFile);
    if (char const* debug = std::getenv("PATHCHECK_DEBUG")) {
        std::string_view text{debug};
        int              level = 0;
        auto const [ptr, ec]   = std::from_chars(text.data(), text.data() + text.size(), level);
        if (ec == std::errc{} && ptr == text.data() + text.size())
            config.debugLevel = level;
    }
}

auto makePathCheck(PathCheckConfig const& config) -> Expected<PathCheck> {
    std::shared_ptr<LogSink> sink;
    if (config.logFile) {
        FileLogOptions options;
        options.mode       = config.logMode;
        options.timestamp  = config.logTimestamp;
        options.debugLevel = config.debugLevel;
        auto file          = FileLogSink::open(*config.logFile, options);
        if (!file)
            return std::unexpected(file.error());
        sink = std::move(*file);
    } else {
        sink = std::make_shared<TaggedLogSink>(config.debugLevel);
    }

    PathCheck check(std::move(sink), config.simulate);
    check.setBackup(config.backup);
    return check;
}

} // namespace PC
