#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// ── INI parsing ──────────────────────────────────────────────

Result<IniDocument> parse_ini(std::istream& in, const std::string& source_name) {
    IniDocument doc;
    IniSection* current = nullptr;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return Result<IniDocument>::Err(ErrorKind::ConfigMalformed,
                    fmt::format("{}:{}: malformed section header: {}", source_name, line_no, line));
            }
            std::string name = line.substr(1, line.size() - 2);
            trim(name);
            current = &doc[name];
            continue;
        }

        auto sep = line.find_first_of("=:");
        if (sep == std::string::npos || sep == 0) {
            return Result<IniDocument>::Err(ErrorKind::ConfigMalformed,
                fmt::format("{}:{}: expected 'key = value': {}", source_name, line_no, line));
        }
        if (!current) {
            return Result<IniDocument>::Err(ErrorKind::ConfigMalformed,
                fmt::format("{}:{}: key outside of any [section]", source_name, line_no));
        }

        std::string key = line.substr(0, sep);
        std::string value = line.substr(sep + 1);
        trim(key);
        trim(value);
        if (key.empty()) {
            return Result<IniDocument>::Err(ErrorKind::ConfigMalformed,
                fmt::format("{}:{}: empty key", source_name, line_no));
        }
        (*current)[to_lower(key)] = value;
    }

    if (in.bad()) {
        return Result<IniDocument>::Err(ErrorKind::ConfigMalformed,
            fmt::format("Failed to read {}", source_name));
    }
    return Result<IniDocument>::Ok(std::move(doc));
}

// ── ConfigStore ──────────────────────────────────────────────

ConfigStore::ConfigStore(fs::path path) : path_(std::move(path)) {}

fs::path ConfigStore::default_path() {
    return platform::home_dir() / CONFIG_FILE_NAME;
}

Result<RemoteConfig> ConfigStore::load() const {
    rcr_log(fmt::format("config: loading {}", path_.string()));

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Result<RemoteConfig>::Err(ErrorKind::ConfigMissing,
            fmt::format("Config file not found: {}", path_.string()),
            fmt::format("Create it with a [{}] section (host, user, key, port).", CONFIG_SECTION));
    }

    std::ifstream in(path_);
    if (!in) {
        return Result<RemoteConfig>::Err(ErrorKind::ConfigMalformed,
            fmt::format("Cannot open config file: {}", path_.string()));
    }

    auto parsed = parse_ini(in, path_.string());
    if (parsed.is_err()) {
        return Result<RemoteConfig>::Err(parsed.kind, parsed.error, parsed.hint);
    }

    const IniDocument& doc = parsed.value;
    auto it = doc.find(CONFIG_SECTION);
    if (it == doc.end()) {
        return Result<RemoteConfig>::Err(ErrorKind::SectionMissing,
            fmt::format("[{}] section missing in {}", CONFIG_SECTION, path_.string()));
    }

    // [DEFAULT] values are visible in every section unless overridden
    IniSection remote;
    auto defaults = doc.find(CONFIG_DEFAULTS);
    if (defaults != doc.end()) remote = defaults->second;
    for (const auto& [k, v] : it->second) remote[k] = v;

    auto get = [&remote](const char* key) -> std::string {
        auto found = remote.find(key);
        return found == remote.end() ? "" : found->second;
    };

    std::string host = get("host");
    std::string user = get("user");
    std::string key = get("key");

    std::vector<std::string> missing;
    if (host.empty()) missing.push_back("host");
    if (user.empty()) missing.push_back("user");
    if (key.empty()) missing.push_back("key");
    if (!missing.empty()) {
        return Result<RemoteConfig>::Err(ErrorKind::FieldMissing,
            fmt::format("Missing values in [{}] section: {}", CONFIG_SECTION,
                        fmt::join(missing, ", ")));
    }

    std::string port_str = remote.count("port") ? remote.at("port")
                                                : std::to_string(DEFAULT_SSH_PORT);
    int port = DEFAULT_SSH_PORT;
    if (!parse_int(port_str, port)) {
        return Result<RemoteConfig>::Err(ErrorKind::PortInvalid,
            fmt::format("Invalid port in config: {}", port_str));
    }

    rcr_log(fmt::format("config: {}@{}:{} key={}", user, host, port, key));
    return Result<RemoteConfig>::Ok(RemoteConfig(host, user, key, port));
}
