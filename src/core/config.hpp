#pragma once

#include <string>
#include <map>
#include <istream>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Parsed INI document: section name → (lower-cased key → value)
using IniSection = std::map<std::string, std::string>;
using IniDocument = std::map<std::string, IniSection>;

// Parse INI text. source_name is only used in error messages.
// Supports [section] headers, `key = value` / `key: value` pairs and
// full-line `#` / `;` comments. Keys are case-insensitive. A repeated
// key overrides the earlier value; a repeated section merges.
Result<IniDocument> parse_ini(std::istream& in, const std::string& source_name);

// Loads the [remote] connection settings from a single INI file.
class ConfigStore {
public:
    explicit ConfigStore(fs::path path);

    // Default location: ~/.remote-cli-runner.ini
    static fs::path default_path();

    const fs::path& path() const { return path_; }

    // Read and validate the file. On failure the result carries the
    // ErrorKind, a one-line diagnostic and, where useful, a hint.
    Result<RemoteConfig> load() const;

private:
    fs::path path_;
};
