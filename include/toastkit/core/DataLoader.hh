#pragma once

#include "toastkit/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace toastkit {

// Read-only view over a parsed TOML document. Keys are dotted paths
// ("toast.fading_duration"); every getter reports a missing key as
// ErrorCode::NotFound and a type mismatch as ErrorCode::InvalidState.
class DataLoader {
  public:
    // Parse a TOML file from disk. Parse errors carry file:line:column.
    static Result<DataLoader> load(const std::filesystem::path& path);

    // Parse TOML text (useful for testing without disk I/O).
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    Result<double> getFloat(std::string_view key) const;
    Result<std::vector<std::string>> getStringArray(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const std::string& sourceName() const;

    // Formats "<source>: key '<key>' <problem>" for callers that validate values.
    std::string formatError(std::string_view key, std::string_view problem) const;

  private:
    DataLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace toastkit
