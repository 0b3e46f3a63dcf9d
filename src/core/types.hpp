#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentdeck {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using AgentId = std::string;
using ToolCallId = std::string;

// Milliseconds since the unix epoch
using EpochMs = int64_t;

using Timestamp = std::chrono::system_clock::time_point;

EpochMs now_ms();

// Parses ISO-8601 UTC timestamps of the form YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM).
// Returns nullopt for anything else.
std::optional<EpochMs> parse_timestamp_ms(const std::string &text);

// Formats as YYYY-MM-DDTHH:MM:SS.mmmZ
std::string format_timestamp(EpochMs ms);

std::string now_timestamp();

// Random identifiers
std::string random_suffix(size_t length = 8);
std::string make_id(const std::string &prefix);

std::string to_lower(std::string s);
std::string trim(const std::string &s);

// j[key] when it holds a string, otherwise fallback
std::string string_field(const json &j, const char *key, const std::string &fallback = "");

}  // namespace agentdeck
