/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file config.cpp
 * @brief cJSON-backed implementation of the generator configuration parser.
 */

#include "chronoid/infra/config.hpp"

#include "chronoid/infra/errors.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace chronoid::infra {

namespace {

constexpr std::uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;
constexpr std::uint16_t kClockSeqMax = 0x3FFF;

/**
 * @brief Owns a parsed cJSON tree for the duration of one `parse()` call.
 */
class JsonDocument {
  public:
    explicit JsonDocument(const std::string& text) : root_(cJSON_Parse(text.c_str())) {}
    ~JsonDocument() { cJSON_Delete(root_); }

    JsonDocument(const JsonDocument&) = delete;
    JsonDocument& operator=(const JsonDocument&) = delete;

    cJSON* root() const { return root_; }

  private:
    cJSON* root_;
};

/// @brief Reads a non-negative integral JSON number, rejecting fractions.
std::uint64_t read_integral(const cJSON* item, const char* key)
{
    double value = item->valuedouble;
    if (value < 0 || std::floor(value) != value || value > 9007199254740992.0) {
        throw ConfigError(std::string("Config: '") + key + "' must be a non-negative integer");
    }
    return static_cast<std::uint64_t>(value);
}

std::uint64_t read_node(const cJSON* item)
{
    if (cJSON_IsNumber(item)) {
        return read_integral(item, "node");
    }

    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        std::string text = item->valuestring;
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
            text = text.substr(2);
        }
        if (text.empty() || text.size() > 12 ||
            !std::all_of(text.begin(), text.end(),
                         [](unsigned char c) { return std::isxdigit(c) != 0; })) {
            throw ConfigError("Config: 'node' must be a 48-bit hexadecimal string");
        }
        return std::stoull(text, nullptr, 16);
    }

    throw ConfigError("Config: 'node' must be a number or a hexadecimal string");
}

} // namespace

LogLevel Config::parse_level(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "fatal")
        return LogLevel::FATAL;

    throw ConfigError("Config: unknown log level '" + name + "'");
}

/**
 * @brief Parses a configuration document.
 *
 * Validation happens key by key; the first offending key aborts the parse so
 * a half-applied configuration is never returned.
 */
GeneratorOptions Config::parse(const std::string& text)
{
    JsonDocument doc(text);
    if (doc.root() == nullptr) {
        throw ConfigError("Config: invalid JSON syntax");
    }
    if (!cJSON_IsObject(doc.root())) {
        throw ConfigError("Config: top-level value must be an object");
    }

    GeneratorOptions options;

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, doc.root())
    {
        const std::string key = item->string ? item->string : "";

        if (key == "node") {
            std::uint64_t node = read_node(item);
            if (node > kNodeMask) {
                throw ConfigError("Config: 'node' exceeds 48 bits");
            }
            options.node = node;
        } else if (key == "clock_seq") {
            if (!cJSON_IsNumber(item)) {
                throw ConfigError("Config: 'clock_seq' must be a number");
            }
            std::uint64_t seq = read_integral(item, "clock_seq");
            if (seq > kClockSeqMax) {
                throw ConfigError("Config: 'clock_seq' exceeds 14 bits");
            }
            options.clock_seq = static_cast<std::uint16_t>(seq);
        } else if (key == "log_level") {
            if (!cJSON_IsString(item) || item->valuestring == nullptr) {
                throw ConfigError("Config: 'log_level' must be a string");
            }
            options.log_level = parse_level(item->valuestring);
        } else {
            Logger::log(LogLevel::WARN, "Config: ignoring unknown key '" + key + "'");
        }
    }

    return options;
}

GeneratorOptions Config::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Config: cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    GeneratorOptions options = parse(buffer.str());
    Logger::log(LogLevel::INFO, "Config: loaded '" + path + "'");
    return options;
}

} // namespace chronoid::infra
