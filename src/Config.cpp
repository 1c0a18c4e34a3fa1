/*
 * Config.cpp - taftool configuration file
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "Config.h"

#include <cctype>

namespace TafKit {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

Config::Config()
    : m_hash_scope(Taf::HashScope::PageBodies)
    , m_expected_channels(2)
    , m_expected_sample_rate(48000)
{
}

bool Config::readConfig(const std::string& path)
{
    Debug::log("config", "Reading configuration from ", path);
    std::ifstream config(path);
    if (!config.is_open()) {
        Debug::log("config", "Config file not found: ", path);
        return false;
    }
    readConfig(config);
    return true;
}

void Config::readConfig(std::istream& input)
{
    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            Debug::log("config", "Ignoring line without '=': ", line);
            continue;
        }

        apply(trim(line.substr(0, equals)), trim(line.substr(equals + 1)));
    }
}

void Config::apply(const std::string& key, const std::string& value)
{
    uint32_t number = 0;

    if (key == "hash_scope") {
        if (Taf::parseHashScope(value, m_hash_scope)) {
            Debug::log("config", "Hash scope: ", value);
        } else {
            Debug::log("config", "Invalid hash_scope '", value, "', keeping ", Taf::hashScopeName(m_hash_scope));
        }
    } else if (key == "expected_channels") {
        if (parseNumber(value, number) && number >= 1 && number <= 255) {
            m_expected_channels = number;
            Debug::log("config", "Expected channels: ", m_expected_channels);
        } else {
            Debug::log("config", "Invalid expected_channels '", value, "'");
        }
    } else if (key == "expected_sample_rate") {
        if (parseNumber(value, number) && number > 0) {
            m_expected_sample_rate = number;
            Debug::log("config", "Expected sample rate: ", m_expected_sample_rate);
        } else {
            Debug::log("config", "Invalid expected_sample_rate '", value, "'");
        }
    } else if (key == "debug_channels") {
        m_debug_channels = splitList(value);
    } else if (key == "log_file") {
        m_log_file = value;
    } else if (key == "timestamp") {
        if (value == "now") {
            m_timestamp.reset();
        } else if (parseNumber(value, number)) {
            m_timestamp = number;
            Debug::log("config", "Timestamp: ", number);
        } else {
            Debug::log("config", "Invalid timestamp '", value, "'");
        }
    } else if (key == "vendor") {
        m_vendor = value;
    } else {
        Debug::log("config", "Unknown key '", key, "' ignored");
    }
}

std::vector<std::string> Config::splitList(const std::string& text)
{
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool Config::parseNumber(const std::string& text, uint32_t& value)
{
    // Decimal, or hexadecimal after an explicit 0x. A leading zero is not octal.
    int base = 10;
    size_t start = 0;
    if (text.size() > 1 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        start = 2;
    }
    if (start >= text.size() || !std::isxdigit(static_cast<unsigned char>(text[start]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const char* digits = text.c_str() + start;
    unsigned long long parsed = std::strtoull(digits, &end, base);
    if (errno != 0 || end == digits || *end != '\0' ||
        parsed > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    value = static_cast<uint32_t>(parsed);
    return true;
}

} // namespace TafKit
