/*
 * Config.h - taftool configuration file
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_CONFIG_H
#define TAFKIT_CONFIG_H

#include "taf/TafContainer.h"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace TafKit {

/**
 * @brief Settings read from a key=value file.
 *
 * Lines starting with '#' are comments. Unknown keys and malformed values
 * are logged on the "config" channel and leave the default in place.
 */
class Config {
public:
    Config();

    /**
     * @return false if the file could not be opened
     */
    bool readConfig(const std::string& path);
    void readConfig(std::istream& input);

    Taf::HashScope hashScope() const { return m_hash_scope; }
    unsigned expectedChannels() const { return m_expected_channels; }
    uint32_t expectedSampleRate() const { return m_expected_sample_rate; }
    const std::vector<std::string>& debugChannels() const { return m_debug_channels; }
    const std::string& logFile() const { return m_log_file; }

    /**
     * @return empty when the timestamp is "now"
     */
    const std::optional<uint32_t>& timestamp() const { return m_timestamp; }
    const std::string& vendor() const { return m_vendor; }

    static std::vector<std::string> splitList(const std::string& text);
    static bool parseNumber(const std::string& text, uint32_t& value);

private:
    void apply(const std::string& key, const std::string& value);

    Taf::HashScope m_hash_scope;
    unsigned m_expected_channels;
    uint32_t m_expected_sample_rate;
    std::vector<std::string> m_debug_channels;
    std::string m_log_file;
    std::optional<uint32_t> m_timestamp;
    std::string m_vendor;
};

} // namespace TafKit

#endif // TAFKIT_CONFIG_H
