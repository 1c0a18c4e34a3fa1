/*
 * main.cpp - taftool entry point
 * This file is part of TafKit.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "tafkit.h"
#include "about.h"
#include "Config.h"
#include "taf/TafAnalyzer.h"
#include "taf/TafComparator.h"
#include "taf/TafContainer.h"
#include "taf/TafValidator.h"

#include <getopt.h>

using namespace TafKit;

namespace {

enum ExitStatus {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_CODEC = 2,
    EXIT_REJECTED = 3
};

enum class Mode {
    None,
    Build,
    Info,
    Compare,
    Split
};

enum LongOnly {
    OPT_TAG = 1000,
    OPT_VENDOR,
    OPT_HASH_SCOPE,
    OPT_CHANNELS,
    OPT_RATE,
    OPT_KEEP_TAGS
};

struct ToolOptions {
    Mode mode = Mode::None;
    std::string output;
    std::string compare_with;
    std::string split_dir;
    bool detailed = false;
    bool no_header = false;
    bool keep_tags = false;
    std::string timestamp;
    std::vector<std::pair<std::string, std::string>> tags;
    std::optional<std::string> vendor;
    std::optional<Taf::HashScope> hash_scope;
    std::optional<uint32_t> channels;
    std::optional<uint32_t> rate;
    std::string config_file;
    std::vector<std::string> debug_channels;
    std::string logfile;
    std::vector<std::string> files;
};

bool readFile(const std::string& path, std::vector<uint8_t>& data)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "taftool: cannot open " << path << std::endl;
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        std::cerr << "taftool: error reading " << path << std::endl;
        return false;
    }
    Debug::log("cli", "Read ", data.size(), " bytes from ", path);
    return true;
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& data)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "taftool: cannot create " << path << std::endl;
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        std::cerr << "taftool: error writing " << path << std::endl;
        return false;
    }
    Debug::log("cli", "Wrote ", data.size(), " bytes to ", path);
    return true;
}

bool setMode(ToolOptions& options, Mode mode)
{
    if (options.mode != Mode::None && options.mode != mode) {
        std::cerr << "taftool: -o, -i, -c and -s are mutually exclusive" << std::endl;
        return false;
    }
    options.mode = mode;
    return true;
}

// A number, "now", or the path of a container whose timestamp is reused.
bool resolveTimestamp(const std::string& argument, const Config& config, Taf::TimestampSource& source)
{
    uint32_t value = 0;
    if (argument.empty()) {
        if (config.timestamp()) {
            source = Taf::TimestampSource::fixed(*config.timestamp());
        } else {
            source = Taf::TimestampSource::currentTime();
        }
        return true;
    }
    if (argument == "now") {
        source = Taf::TimestampSource::currentTime();
        return true;
    }
    if (Config::parseNumber(argument, value)) {
        source = Taf::TimestampSource::fixed(value);
        return true;
    }

    std::vector<uint8_t> reference;
    if (!readFile(argument, reference)) {
        return false;
    }
    source = Taf::TimestampSource::fromReference(Taf::TafContainer::parse(std::move(reference)));
    return true;
}

int runBuild(const ToolOptions& options, const Config& config)
{
    if (options.files.empty()) {
        std::cerr << "taftool: no input streams given" << std::endl;
        return EXIT_USAGE;
    }

    std::vector<std::vector<uint8_t>> tracks;
    for (const auto& path : options.files) {
        std::vector<uint8_t> data;
        if (!readFile(path, data)) {
            return EXIT_USAGE;
        }
        tracks.push_back(std::move(data));
    }

    Taf::TimestampSource timestamp = Taf::TimestampSource::currentTime();
    if (!resolveTimestamp(options.timestamp, config, timestamp)) {
        return EXIT_USAGE;
    }

    Taf::BuildOptions build;
    build.hash_scope = options.hash_scope.value_or(config.hashScope());

    if (options.keep_tags) {
        if (!options.tags.empty() || options.vendor) {
            std::cerr << "taftool: --keep-tags cannot be combined with --tag or --vendor" << std::endl;
            return EXIT_USAGE;
        }
        build.comment_source = Taf::CommentSource::FirstTrack;
    } else {
        build.vendor = options.vendor ? *options.vendor : config.vendor();
        build.user_comments = options.tags;
    }

    Taf::TafContainer container = Taf::TafBuilder(build).build(tracks, timestamp);
    if (!writeFile(options.output, options.no_header ? container.pageStreamBytes() : container.bytes())) {
        return EXIT_USAGE;
    }
    if (options.no_header) {
        std::cout << options.output << ": " << container.pageStreamSize() << " bytes, "
                  << container.pages(false).size() << " pages, no header" << std::endl;
        return EXIT_OK;
    }

    Taf::TafHeader header = container.header();
    std::cout << options.output << ": " << container.size() << " bytes, "
              << container.pages(false).size() << " pages, "
              << header.chapter_pages.size() + 1 << " tracks, timestamp "
              << header.timestamp << std::endl;
    return EXIT_OK;
}

void printReport(const Taf::ValidationReport& report)
{
    for (const auto& check : report.checks) {
        std::cout << "  [" << (check.passed ? " ok " : "FAIL") << "] " << check.name;
        if (!check.detail.empty()) {
            std::cout << ": " << check.detail;
        }
        std::cout << std::endl;
    }
    std::cout << (report.valid() ? "valid" : "INVALID") << " (" << report.failureCount()
              << " failed checks)" << std::endl;
}

void printInfo(const Taf::TafInfo& info)
{
    std::cout << "File size:      " << info.file_size << " bytes" << std::endl;
    std::cout << "Stream size:    " << info.page_stream_size << " bytes (header says "
              << info.stored_length << ")" << std::endl;
    std::cout << "Content hash:   " << info.stored_hash
              << (info.hash_matches ? " (matches)" : " (computed " + info.computed_hash + ")") << std::endl;
    std::cout << "Timestamp:      " << info.timestamp << std::endl;
    std::cout << "Serial number:  " << info.serial_number << std::endl;
    std::cout << "Channels:       " << info.channels << std::endl;
    std::cout << "Input rate:     " << info.input_sample_rate << " Hz" << std::endl;
    std::cout << "Pre-skip:       " << info.pre_skip << std::endl;
    std::cout << "Pages:          " << info.page_count << std::endl;
    std::cout << "Duration:       " << std::fixed << std::setprecision(2) << info.duration_seconds
              << " s" << std::endl;
    std::cout << "Vendor:         " << info.vendor << std::endl;
    for (const auto& comment : info.comments) {
        std::cout << "  " << comment.first << "=" << comment.second << std::endl;
    }
    std::cout << "Tracks:" << std::endl;
    for (size_t i = 0; i < info.chapters.size(); ++i) {
        const Taf::ChapterInfo& chapter = info.chapters[i];
        std::cout << "  " << std::setw(3) << i + 1 << ": pages " << chapter.start_page << "-"
                  << chapter.end_page - 1 << ", " << std::fixed << std::setprecision(2)
                  << chapter.duration_seconds << " s" << std::endl;
    }
}

Taf::ValidationOptions validationOptions(const ToolOptions& options, const Config& config)
{
    Taf::ValidationOptions validation;
    validation.expected_channels = options.channels.value_or(config.expectedChannels());
    validation.expected_sample_rate = options.rate.value_or(config.expectedSampleRate());
    validation.hash_scope = options.hash_scope.value_or(config.hashScope());
    return validation;
}

int runInfo(const ToolOptions& options, const Config& config)
{
    if (options.files.size() != 1) {
        std::cerr << "taftool: -i takes exactly one container" << std::endl;
        return EXIT_USAGE;
    }
    std::vector<uint8_t> data;
    if (!readFile(options.files[0], data)) {
        return EXIT_USAGE;
    }

    Taf::ValidationOptions validation = validationOptions(options, config);
    Taf::ValidationReport report = Taf::TafValidator(validation).validate(data);

    std::cout << options.files[0] << ":" << std::endl;
    if (data.size() >= Taf::TAF_HEADER_BLOCK_SIZE) {
        try {
            Taf::TafContainer container = Taf::TafContainer::parse(data);
            printInfo(Taf::TafAnalyzer(validation.hash_scope).describe(container));
        } catch (const TafException& e) {
            // The report below says what is wrong
            std::cout << "No stream information: " << e.what() << std::endl;
        }
    }
    std::cout << "Validation:" << std::endl;
    printReport(report);
    return report.valid() ? EXIT_OK : EXIT_REJECTED;
}

int runCompare(const ToolOptions& options)
{
    if (options.files.size() != 1) {
        std::cerr << "taftool: -c takes exactly one other container" << std::endl;
        return EXIT_USAGE;
    }
    std::vector<uint8_t> left_data;
    std::vector<uint8_t> right_data;
    if (!readFile(options.files[0], left_data) || !readFile(options.compare_with, right_data)) {
        return EXIT_USAGE;
    }

    Taf::TafContainer left = Taf::TafContainer::parse(std::move(left_data));
    Taf::TafContainer right = Taf::TafContainer::parse(std::move(right_data));
    Taf::DiffReport report = Taf::TafComparator::diff(left, right, options.detailed);

    if (report.identical()) {
        std::cout << "identical" << std::endl;
        return EXIT_OK;
    }
    for (const auto& field : report.fields) {
        std::cout << field.field << ": " << field.left << " != " << field.right << std::endl;
    }
    for (const auto& page : report.pages) {
        std::cout << "page " << page.page_index << ": ";
        if (page.left_size != page.right_size) {
            std::cout << "size " << page.left_size << " != " << page.right_size << ", ";
        }
        std::cout << "first difference at byte " << page.first_offset
                  << (page.body_identical ? " (header only)" : "") << std::endl;
    }
    return EXIT_REJECTED;
}

int runSplit(const ToolOptions& options, const Config& config)
{
    if (options.files.size() != 1) {
        std::cerr << "taftool: -s takes exactly one container" << std::endl;
        return EXIT_USAGE;
    }
    std::vector<uint8_t> data;
    if (!readFile(options.files[0], data)) {
        return EXIT_USAGE;
    }

    Taf::TafContainer container = Taf::TafContainer::parse(std::move(data));
    Taf::HashScope scope = options.hash_scope.value_or(config.hashScope());
    container.verify(scope);
    Taf::TafAnalyzer analyzer(scope);
    std::vector<std::vector<uint8_t>> tracks = analyzer.splitTracks(container);

    for (size_t i = 0; i < tracks.size(); ++i) {
        std::ostringstream name;
        name << options.split_dir << "/track_" << std::setw(2) << std::setfill('0') << i + 1 << ".opus";
        if (!writeFile(name.str(), tracks[i])) {
            return EXIT_USAGE;
        }
        std::cout << name.str() << ": " << tracks[i].size() << " bytes" << std::endl;
    }
    return EXIT_OK;
}

bool parseTag(const char* text, ToolOptions& options)
{
    std::string tag(text);
    size_t equals = tag.find('=');
    if (equals == std::string::npos || equals == 0) {
        std::cerr << "taftool: --tag expects KEY=VALUE, got '" << tag << "'" << std::endl;
        return false;
    }
    options.tags.emplace_back(tag.substr(0, equals), tag.substr(equals + 1));
    return true;
}

bool parseCount(const char* text, const char* option, std::optional<uint32_t>& value)
{
    uint32_t number = 0;
    if (!Config::parseNumber(text, number) || number == 0) {
        std::cerr << "taftool: invalid value '" << text << "' for " << option << std::endl;
        return false;
    }
    value = number;
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    ToolOptions options;

    static struct option long_options[] = {
        {"output",     required_argument, 0, 'o'},
        {"info",       no_argument,       0, 'i'},
        {"compare",    required_argument, 0, 'c'},
        {"detail",     no_argument,       0, 'D'},
        {"no-header",  no_argument,       0, 'n'},
        {"keep-tags",  no_argument,       0, OPT_KEEP_TAGS},
        {"split",      required_argument, 0, 's'},
        {"timestamp",  required_argument, 0, 't'},
        {"tag",        required_argument, 0, OPT_TAG},
        {"vendor",     required_argument, 0, OPT_VENDOR},
        {"hash-scope", required_argument, 0, OPT_HASH_SCOPE},
        {"channels",   required_argument, 0, OPT_CHANNELS},
        {"rate",       required_argument, 0, OPT_RATE},
        {"config",     required_argument, 0, 'C'},
        {"debug",      required_argument, 0, 'd'},
        {"logfile",    required_argument, 0, 'l'},
        {"help",       no_argument,       0, 'h'},
        {"version",    no_argument,       0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "o:ic:Dns:t:C:d:l:hv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'o':
                if (!setMode(options, Mode::Build)) return EXIT_USAGE;
                options.output = optarg;
                break;
            case 'i':
                if (!setMode(options, Mode::Info)) return EXIT_USAGE;
                break;
            case 'c':
                if (!setMode(options, Mode::Compare)) return EXIT_USAGE;
                options.compare_with = optarg;
                break;
            case 'D':
                options.detailed = true;
                break;
            case 'n':
                options.no_header = true;
                break;
            case OPT_KEEP_TAGS:
                options.keep_tags = true;
                break;
            case 's':
                if (!setMode(options, Mode::Split)) return EXIT_USAGE;
                options.split_dir = optarg;
                break;
            case 't':
                options.timestamp = optarg;
                break;
            case OPT_TAG:
                if (!parseTag(optarg, options)) return EXIT_USAGE;
                break;
            case OPT_VENDOR:
                options.vendor = std::string(optarg);
                break;
            case OPT_HASH_SCOPE: {
                Taf::HashScope scope;
                if (!Taf::parseHashScope(optarg, scope)) {
                    std::cerr << "taftool: --hash-scope must be 'bodies' or 'pages'" << std::endl;
                    return EXIT_USAGE;
                }
                options.hash_scope = scope;
                break;
            }
            case OPT_CHANNELS:
                if (!parseCount(optarg, "--channels", options.channels)) return EXIT_USAGE;
                break;
            case OPT_RATE:
                if (!parseCount(optarg, "--rate", options.rate)) return EXIT_USAGE;
                break;
            case 'C':
                options.config_file = optarg;
                break;
            case 'd':
                options.debug_channels = Config::splitList(optarg);
                break;
            case 'l':
                options.logfile = optarg;
                break;
            case 'h':
                usage_console();
                return EXIT_OK;
            case 'v':
                about_console();
                return EXIT_OK;
            case '?': // Invalid option
                return EXIT_USAGE; // getopt_long already prints an error message.
        }
    }

    // Collect non-option arguments as file paths.
    for (int i = optind; i < argc; ++i) {
        options.files.push_back(argv[i]);
    }

    // Command line settings win over the config file
    Debug::init(options.logfile, options.debug_channels);

    Config config;
    if (!options.config_file.empty() && !config.readConfig(options.config_file)) {
        std::cerr << "taftool: cannot read config file " << options.config_file << std::endl;
        Debug::shutdown();
        return EXIT_USAGE;
    }
    Debug::init(options.logfile.empty() ? config.logFile() : std::string(),
                options.debug_channels.empty() ? config.debugChannels() : std::vector<std::string>());

    int status = EXIT_USAGE;
    try {
        switch (options.mode) {
            case Mode::Build:
                status = runBuild(options, config);
                break;
            case Mode::Info:
                status = runInfo(options, config);
                break;
            case Mode::Compare:
                status = runCompare(options);
                break;
            case Mode::Split:
                status = runSplit(options, config);
                break;
            case Mode::None:
                usage_console();
                status = EXIT_USAGE;
                break;
        }
    } catch (const TafException& e) {
        std::cerr << "taftool: " << e.what() << std::endl;
        status = EXIT_CODEC;
    } catch (const std::exception& e) {
        std::cerr << "taftool: " << e.what() << std::endl;
        status = EXIT_USAGE;
    }

    Debug::shutdown();
    return status;
}
