#pragma once

#include "core/result.hpp"
#include "network/scan_config.hpp"

#include <QString>

class QCommandLineParser;

namespace scout::cli {

struct CliOptions {
    network::ScanConfig scan;
    bool listen = false;
    bool json = false;
    bool debug = false;
    QString log_file;
};

// Registers every scan option on `parser` (help/version are left to the caller).
void add_scan_options(QCommandLineParser& parser);

// Reads the options registered by add_scan_options() on top of `base`,
// which normally already carries the environment overlay.
[[nodiscard]] Result<CliOptions> read_cli_options(const QCommandLineParser& parser,
                                                  network::ScanConfig base);

// Expands \r, \n, \t and \\ in a delimiter given on the command line.
[[nodiscard]] QByteArray unescape_delimiter(const QString& text);

} // namespace scout::cli
