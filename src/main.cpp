#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSocketNotifier>
#include <QTextStream>

#include "cli/format.hpp"
#include "cli/options.hpp"
#include "core/logging.hpp"
#include "network/scan_orchestrator.hpp"

#include <csignal>
#include <functional>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int kExitTransportFailure = 1;
constexpr int kExitBadConfig = 2;

int g_signal_fds[2] = {-1, -1};

void on_unix_signal(int) {
    const char byte = 1;
    // Nothing useful to do if the pipe is full; one pending byte is enough.
    [[maybe_unused]] const auto n = ::write(g_signal_fds[0], &byte, sizeof(byte));
}

// Runs `on_signal` on the main thread's event loop for SIGINT/SIGTERM (the
// handler itself only writes to a socketpair).
bool install_signal_handler(QCoreApplication& app, std::function<void()> on_signal) {
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signal_fds) != 0) {
        return false;
    }

    auto* notifier = new QSocketNotifier(g_signal_fds[1], QSocketNotifier::Read, &app);
    QObject::connect(notifier, &QSocketNotifier::activated, &app,
                     [notifier, on_signal = std::move(on_signal)]() {
        notifier->setEnabled(false);
        char byte = 0;
        [[maybe_unused]] const auto n = ::read(g_signal_fds[1], &byte, sizeof(byte));
        on_signal();
    });

    struct sigaction action{};
    action.sa_handler = on_unix_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("scout");
    app.setApplicationVersion("0.2.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Discover devices that answer UDP broadcast probes on port 30303."));
    parser.addHelpOption();
    parser.addVersionOption();
    scout::cli::add_scan_options(parser);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    auto base = scout::network::apply_environment(scout::network::ScanConfig{});
    if (base.is_err()) {
        err << QString::fromStdString(base.unwrap_err().message) << Qt::endl;
        return kExitBadConfig;
    }

    auto parsed = scout::cli::read_cli_options(parser, std::move(base).unwrap());
    if (parsed.is_err()) {
        err << QString::fromStdString(parsed.unwrap_err().message) << Qt::endl;
        return kExitBadConfig;
    }
    const auto options = std::move(parsed).unwrap();

    scout::install_message_handler(options.log_file);
    if (options.debug || scout::debug_logging_requested()) {
        scout::enable_debug_logging();
    }

    const scout::network::ScanOrchestrator orchestrator;

    if (!options.listen) {
        // An interrupted scan still prints what it found.
        scout::network::ScanCancellation cancellation;
        if (!install_signal_handler(app, [&cancellation]() { cancellation.cancel(); })) {
            qWarning() << "scout: could not install signal handlers; the scan runs to its timeout";
        }

        auto result = orchestrator.discover_once(options.scan, {}, &cancellation);
        if (result.is_err()) {
            err << "scan failed: " << QString::fromStdString(result.unwrap_err().message) << Qt::endl;
            return kExitTransportFailure;
        }
        const auto& devices = result.unwrap();
        out << (options.json ? scout::cli::format_devices_json(devices)
                             : scout::cli::format_device_lines(devices));
        out.flush();
        return 0;
    }

    if (!install_signal_handler(app, []() { QCoreApplication::quit(); })) {
        qWarning() << "scout: could not install signal handlers; stop with SIGKILL";
    }

    const bool json = options.json;
    auto handle = orchestrator.start_continuous_listener(
        options.scan,
        [&out, json](const scout::network::DeviceRecord& device, scout::network::MergeOutcome outcome) {
            out << (json ? scout::cli::format_device_event_json(device, outcome)
                         : scout::cli::format_device_event(device, outcome));
            out.flush();
        });
    if (handle.is_err()) {
        err << "listen failed: " << QString::fromStdString(handle.unwrap_err().message) << Qt::endl;
        return kExitTransportFailure;
    }

    auto listener = std::move(handle).unwrap();
    QObject::connect(listener.engine(), &scout::network::DiscoveryEngine::finished, &app, [&app, &listener]() {
        if (listener.engine()->completion_reason() ==
            scout::network::DiscoveryEngine::CompletionReason::TransportFailure) {
            app.exit(kExitTransportFailure);
        }
    });

    const int code = app.exec();
    listener.cancel();
    return code;
}
