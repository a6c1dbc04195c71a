// skiff command line front end. Renders façade results for a terminal and
// drains progress from a ProgressQueue while the transfer runs.
#include "skiff/ProgressQueue.hpp"
#include "skiff/SftpFacade.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace {

std::atomic<bool> g_interrupted{false};

void onSigint(int) { g_interrupted = true; }

void printProgress(const skiff::ProgressSample &s) {
    const double pct = s.totalBytes > 0
                           ? 100.0 * double(s.bytesTransferred) / double(s.totalBytes)
                           : 0.0;
    std::fprintf(stderr, "\r%12llu / %-12llu %5.1f%% %9.1f KiB/s  ETA %5.0fs",
                 static_cast<unsigned long long>(s.bytesTransferred),
                 static_cast<unsigned long long>(s.totalBytes), pct, s.speedKbps,
                 s.eta.count());
}

// Waits for the transfer while printing queued progress; Ctrl-C cancels.
skiff::TransferOutcome runWithProgress(skiff::SftpFacade &facade,
                                       skiff::ProgressQueue &queue,
                                       std::future<skiff::TransferOutcome> &fut) {
    skiff::ProgressSample s;
    while (fut.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        if (g_interrupted.exchange(false)) {
            std::fprintf(stderr, "\ncancelling...\n");
            facade.cancel();
        }
        if (queue.pop(s, std::chrono::milliseconds(200)))
            printProgress(s);
    }
    queue.close();
    while (queue.pop(s, std::chrono::milliseconds(0)))
        printProgress(s);
    std::fprintf(stderr, "\n");
    return fut.get();
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    char buf[32];
    std::tm tm{};
    localtime_r(&t, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("skiff");
    QCoreApplication::setOrganizationName("skiff");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "SFTP transfers with progress, cancellation and stall detection.");
    parser.addHelpOption();
    parser.addPositionalArgument(
        "command", "test | ls | get | put | probe");
    parser.addPositionalArgument("args", "host and paths for the command", "[args...]");
    QCommandLineOption userOpt({"u", "user"}, "SSH user name.", "user");
    QCommandLineOption passOpt({"p", "password"},
                               "Password (default: $SKIFF_PASSWORD).", "password");
    QCommandLineOption portOpt({"P", "port"}, "SSH port.", "port", "22");
    QCommandLineOption configOpt("config", "INI file with settings.", "file");
    QCommandLineOption timeoutOpt("timeout", "Probe timeout in ms.", "ms");
    parser.addOptions({userOpt, passOpt, portOpt, configOpt, timeoutOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);
    const QString command = args.first();

    skiff::FacadeSettings settings;
    if (parser.isSet(configOpt)) {
        QSettings ini(parser.value(configOpt), QSettings::IniFormat);
        settings = skiff::loadSettings(ini);
    } else {
        settings = skiff::loadSettings();
    }
    skiff::SftpFacade facade({}, settings);

    if (command == "probe") {
        bool ok = false;
        const int ms = parser.value(timeoutOpt).toInt(&ok);
        std::optional<std::chrono::milliseconds> timeout;
        if (ok && ms > 0) timeout = std::chrono::milliseconds(ms);
        const bool online = facade.hasInternetConnection(timeout);
        std::printf("%s\n", online ? "online" : "offline");
        return online ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (args.size() < 2) {
        std::fprintf(stderr, "missing host\n");
        return EXIT_FAILURE;
    }
    skiff::Credentials cred;
    cred.host = args.at(1).toStdString();
    cred.username = parser.value(userOpt).toStdString();
    if (parser.isSet(passOpt)) {
        cred.password = parser.value(passOpt).toStdString();
    } else if (const char *env = std::getenv("SKIFF_PASSWORD")) {
        cred.password = env;
    }
    bool portOk = false;
    const int port = parser.value(portOpt).toInt(&portOk);
    if (!portOk || port < 1 || port > 65535) {
        std::fprintf(stderr, "invalid port\n");
        return EXIT_FAILURE;
    }
    cred.port = static_cast<std::uint16_t>(port);

    if (command == "test") {
        const auto err = facade.probeConnection(cred);
        std::printf("%s\n", err ? skiff::describeConnectError(*err).c_str()
                                : "Connection successful.");
        return err ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if (command == "ls") {
        const std::string path = args.size() > 2 ? args.at(2).toStdString() : "/";
        const auto entries = facade.listFiles(cred.host, cred.username,
                                              cred.password, cred.port, path);
        for (const auto &e : entries) {
            std::printf("%c %10llu KiB  %s  %s\n",
                        e.kind == skiff::RemoteEntry::Kind::Directory ? 'd' : '-',
                        static_cast<unsigned long long>(e.sizeKiB),
                        formatTime(e.modifiedAt).c_str(), e.name.c_str());
        }
        return EXIT_SUCCESS;
    }

    if (command == "get" || command == "put") {
        if (args.size() < 4) {
            std::fprintf(stderr, "usage: skiff %s <host> <src> <dst>\n",
                         qPrintable(command));
            return EXIT_FAILURE;
        }
        std::signal(SIGINT, onSigint);
        skiff::ProgressQueue queue;
        const skiff::CancellationToken token = facade.newCancellationToken();
        const std::string src = args.at(2).toStdString();
        const std::string dst = args.at(3).toStdString();
        if (command == "get") {
            auto fut = facade.downloadAsync(cred, src, dst, queue.publisher(), token);
            const auto outcome = runWithProgress(facade, queue, fut);
            std::printf("%s\n", skiff::SftpFacade::renderDownload(outcome).c_str());
            return outcome.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        auto fut = facade.uploadAsync(cred, src, dst, queue.publisher(), token);
        const auto outcome = runWithProgress(facade, queue, fut);
        std::printf("%s\n", skiff::describeOutcome(outcome).c_str());
        return outcome.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    std::fprintf(stderr, "unknown command: %s\n", qPrintable(command));
    return EXIT_FAILURE;
}
