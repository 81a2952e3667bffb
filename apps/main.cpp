#include "ruida/config/RuidaConfig.hpp"
#include "ruida/controller/RuidaController.hpp"
#include "ruida/core/Driver.hpp"
#include "ruida/core/SignalBus.hpp"
#include "ruida/emulator/Emulator.hpp"
#include "ruida/emulator/EmulatorServer.hpp"
#include "ruida/log/Log.hpp"
#include "ruida/protocol/Interpreter.hpp"
#include "ruida/protocol/Program.hpp"
#include "ruida/session/Session.hpp"
#include "ruida/transport/UdpTransport.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace ruida;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted = true;
}

struct Options {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::uint8_t> magic;
    unsigned short port = config::RUIDA_DEVICE_PORT;
    bool swizzledChecksum = false;
    bool verbose = false;
    std::chrono::seconds duration{5};
};

void usage() {
    std::cerr <<
        "usage: ruida-tool <command> [options]\n"
        "  decode <file> [--magic N]        print every command in a swizzled job file\n"
        "  emulate [--port P]               run a controller emulator on UDP\n"
        "  send <host> <file> [--magic N]   send a swizzled job file to a controller\n"
        "  status <host> [--seconds S]      poll and print controller status\n"
        "options:\n"
        "  --verbose              per-command and per-packet traces\n"
        "  --swizzled-checksum    checksum over wire bytes instead of plain bytes\n";
}

std::optional<unsigned long> parseNumber(const std::string& text, unsigned long max) {
    char* end = nullptr;
    const unsigned long value = std::strtoul(text.c_str(), &end, 0);
    if (text.empty() || end == nullptr || *end != '\0' || value > max) {
        return std::nullopt;
    }
    return value;
}

std::optional<Options> parseArgs(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    Options opts;
    opts.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--swizzled-checksum") {
            opts.swizzledChecksum = true;
        } else if (arg == "--magic" && hasValue) {
            auto value = parseNumber(argv[++i], 0xFF);
            if (!value) {
                logError("[ruida-tool] bad magic: ", argv[i], "\n");
                return std::nullopt;
            }
            opts.magic = static_cast<std::uint8_t>(*value);
        } else if (arg == "--port" && hasValue) {
            auto value = parseNumber(argv[++i], 0xFFFF);
            if (!value || *value == 0) {
                logError("[ruida-tool] bad port: ", argv[i], "\n");
                return std::nullopt;
            }
            opts.port = static_cast<unsigned short>(*value);
        } else if (arg == "--seconds" && hasValue) {
            auto value = parseNumber(argv[++i], 3600);
            if (!value) {
                logError("[ruida-tool] bad duration: ", argv[i], "\n");
                return std::nullopt;
            }
            opts.duration = std::chrono::seconds(*value);
        } else if (!arg.empty() && arg[0] == '-') {
            logError("[ruida-tool] unknown option ", arg, "\n");
            return std::nullopt;
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

std::optional<protocol::Bytes> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        logError("[ruida-tool] cannot open ", path, "\n");
        return std::nullopt;
    }
    return protocol::Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

protocol::ChecksumBasis basisFor(const Options& opts) {
    return opts.swizzledChecksum ? protocol::ChecksumBasis::Swizzled : protocol::ChecksumBasis::Plain;
}

/// Prints what the emulated controller is asked to do.
class LoggingDriver : public core::Driver {
public:
    void plot(const core::PlotCut& cut) override {
        logInfo("[Driver] plot ", cut.segmentCount(), " segment(s) at ",
                cut.settings.speed, " mm/s, ", cut.points.back().power, "% to (",
                cut.points.back().x, ", ", cut.points.back().y, ")\n");
    }
    void plotStart() override { logInfo("[Driver] plot start\n"); }
    void moveAbs(core::Axis axis, std::int32_t um) override {
        logInfo("[Driver] move ", axisName(axis), " to ", um, " um\n");
    }
    void moveRel(core::Axis axis, std::int32_t um) override {
        logInfo("[Driver] move ", axisName(axis), " by ", um, " um\n");
    }
    void home() override { logInfo("[Driver] home\n"); }
    void pause() override { logInfo("[Driver] pause\n"); }
    void resume() override { logInfo("[Driver] resume\n"); }
    void reset() override { logInfo("[Driver] reset\n"); }
    void jog(core::Axis axis, int direction, bool pressed) override {
        logInfo("[Driver] jog ", axisName(axis), direction > 0 ? "+" : "-",
                pressed ? " pressed" : " released", "\n");
    }
    void laserOn() override { logInfo("[Driver] laser on\n"); }
    void laserOff() override { logInfo("[Driver] laser off\n"); }

private:
    static const char* axisName(core::Axis axis) {
        switch (axis) {
            case core::Axis::X: return "X";
            case core::Axis::Y: return "Y";
            case core::Axis::Z: return "Z";
            default:            return "U";
        }
    }
};

int runDecode(const Options& opts) {
    if (opts.args.size() != 1) {
        usage();
        return 2;
    }
    auto data = readFile(opts.args[0]);
    if (!data) {
        return 1;
    }

    protocol::Program program(opts.magic.value_or(config::RUIDA_MAGIC_DEFAULT));
    program.writeBlob(data->data(), data->size(), opts.magic);
    logInfo("[ruida-tool] ", program.commands().size(), " command(s), magic 0x",
            std::hex, static_cast<int>(program.codec().magic()), std::dec, "\n");

    protocol::CursorState state;
    int failures = 0;
    for (const auto& command : program.commands()) {
        auto step = protocol::decodeCommand(state, command);
        if (!step) {
            logError(step.error().where, "\t", step.error().what, "\n");
            ++failures;
            continue;
        }
        state = step->state;
        logInfo(protocol::hexDump(command), "\t", step->description, "\n");
    }
    return failures == 0 ? 0 : 1;
}

int runEmulate(const Options& opts) {
    core::SignalBus bus;
    LoggingDriver driver;

    config::EmulatorConfig cfg;
    cfg.checksumBasis = basisFor(opts);
    cfg.port = opts.port;
    if (opts.magic) {
        cfg.magic = *opts.magic;
    }

    emulator::Emulator emulator(cfg, &driver, &bus);
    emulator::EmulatorServer server(emulator);
    if (auto started = server.start(cfg.port, cfg.jogPort); !started) {
        logError("[ruida-tool] emulator failed to start: ", started.error().message(), "\n");
        return 1;
    }

    logInfo("[ruida-tool] emulating on udp ", cfg.port, " (jog ", cfg.jogPort, "), Ctrl-C to stop\n");
    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    server.stop();
    logInfo("[ruida-tool] ", emulator.plotted().size(), " plot cut(s) committed\n");
    return 0;
}

std::unique_ptr<session::Session> openSession(const std::string& host, const Options& opts,
                                              std::uint8_t magic, core::SignalBus& bus) {
    config::UdpTransportConfig transportCfg;
    transportCfg.host = host;

    config::SessionConfig sessionCfg;
    sessionCfg.magic = magic;
    sessionCfg.checksumBasis = basisFor(opts);

    auto session = std::make_unique<session::Session>(
        std::make_unique<transport::UdpTransport>(transportCfg), sessionCfg, &bus);
    session->start();
    return session;
}

bool waitConnected(session::Session& session, std::chrono::seconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!session.connected()) {
        if (g_interrupted || std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

int runSend(const Options& opts) {
    if (opts.args.size() != 2) {
        usage();
        return 2;
    }
    auto data = readFile(opts.args[1]);
    if (!data) {
        return 1;
    }

    protocol::Program program(opts.magic.value_or(config::RUIDA_MAGIC_DEFAULT));
    program.writeBlob(data->data(), data->size(), opts.magic);
    if (program.empty()) {
        logError("[ruida-tool] no commands in ", opts.args[1], "\n");
        return 1;
    }

    core::SignalBus bus;
    bus.subscribe(core::topics::SessionEvents, [](const std::any& payload) {
        logInfo("[ruida-tool] ", std::any_cast<std::string>(payload), "\n");
    });

    auto session = openSession(opts.args[0], opts, program.codec().magic(), bus);
    if (!waitConnected(*session, std::chrono::seconds(10))) {
        logError("[ruida-tool] no answer from ", opts.args[0], "\n");
        session->disconnect();
        return 1;
    }

    controller::RuidaController controller(*session, {}, &bus);
    if (auto sent = controller.send(program); !sent) {
        logError("[ruida-tool] send failed: ", sent.error().message(), "\n");
        session->disconnect();
        return 1;
    }
    const bool done = controller.waitSent(config::RUIDA_GROSS_TIMEOUT * 2);
    const auto stats = session->stats();
    logInfo("[ruida-tool] ", stats.sends, " packet(s), ", stats.resends, " resend(s), ",
            stats.naks, " NAK(s)\n");
    session->disconnect();
    return done ? 0 : 1;
}

int runStatus(const Options& opts) {
    if (opts.args.size() != 1) {
        usage();
        return 2;
    }

    core::SignalBus bus;
    bus.subscribe(core::topics::Position, [](const std::any& payload) {
        const auto& change = std::any_cast<const controller::PositionChange&>(payload);
        logInfo("[ruida-tool] position ", change.x, ", ", change.y, "\n");
    });
    bus.subscribe(core::topics::Status, [](const std::any& payload) {
        logInfo("[ruida-tool] status ", std::any_cast<std::string>(payload), "\n");
    });
    bus.subscribe(core::topics::SessionEvents, [](const std::any& payload) {
        logInfo("[ruida-tool] ", std::any_cast<std::string>(payload), "\n");
    });

    auto session = openSession(opts.args[0], opts, opts.magic.value_or(config::RUIDA_MAGIC_DEFAULT), bus);
    controller::RuidaController controller(*session, {}, &bus);
    controller.start();

    const auto deadline = std::chrono::steady_clock::now() + opts.duration;
    while (!g_interrupted && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    controller.stop();

    const auto status = controller.status();
    logInfo("[ruida-tool] card 0x", std::hex, status.cardId, std::dec,
            ", bed ", status.bedWidthMm, " x ", status.bedHeightMm, " mm, ",
            status.label, ", at ", status.nativeX, ", ", status.nativeY, " um\n");
    const bool answered = session->connected();
    session->disconnect();
    return answered ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        usage();
        return 2;
    }
    log::setVerbose(opts->verbose);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    if (opts->command == "decode") {
        return runDecode(*opts);
    }
    if (opts->command == "emulate") {
        return runEmulate(*opts);
    }
    if (opts->command == "send") {
        return runSend(*opts);
    }
    if (opts->command == "status") {
        return runStatus(*opts);
    }
    usage();
    return 2;
}
