// ==============================================================================
// notescope - Command Line Entry Point
// ==============================================================================
// Wires PortAudio capture, the thread tick scheduler and the console renderer
// to the orchestrator, then executes commands read from stdin.
// ==============================================================================

#include "app/command_line.h"
#include "app/console_renderer.h"
#include "capture/portaudio_device.h"
#include "logging/log.h"
#include "pipeline/orchestrator.h"
#include "pipeline/tick_scheduler.h"
#include "version.h"

#include <iostream>
#include <string>

using namespace Notescope;

namespace {

void printDevices(const AudioInputDevice& device, std::ostream& out) {
    const auto devices = device.listInputDevices();
    if (devices.empty()) {
        out << "No input devices found\n";
        return;
    }
    for (const auto& info : devices) {
        out << (info.isDefault ? "* " : "  ") << info.index << ": " << info.name << " ("
            << info.maxInputChannels << " ch, " << info.defaultSampleRate << " Hz)\n";
    }
}

void printStats(const Orchestrator& orchestrator, std::ostream& out) {
    const PipelineStats stats = orchestrator.stats();
    out << "state " << pipelineStateName(orchestrator.state())
        << ", buffered " << stats.bufferedSamples << " samples"
        << ", published " << stats.ticksPublished
        << ", skipped " << stats.ticksSkipped
        << ", dropped " << stats.ticksDropped
        << ", missed deadlines " << stats.missedDeadlines
        << ", blocks " << stats.blocksCaptured
        << ", overflows " << stats.inputOverflows
        << ", underflows " << stats.inputUnderflows << '\n';
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    const Status parsed = parseCommandLine(argc, argv, options);
    if (!parsed.ok()) {
        std::cerr << NOTESCOPE_PROGRAM_NAME ": " << parsed.toString() << "\n\n" << usageText();
        return 1;
    }
    if (options.showHelp) {
        std::cout << usageText();
        return 0;
    }

    Log::initialize(options.logLevel);
    Log::get()->info(NOTESCOPE_PROGRAM_NAME " " NOTESCOPE_VERSION_STR);

    PortAudioDevice device;
    if (!device.isInitialized()) {
        return 1;
    }

    if (options.listDevices) {
        printDevices(device, std::cout);
        return 0;
    }

    ConsoleRenderer renderer(std::cout);
    ThreadTickScheduler scheduler;
    Orchestrator orchestrator(device, scheduler, renderer);

    const Status prepared = orchestrator.prepare(options.pipeline);
    if (!prepared.ok()) {
        std::cerr << NOTESCOPE_PROGRAM_NAME ": " << prepared.toString() << '\n';
        return 1;
    }

    if (options.autostart) {
        // Failures were already reported through the renderer; stay Idle
        (void)orchestrator.start();
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        const std::string command = trim(line);
        if (command.empty()) continue;

        if (command == "start") {
            const Status status = orchestrator.start();
            if (!status.ok()) std::cerr << status.toString() << '\n';
        } else if (command == "stop") {
            (void)orchestrator.stop();
        } else if (command == "clear") {
            (void)orchestrator.clear();
        } else if (command == "devices") {
            printDevices(device, std::cout);
        } else if (command == "status") {
            printStats(orchestrator, std::cout);
        } else if (command == "help") {
            std::cout << usageText();
        } else if (command == "quit" || command == "exit") {
            break;
        } else {
            std::cerr << "Unknown command '" << command << "' (try 'help')\n";
        }
    }

    (void)orchestrator.stop();
    Log::get()->info("Exiting");
    return 0;
}
