#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "Capture/RtAudioBackend.hpp"
#include "Chunking/ChunkFileWriter.hpp"
#include "Chunking/UploadPayload.hpp"
#include "Recorder/AudioRecorder.hpp"
#include "common/RecorderConfig.hpp"
#include "common/RecorderError.hpp"
#include "common/debug_log.hpp"

namespace fs = std::filesystem;
using namespace meetcapture;

class RecorderApplication {
public:
    RecorderApplication(const RecorderConfig& config, const fs::path& outputDir)
        : _config(config), _outputDir(outputDir), _running(true) {}

    bool Run() {
        std::error_code ec;
        fs::create_directories(_outputDir, ec);
        if (ec) {
            std::cerr << "Cannot create output directory " << _outputDir << ": " << ec.message() << std::endl;
            return false;
        }

        _writer = std::make_unique<ChunkFileWriter>(_outputDir, UploadIdentity{});
        try {
            _recorder = std::make_unique<AudioRecorder>(std::make_shared<RtAudioBackend>(), _config);
        } catch (const std::exception& e) {
            std::cerr << "Failed to initialize recorder: " << e.what() << std::endl;
            return false;
        }

        PrintHelp();

        std::string command;
        while (_running && std::cin >> command) {
            if (!ProcessCommand(command)) {
                break;
            }
        }

        _recorder->Stop();
        return true;
    }

private:
    bool ProcessCommand(const std::string& command) {
        if (command == "start") {
            Start(true, true);
        }
        else if (command == "start-mic") {
            Start(true, false);
        }
        else if (command == "start-system") {
            Start(false, true);
        }
        else if (command == "pause") {
            if (!_recorder->Pause()) {
                std::cout << "Nothing to pause" << std::endl;
            }
        }
        else if (command == "resume") {
            if (!_recorder->Resume()) {
                std::cout << "Nothing to resume" << std::endl;
            }
        }
        else if (command == "stop") {
            _recorder->Stop();
        }
        else if (command == "status") {
            PrintStatus();
        }
        else if (command == "devices") {
            RtAudioBackend::ListDevices();
        }
        else if (command == "quit" || command == "exit") {
            _running = false;
            return false;
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
        return true;
    }

    void Start(bool mic, bool system) {
        StartOptions options;
        options.includeMic = mic;
        options.includeSystem = system;
        options.sink = _writer.get();
        try {
            StartResult result = _recorder->Start(options);
            std::cout << "[STATE] Recording (mic: " << (result.hasMic ? "yes" : "no")
                      << ", system: " << (result.hasSystem ? "yes" : "no")
                      << ", encoder: " << ToString(result.path) << ")" << std::endl;
        } catch (const RecorderError& e) {
            std::cerr << "Start failed [" << ToString(e.Code()) << "]: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Start failed: " << e.what() << std::endl;
        }
    }

    void PrintStatus() {
        RecorderStatus status = _recorder->GetStatus();
        std::cout << "[STATE] " << ToString(status.state)
                  << " (mic: " << (status.hasMic ? "yes" : "no")
                  << ", system: " << (status.hasSystem ? "yes" : "no") << ")" << std::endl;
    }

    void PrintHelp() {
        std::cout << "\n=== MeetCapture ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  start         - Record microphone and system audio" << std::endl;
        std::cout << "  start-mic     - Record microphone only" << std::endl;
        std::cout << "  start-system  - Record system audio only" << std::endl;
        std::cout << "  pause         - Pause recording" << std::endl;
        std::cout << "  resume        - Resume recording" << std::endl;
        std::cout << "  stop          - Stop and flush the session" << std::endl;
        std::cout << "  status        - Show recorder state" << std::endl;
        std::cout << "  devices       - List audio devices" << std::endl;
        std::cout << "  help          - Show this help" << std::endl;
        std::cout << "  quit          - Exit application" << std::endl;
        std::cout << "===================\n" << std::endl;
    }

    RecorderConfig _config;
    fs::path _outputDir;
    std::unique_ptr<ChunkFileWriter> _writer;
    std::unique_ptr<AudioRecorder> _recorder;
    std::atomic<bool> _running;
};

int main(int argc, char* argv[]) {
    RecorderConfig config;
    fs::path outputDir = "recordings";

    if (argc > 1) {
        try {
            config = LoadRecorderConfig(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid config " << argv[1] << ": " << e.what() << std::endl;
            std::cout << "Usage: " << argv[0] << " [config.json] [output_dir]" << std::endl;
            return 1;
        }
    }
    if (argc > 2) {
        outputDir = argv[2];
    }

    MEETCAPTURE_LOG("Writing chunks to " << outputDir << MEETCAPTURE_LOG_ENDL);

    RecorderApplication app(config, outputDir);
    return app.Run() ? 0 : 1;
}
