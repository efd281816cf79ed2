#include "audio_io.h"
#include "config.h"
#include "curl_websocket.h"
#include "event_loop.h"
#include "logger.h"
#include "speech_control.h"
#include "stt_engine.h"
#include "whisper_recognizer.h"
#include <signal.h>
#include <csignal>
#include <unistd.h>
#include <fstream>
#include <iostream>

namespace parley {

static volatile std::sig_atomic_t g_shutdown_requested = 0;

// Only async-signal-safe work here; the loop notices the flag on its next check
void signal_handler(int signal) {
    g_shutdown_requested = 1;
}

constexpr int SHUTDOWN_POLL_MS = 100;

/// Stop the loop once a signal has been received
static void watch_for_shutdown(EventLoop& loop) {
    loop.post_delayed(SHUTDOWN_POLL_MS, [&loop]() {
        if (g_shutdown_requested) {
            Logger::info("Shutting down...");
            loop.stop();
            return;
        }
        watch_for_shutdown(loop);
    });
}

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [config.json]\n"
              << "       " << program << " --list-devices\n"
              << "       " << program << " --say \"text\" [config.json]\n";
}

/// config/config.json next to the executable's parent directory, if present
static std::string default_config_path() {
    std::string config_path = "config/config.json";
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            exe_dir = exe_dir.substr(0, pos);
            std::string candidate = exe_dir + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }
    return config_path;
}

} // namespace parley

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    parley::Logger::initialize(parley::LogLevel::INFO);

    std::string config_path;
    std::string say_text;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            parley::AudioIO::list_devices();
            parley::Logger::shutdown();
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            parley::print_usage(argv[0]);
            parley::Logger::shutdown();
            return 0;
        } else if (arg == "--say") {
            if (i + 1 >= argc) {
                parley::print_usage(argv[0]);
                parley::Logger::shutdown();
                return 1;
            }
            say_text = argv[++i];
        } else {
            config_path = arg;
        }
    }
    if (config_path.empty()) {
        config_path = parley::default_config_path();
    }

    parley::Config config = parley::Config::load_from_file(config_path);
    parley::LogLevel level = parley::Logger::parse_level(config.logging.level);
    if (!config.logging.file.empty()) {
        parley::Logger::shutdown();
        parley::Logger::initialize(level, config.logging.file);
    } else {
        parley::Logger::set_level(level);
    }

    if (config.synthesis.api_key.empty()) {
        LOG_WARN("No synthesis API key (synthesis.api_key or ELEVENLABS_API_KEY); replies will be refused");
    }

    parley::EventLoop loop;

    // One whisper model shared by every recognizer instance
    auto engine = std::make_shared<parley::STTEngine>(config.recognition);
    if (say_text.empty() && !engine->is_ready()) {
        LOG_ERROR("Whisper model not loaded: " + config.recognition.model_path);
        parley::Logger::shutdown();
        return 1;
    }

    parley::SpeechControl::Backends backends;
    backends.request_microphone = [&config]() {
        return parley::AudioIO::check_microphone(config.audio.input_device);
    };
    backends.create_output = [&loop, &config]() {
        return parley::PortAudioOutput::open(loop, config.audio.output_device, config.audio.output_sample_rate);
    };
    backends.create_recognizer = [&loop, &config, engine]() -> std::unique_ptr<parley::SpeechRecognizer> {
        return std::make_unique<parley::WhisperRecognizer>(loop, engine, config);
    };
    backends.create_socket = [&loop, &config]() -> std::unique_ptr<parley::SynthesisSocket> {
        return std::make_unique<parley::CurlWebSocket>(loop, config.synthesis.connect_timeout_ms);
    };

    std::unique_ptr<parley::SpeechControl> control;

    parley::SpeechControl::Events events;
    events.on_transcript_update = [&loop, &control](const std::string& text, bool is_final) {
        if (!is_final) {
            LOG_INFO("... " + text);
            return;
        }
        LOG_INFO("User: " + text);
        // Echo responder: reply on the next loop turn, outside the recognizer's callback
        loop.post([&control, text]() {
            if (!control) return;
            auto spoken = control->speak("You said: " + text);
            if (spoken.is_error()) {
                LOG_WARN("Reply refused: " + parley::to_string(spoken.error()));
            }
        });
    };
    events.on_error = [](const parley::Error& error) {
        LOG_ERROR("Conversation error: " + parley::to_string(error));
    };

    control = std::make_unique<parley::SpeechControl>(loop, config, std::move(backends), std::move(events));

    // Set up signal handlers
    std::signal(SIGINT, parley::signal_handler);
    std::signal(SIGTERM, parley::signal_handler);
    parley::watch_for_shutdown(loop);

    int result = 0;
    auto initialized = control->initialize();
    if (initialized.is_error()) {
        result = 1;
    } else if (!say_text.empty()) {
        // One-shot: exit once the reply has been played out
        bool spoke = false;
        control->conversation().subscribe([&loop, &spoke](const parley::ConversationSnapshot& snapshot) {
            if (snapshot.turn.is_agent_speaking) {
                spoke = true;
            } else if (spoke) {
                loop.stop();
            }
        });
        auto spoken = control->speak(say_text);
        if (spoken.is_error()) {
            LOG_ERROR("Cannot speak: " + parley::to_string(spoken.error()));
            result = 1;
        } else {
            loop.run();
        }
    } else {
        LOG_INFO("Listening; press Ctrl+C to quit");
        loop.run();
    }

    control->stop();
    control.reset();
    loop.poll();

    // Shutdown logger
    parley::Logger::shutdown();

    return result;
}
