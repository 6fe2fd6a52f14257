#include "database.h"
#include "llama-completion.h"
#include "piper-synthesizer.h"
#include "record-lookup.h"
#include "websocket-server.h"
#include "whisper-transcriber.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

// Global service instance for signal handling
std::unique_ptr<VoiceChatServer> g_server;
std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int signal) {
    (void)signal;
    g_shutdown_requested.store(true);
}

struct VoiceChatServerArgs {
    int port = 8000;
    std::string database_path = "voicechat.db";
    std::string whisper_model = "models/ggml-base.en.bin";
    std::string llama_model = "models/llama-7b-q4_0.gguf";
    std::string piper_model = "models/voice.onnx";
    std::string espeak_data = "espeak-ng-data";
    int n_threads = 4;
    int n_ctx = 4096;
    bool use_gpu = true;
    int stt_timeout_ms = 30000;
    int llm_timeout_ms = 60000;
    int tts_timeout_ms = 15000;
    int lookup_timeout_ms = 10000;
    int max_synthesis = 4;
    int session_timeout_s = 3600;
    AudioFrameMode audio_frames = AudioFrameMode::Replace;
    std::string audio_dump_dir;
    bool drop_after_cancel = false;
    bool verbose = false;
};

void print_voicechat_usage(const char* program_name) {
    std::cout << "\n🎙️ Voice Chat Server\n" << std::endl;
    std::cout << "Usage: " << program_name << " [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                 Show this help message" << std::endl;
    std::cout << "  -p, --port PORT            WebSocket port [8000]" << std::endl;
    std::cout << "  -d, --database PATH        Database path [voicechat.db]" << std::endl;
    std::cout << "  --whisper-model PATH       Whisper model [models/ggml-base.en.bin]" << std::endl;
    std::cout << "  --llama-model PATH         LLaMA model [models/llama-7b-q4_0.gguf]" << std::endl;
    std::cout << "  --piper-model PATH         Piper voice [models/voice.onnx]" << std::endl;
    std::cout << "  --espeak-data PATH         espeak-ng data directory [espeak-ng-data]" << std::endl;
    std::cout << "  -t, --threads N            Inference threads [4]" << std::endl;
    std::cout << "  --n-ctx N                  LLaMA context size [4096]" << std::endl;
    std::cout << "  --no-gpu                   Disable GPU acceleration" << std::endl;
    std::cout << "  --stt-timeout MS           Transcription timeout [30000]" << std::endl;
    std::cout << "  --llm-timeout MS           Completion timeout [60000]" << std::endl;
    std::cout << "  --tts-timeout MS           Per-sentence synthesis timeout [15000]" << std::endl;
    std::cout << "  --lookup-timeout MS        Record lookup timeout [10000]" << std::endl;
    std::cout << "  --max-synthesis N          Concurrent synthesis calls per turn [4]" << std::endl;
    std::cout << "  --session-timeout S        Evict sessions idle this long [3600]" << std::endl;
    std::cout << "  --audio-frames MODE        replace | append [replace]" << std::endl;
    std::cout << "  --audio-dump-dir DIR       Save each utterance as a WAV file" << std::endl;
    std::cout << "  --drop-after-cancel        Discard in-flight audio on interrupt" << std::endl;
    std::cout << "  -v, --verbose              Verbose output" << std::endl;
    std::cout << "\nSettings stored in the database's system_config table are used as" << std::endl;
    std::cout << "defaults; command-line options override them." << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << program_name << " -p 8000 --llama-model models/llama-3.2-3b-q4.gguf -v" << std::endl;
    std::cout << std::endl;
}

static bool parse_audio_frames(const std::string& value, AudioFrameMode& mode) {
    if (value == "replace") { mode = AudioFrameMode::Replace; return true; }
    if (value == "append") { mode = AudioFrameMode::Append; return true; }
    return false;
}

bool parse_voicechat_args(int argc, char** argv, VoiceChatServerArgs& args) {
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") {
                print_voicechat_usage(argv[0]);
                return false;
            }
            else if (arg == "-p" || arg == "--port") {
                args.port = std::stoi(next());
            }
            else if (arg == "-d" || arg == "--database") {
                args.database_path = next();
            }
            else if (arg == "--whisper-model") {
                args.whisper_model = next();
            }
            else if (arg == "--llama-model") {
                args.llama_model = next();
            }
            else if (arg == "--piper-model") {
                args.piper_model = next();
            }
            else if (arg == "--espeak-data") {
                args.espeak_data = next();
            }
            else if (arg == "-t" || arg == "--threads") {
                args.n_threads = std::stoi(next());
            }
            else if (arg == "--n-ctx") {
                args.n_ctx = std::stoi(next());
            }
            else if (arg == "--no-gpu") {
                args.use_gpu = false;
            }
            else if (arg == "--stt-timeout") {
                args.stt_timeout_ms = std::stoi(next());
            }
            else if (arg == "--llm-timeout") {
                args.llm_timeout_ms = std::stoi(next());
            }
            else if (arg == "--tts-timeout") {
                args.tts_timeout_ms = std::stoi(next());
            }
            else if (arg == "--lookup-timeout") {
                args.lookup_timeout_ms = std::stoi(next());
            }
            else if (arg == "--max-synthesis") {
                args.max_synthesis = std::stoi(next());
            }
            else if (arg == "--session-timeout") {
                args.session_timeout_s = std::stoi(next());
            }
            else if (arg == "--audio-frames") {
                std::string mode = next();
                if (!parse_audio_frames(mode, args.audio_frames)) {
                    std::cout << "❌ Invalid --audio-frames value: " << mode << std::endl;
                    return false;
                }
            }
            else if (arg == "--audio-dump-dir") {
                args.audio_dump_dir = next();
            }
            else if (arg == "--drop-after-cancel") {
                args.drop_after_cancel = true;
            }
            else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            }
            else {
                std::cout << "❌ Unknown argument: " << arg << std::endl;
                print_voicechat_usage(argv[0]);
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cout << "❌ Invalid arguments: " << e.what() << std::endl;
        return false;
    }

    if (args.port <= 0 || args.port > 65535 || args.max_synthesis <= 0 || args.session_timeout_s <= 0 ||
        args.stt_timeout_ms <= 0 || args.llm_timeout_ms <= 0 || args.tts_timeout_ms <= 0 ||
        args.lookup_timeout_ms <= 0) {
        std::cout << "❌ Ports, timeouts and limits must be positive" << std::endl;
        return false;
    }
    return true;
}

// Only the database path is needed before the database can supply defaults
static std::string scan_database_path(int argc, char** argv, const std::string& fallback) {
    for (int i = 1; i + 1 < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-d" || arg == "--database") {
            return argv[i + 1];
        }
    }
    return fallback;
}

static void read_int_config(Database& db, const char* key, int& value) {
    std::optional<std::string> text = db.get_config_value(key);
    if (!text) return;
    try {
        value = std::stoi(*text);
    } catch (const std::exception&) {
        std::cout << "⚠️ Ignoring invalid system_config value " << key << "='" << *text << "'" << std::endl;
    }
}

static void apply_database_defaults(Database& db, VoiceChatServerArgs& args) {
    read_int_config(db, "server_port", args.port);
    read_int_config(db, "stt_timeout_ms", args.stt_timeout_ms);
    read_int_config(db, "llm_timeout_ms", args.llm_timeout_ms);
    read_int_config(db, "tts_timeout_ms", args.tts_timeout_ms);
    read_int_config(db, "lookup_timeout_ms", args.lookup_timeout_ms);
    read_int_config(db, "max_synthesis", args.max_synthesis);
    read_int_config(db, "session_timeout", args.session_timeout_s);
    if (auto v = db.get_config_value("whisper_model_path")) args.whisper_model = *v;
    if (auto v = db.get_config_value("llama_model_path")) args.llama_model = *v;
    if (auto v = db.get_config_value("piper_model_path")) args.piper_model = *v;
    if (auto v = db.get_config_value("piper_espeak_data_path")) args.espeak_data = *v;
    if (auto v = db.get_config_value("audio_frames")) {
        if (!parse_audio_frames(*v, args.audio_frames)) {
            std::cout << "⚠️ Ignoring invalid system_config value audio_frames='" << *v << "'" << std::endl;
        }
    }
}

int main(int argc, char** argv) {
    std::cout << "🎙️ Voice Chat Server v1.0" << std::endl;
    std::cout << "🔗 Speech in, speech out over a WebSocket" << std::endl;
    std::cout << std::endl;

    VoiceChatServerArgs args;
    args.database_path = scan_database_path(argc, argv, args.database_path);

    auto database = std::make_shared<Database>();
    if (!database->init(args.database_path)) {
        std::cout << "❌ Failed to initialize database: " << args.database_path << std::endl;
        return 1;
    }
    apply_database_defaults(*database, args);

    // Command line overrides database defaults
    if (!parse_voicechat_args(argc, argv, args)) {
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    database->set_orchestrator_status("starting");
    std::cout << "💾 Database: " << args.database_path << " (" << database->count_transcripts()
              << " patient transcripts)" << std::endl;

    WhisperConfig whisper_config;
    whisper_config.model_path = args.whisper_model;
    whisper_config.n_threads = args.n_threads;
    whisper_config.use_gpu = args.use_gpu;
    whisper_config.max_inference = std::chrono::milliseconds(args.stt_timeout_ms);
    whisper_config.verbose = args.verbose;

    LlamaConfig llama_config;
    llama_config.model_path = args.llama_model;
    llama_config.n_threads = args.n_threads;
    llama_config.n_ctx = args.n_ctx;
    llama_config.use_gpu = args.use_gpu;
    llama_config.verbose = args.verbose;

    PiperConfig piper_config;
    piper_config.model_path = args.piper_model;
    piper_config.espeak_data_path = args.espeak_data;
    piper_config.verbose = args.verbose;

    auto transcriber = std::make_shared<WhisperTranscriber>();
    auto completion = std::make_shared<LlamaCompletion>();
    auto synthesizer = std::make_shared<PiperSynthesizer>();
    if (!transcriber->load(whisper_config) || !completion->load(llama_config) || !synthesizer->load(piper_config)) {
        std::cout << "❌ Failed to load models" << std::endl;
        database->set_orchestrator_status("error");
        return 1;
    }

    Collaborators collaborators;
    collaborators.transcriber = transcriber;
    collaborators.completion = completion;
    collaborators.synthesizer = synthesizer;
    collaborators.lookup = std::make_shared<DatabaseRecordLookup>(database);

    ServerConfig config;
    config.port = args.port;
    config.session_timeout = std::chrono::seconds(args.session_timeout_s);
    config.verbose = args.verbose;
    config.orchestrator.stt_timeout = std::chrono::milliseconds(args.stt_timeout_ms);
    config.orchestrator.llm_timeout = std::chrono::milliseconds(args.llm_timeout_ms);
    config.orchestrator.lookup_timeout = std::chrono::milliseconds(args.lookup_timeout_ms);
    config.orchestrator.synthesis.timeout = std::chrono::milliseconds(args.tts_timeout_ms);
    config.orchestrator.synthesis.max_in_flight = static_cast<size_t>(args.max_synthesis);
    config.orchestrator.synthesis.drop_after_cancel = args.drop_after_cancel;
    config.orchestrator.audio_frames = args.audio_frames;
    config.orchestrator.audio_dump_dir = args.audio_dump_dir;
    config.orchestrator.verbose = args.verbose;

    g_server = std::make_unique<VoiceChatServer>(config, collaborators);
    if (!g_server->start()) {
        std::cout << "❌ Failed to start voice chat server" << std::endl;
        database->set_orchestrator_status("error");
        return 1;
    }
    database->set_orchestrator_status("running");

    std::cout << "✅ Voice chat server started successfully" << std::endl;
    std::cout << "💡 Press Ctrl+C to shutdown gracefully" << std::endl;
    std::cout << std::endl;

    while (!g_shutdown_requested.load() && g_server->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::cout << "\n🛑 Shutdown signal received" << std::endl;
    g_server->stop();
    g_server.reset();
    database->set_orchestrator_status("stopped");

    std::cout << "✅ Voice chat server shutdown complete" << std::endl;
    return 0;
}
