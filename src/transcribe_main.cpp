#include "config.hpp"
#include "config_loader.hpp"
#include "diagnostics.hpp"
#include "progress.hpp"
#include "reflow_engine.hpp"
#include "transcriber.hpp"
#include <chrono>
#include <cstring>
#include <iostream>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <audio.f32> [options]\n"
              << "\nOptions:\n"
              << "  --model NAME        faster-whisper-small, faster-whisper-medium,\n"
              << "                      openai-whisper-large-v3-turbo (default: faster-whisper-small)\n"
              << "  -m, --model-dir DIR Directory containing ggml models (default: models)\n"
              << "  -t, --threads N     Number of CPU threads (default: 4)\n"
              << "  -l, --language LANG Language code or \"auto\" (default: ja)\n"
              << "  --format            Reflow the transcript text into paragraphs\n"
              << "  --config FILE       Reflow config used with --format\n"
              << "  -h, --help          Show this help\n"
              << "\nInput is raw 16kHz mono float32 PCM, e.g.:\n"
              << "  ffmpeg -i vocals.wav -f f32le -ar 16000 -ac 1 vocals.f32\n"
              << std::endl;
}

void print_failure(const std::string& error) {
    nlohmann::json out = {{"success", false}, {"error", error}};
    std::cout << out.dump() << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    reflow::TranscribeConfig config;
    std::string input;
    std::string reflow_config_path;
    bool format = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            const char* model = argv[++i];
            if (strcmp(model, "faster-whisper-small") == 0) {
                config.model_quality = reflow::ModelQuality::Small;
            } else if (strcmp(model, "faster-whisper-medium") == 0) {
                config.model_quality = reflow::ModelQuality::Medium;
            } else if (strcmp(model, "openai-whisper-large-v3-turbo") == 0) {
                config.model_quality = reflow::ModelQuality::LargeTurbo;
            } else {
                std::cerr << "Unknown model: " << model << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model-dir") == 0) && i + 1 < argc) {
            config.model_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            config.n_threads = std::atoi(argv[++i]);
            if (config.n_threads <= 0) config.n_threads = 4;
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.language = argv[++i];
        }
        else if (strcmp(argv[i], "--format") == 0) {
            format = true;
        }
        else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            reflow_config_path = argv[++i];
        }
        else if (argv[i][0] != '-' && input.empty()) {
            input = argv[i];
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    reflow::ReflowConfig reflow_config;
    std::string error;
    if (format) {
        bool loaded = reflow_config_path.empty()
            ? reflow::ConfigLoader::load_user_config(reflow_config, error)
            : reflow::ConfigLoader::load_from_file(reflow_config_path, reflow_config, error);
        if (!loaded) {
            print_failure(error);
            return 1;
        }
    }

    auto start_time = std::chrono::steady_clock::now();

    reflow::StreamDiagnosticSink diagnostics(std::cerr);
    reflow::JsonLineProgressSink progress_sink(std::cout);
    reflow::ProgressReporter progress(&progress_sink, diagnostics);
    progress.report("transcription", 5);

    std::vector<float> audio;
    if (!reflow::load_pcm_f32(input, audio, error)) {
        print_failure(error);
        return 1;
    }

    reflow::Transcriber transcriber;
    if (!transcriber.initialize(config.get_model_path(), config.n_threads)) {
        print_failure("Failed to load model: " + config.get_model_path());
        return 1;
    }
    progress.report("transcription", 10);

    transcriber.set_language(config.language);
    transcriber.set_profile(reflow::get_profile(config.model_quality));
    transcriber.set_progress_callback([&progress](int percent) {
        // Leave room for the final event
        progress.report("transcription", 10 + percent * 89 / 100, true);
    });

    reflow::TranscriptionResult result = transcriber.transcribe(audio);
    if (!result.success) {
        print_failure(result.error);
        return 1;
    }
    progress.report("transcription", 100);

    nlohmann::json out = reflow::to_json(result.transcript);
    if (format) {
        reflow::ReflowEngine engine(reflow_config, &diagnostics);
        engine.set_progress_sink(&progress_sink);
        reflow::ReflowResult formatted = engine.reflow(result.transcript.text);
        out["formattedText"] = formatted.text;
        out["formattedByEngine"] = formatted.formatted_by_engine;
        if (!formatted.success) {
            out["formatError"] = formatted.error;
        }
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);
    out["processingTime"] = elapsed.count();
    out["modelUsed"] = reflow::get_profile(config.model_quality).name;
    out["confidence"] = result.confidence;

    nlohmann::json envelope = {{"success", true}, {"result", out}};
    std::cout << envelope.dump() << std::endl;
    return 0;
}
