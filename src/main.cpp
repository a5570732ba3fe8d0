#include "config.hpp"
#include "config_loader.hpp"
#include "diagnostics.hpp"
#include "progress.hpp"
#include "reflow_engine.hpp"
#include "segmentation.hpp"
#include "transcript.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " format <text|file> [options]\n"
              << "       " << program << " config [--config FILE]\n"
              << "\nOptions:\n"
              << "  --is-file                 Input is a UTF-8 text file path\n"
              << "  --transcript-json         Input is a transcript JSON file ({text, segments, language})\n"
              << "  --config FILE             JSON rule tables and thresholds (default: ~/.reflow/config.json)\n"
              << "  --max-chunk-bytes N       Segmenter input limit in bytes (default: 35000)\n"
              << "  --segmenter-cmd CMD       External sentence segmenter: text on stdin, one sentence per line\n"
              << "  --segmenter-timeout-ms N  Give up on the external segmenter after N ms (default: 30000)\n"
              << "  --parallel                Process chunks on worker threads\n"
              << "  --quiet                   Only warnings and errors on stderr\n"
              << "  -h, --help                Show this help\n"
              << "\nOutput:\n"
              << "  Progress events and the final result are printed to stdout as one JSON object per line.\n"
              << std::endl;
}

void print_failure(const std::string& error) {
    nlohmann::json out = {{"success", false}, {"error", error}};
    std::cout << out.dump() << std::endl;
}

bool parse_int(const char* value, long& out) {
    char* end = nullptr;
    errno = 0;
    out = std::strtol(value, &end, 10);
    return errno == 0 && end != value && *end == '\0';
}

bool read_file(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    content = ss.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string mode = argv[1];
    if (mode == "-h" || mode == "--help") {
        print_usage(argv[0]);
        return 0;
    }
    if (mode != "format" && mode != "config") {
        std::cerr << "Unknown command: " << mode << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::string input;
    int i = 2;
    if (mode == "format") {
        if (i >= argc) {
            print_usage(argv[0]);
            return 1;
        }
        input = argv[i++];
    }

    bool is_file = false;
    bool transcript_json = false;
    bool quiet = false;
    std::string config_path;
    std::string segmenter_cmd;
    long max_chunk_bytes = -1;
    long segmenter_timeout_ms = -1;
    bool parallel = false;

    for (; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--is-file") == 0) {
            is_file = true;
        }
        else if (strcmp(argv[i], "--transcript-json") == 0) {
            transcript_json = true;
        }
        else if (strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        }
        else if (strcmp(argv[i], "--parallel") == 0) {
            parallel = true;
        }
        else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (strcmp(argv[i], "--segmenter-cmd") == 0 && i + 1 < argc) {
            segmenter_cmd = argv[++i];
        }
        else if (strcmp(argv[i], "--max-chunk-bytes") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], max_chunk_bytes) || max_chunk_bytes <= 0) {
                std::cerr << "Invalid --max-chunk-bytes: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (strcmp(argv[i], "--segmenter-timeout-ms") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], segmenter_timeout_ms) || segmenter_timeout_ms <= 0) {
                std::cerr << "Invalid --segmenter-timeout-ms: " << argv[i] << std::endl;
                return 1;
            }
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Configuration problems are fatal and reported before any processing
    reflow::ReflowConfig config;
    std::string error;
    bool loaded = config_path.empty()
        ? reflow::ConfigLoader::load_user_config(config, error)
        : reflow::ConfigLoader::load_from_file(config_path, config, error);
    if (!loaded) {
        print_failure(error);
        return 1;
    }
    if (max_chunk_bytes > 0) config.max_chunk_bytes = static_cast<std::size_t>(max_chunk_bytes);
    if (segmenter_timeout_ms > 0) config.segmenter_timeout_ms = static_cast<int>(segmenter_timeout_ms);
    if (parallel) config.parallel_chunks = true;

    error = reflow::validate_config(config);
    if (!error.empty()) {
        print_failure("invalid configuration: " + error);
        return 1;
    }

    if (mode == "config") {
        std::cout << reflow::ConfigLoader::to_json(config).dump(2) << std::endl;
        return 0;
    }

    std::string text = input;
    if (is_file || transcript_json) {
        if (!read_file(input, text)) {
            print_failure("Input file not found: " + input);
            return 1;
        }
    }
    if (transcript_json) {
        reflow::Transcript transcript;
        if (!reflow::parse_transcript(text, transcript, error)) {
            print_failure(error);
            return 1;
        }
        text = transcript.text;
    }

    reflow::StreamDiagnosticSink diagnostics(std::cerr, !quiet);
    reflow::JsonLineProgressSink progress(std::cout);

    reflow::ReflowEngine engine(config, &diagnostics);
    engine.set_progress_sink(&progress);
    if (!segmenter_cmd.empty()) {
        engine.set_segmenter(std::make_shared<reflow::CommandSegmenter>(segmenter_cmd));
    }

    reflow::ReflowResult result = engine.reflow(text);
    std::cout << reflow::to_json(result).dump() << std::endl;

    return result.success ? 0 : 1;
}
