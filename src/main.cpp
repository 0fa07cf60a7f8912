#include "thai_segmenter.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// JSON-lines output, one record per subtitle line
// ============================================================================

// Pre-computed hex digits table (avoids snprintf overhead)
static constexpr char HEX_DIGITS[] = "0123456789abcdef";

static void append_int(std::string& out, int64_t val) {
    if (val == 0) {
        out += '0';
        return;
    }
    if (val < 0) {
        out += '-';
        val = -val;
    }
    char buf[20];
    char* p = buf + 20;
    while (val > 0) {
        *--p = static_cast<char>('0' + (val % 10));
        val /= 10;
    }
    out.append(p, buf + 20 - p);
}

static void escape_json_to(std::string& out, const std::string& s) {
    for (unsigned char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += HEX_DIGITS[(c >> 4) & 0xF];
                    out += HEX_DIGITS[c & 0xF];
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
}

static void append_string_array(std::string& out, const std::vector<std::string>& items) {
    out += '[';
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        escape_json_to(out, items[i]);
        out += '"';
    }
    out += ']';
}

// {"id":N,"input":"...","segments":[...][,"baseline":[...]][,"improved":[...]]}
static std::string build_json_record(
    int64_t id,
    const std::string& input,
    const std::vector<std::string>& segments,
    const std::vector<std::string>* baseline,
    const std::vector<std::string>* improved
) {
    std::string buffer;
    buffer.reserve(512);

    buffer += "{\"id\":";
    append_int(buffer, id);
    buffer += ",\"input\":\"";
    escape_json_to(buffer, input);
    buffer += "\",\"segments\":";
    append_string_array(buffer, segments);
    if (baseline) {
        buffer += ",\"baseline\":";
        append_string_array(buffer, *baseline);
    }
    if (improved) {
        buffer += ",\"improved\":";
        append_string_array(buffer, *improved);
    }
    buffer += '}';
    return buffer;
}

struct Args {
    std::string dict_path;
    std::string config_path;
    std::string cache_path;
    std::string hints_path;
    std::string input_path;
    std::string output_path;
    std::string video_id;
    int limit = -1;
    bool warm_up = true;
    bool debug = false;
};

static Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dict" && i + 1 < argc) {
            args.dict_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--cache" && i + 1 < argc) {
            args.cache_path = argv[++i];
        } else if (arg == "--hints" && i + 1 < argc) {
            args.hints_path = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--video" && i + 1 < argc) {
            args.video_id = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            try {
                args.limit = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Warning: Ignoring invalid --limit " << argv[i] << std::endl;
            }
        } else if (arg == "--no-warmup") {
            args.warm_up = false;
        } else if (arg == "--debug") {
            args.debug = true;
        } else {
            std::cerr << "Warning: Unknown argument " << arg << std::endl;
        }
    }
    return args;
}

// "subs/abc123.th.txt" -> "abc123"
static std::string file_stem(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = name.find('.');
    return dot == std::string::npos || dot == 0 ? name : name.substr(0, dot);
}

int main(int argc, char* argv[]) {
    std::ios_base::sync_with_stdio(false);

    Args args = parse_args(argc, argv);

    if (args.input_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " --input <file> [--output <file>] [--dict <file>]"
                  << " [--config <json>] [--cache <json>] [--hints <json>] [--video <id>]"
                  << " [--limit <n>] [--no-warmup] [--debug]" << std::endl;
        return 1;
    }
    if (args.video_id.empty()) {
        args.video_id = file_stem(args.input_path);
    }

    // 1. Configuration and collaborators
    thai::SegmenterConfig config;
    if (!args.config_path.empty()) {
        config = thai::SegmenterConfig::load(args.config_path);
    }
    if (args.debug) config.debug = true;

    auto start_load = std::chrono::high_resolution_clock::now();

    thai::Dictionary dict;
    bool have_dict = !args.dict_path.empty() && dict.load(args.dict_path);

    std::unique_ptr<thai::WordBreaker> breaker;
    try {
        breaker = std::make_unique<thai::IcuWordBreaker>();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<thai::TtlStore> store;
    if (!args.cache_path.empty()) {
        store = std::make_unique<thai::JsonFileTtlStore>(args.cache_path);
    } else {
        store = std::make_unique<thai::MemoryTtlStore>();
    }

    std::unique_ptr<thai::FileHintProvider> hints;
    if (!args.hints_path.empty()) {
        hints = std::make_unique<thai::FileHintProvider>();
        if (!hints->load(args.hints_path)) hints.reset();
    }

    thai::TaskQueue queue;
    thai::ThaiSegmenter segmenter(config, *breaker, *store, queue,
                                  have_dict ? &dict : nullptr, hints.get());

    auto end_load = std::chrono::high_resolution_clock::now();
    std::cout << "Initialized in "
              << std::chrono::duration<double>(end_load - start_load).count()
              << "s" << std::endl;

    // 2. Read input
    std::vector<std::string> lines;
    {
        std::ifstream infile(args.input_path);
        if (!infile.is_open()) {
            std::cerr << "Error opening input file: " << args.input_path << std::endl;
            return 1;
        }
        std::string line;
        while (std::getline(infile, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            lines.push_back(line);
            if (args.limit > 0 && lines.size() >= static_cast<size_t>(args.limit)) break;
        }
    }
    std::cout << "Loaded " << lines.size() << " lines for video " << args.video_id << "." << std::endl;

    // 3. Warm up, then let hydration / persistence / hint fetches land
    auto start_warm = std::chrono::high_resolution_clock::now();
    if (args.warm_up) {
        segmenter.warm_up_for_video(args.video_id, lines);
    } else {
        segmenter.prefetch_merges(args.video_id);
    }
    queue.run_pending();
    auto end_warm = std::chrono::high_resolution_clock::now();

    const thai::MergeSet* merges = segmenter.merge_cache().find(args.video_id);
    std::cout << "Merge set: " << (merges ? merges->size() : 0)
              << " phrases ("
              << std::chrono::duration<double>(end_warm - start_warm).count() << "s)" << std::endl;

    // 4. Segment
    std::vector<std::string> results(lines.size());
    auto start_proc = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < lines.size(); ++i) {
        thai::SegmentationSnapshot snapshot;
        auto segments = segmenter.segment(lines[i], args.video_id, args.debug ? &snapshot : nullptr);

        std::optional<std::vector<std::string>> improved;
        segmenter.improve_line_segmentation(args.video_id, lines[i], snapshot.original, segments,
            [&improved](std::optional<std::vector<std::string>> tokens) { improved = std::move(tokens); });
        queue.run_pending();

        results[i] = build_json_record(static_cast<int64_t>(i), lines[i], segments,
                                       args.debug ? &snapshot.original : nullptr,
                                       improved ? &*improved : nullptr);
    }

    auto end_proc = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end_proc - start_proc).count();

    std::cout << "Processed " << lines.size() << " lines in " << duration << "s" << std::endl;
    if (duration > 0.0) {
        std::cout << "Speed: " << (lines.size() / duration) << " lines/sec" << std::endl;
    }
    if (queue.failed() > 0) {
        std::cerr << "Warning: " << queue.failed() << " background task(s) failed" << std::endl;
    }

    // 5. Output with buffered I/O
    if (!args.output_path.empty()) {
        std::ofstream outfile(args.output_path);
        if (!outfile.is_open()) {
            std::cerr << "Error opening output file: " << args.output_path << std::endl;
            return 1;
        }
        for (const auto& res : results) {
            outfile << res << "\n";
        }
        std::cout << "Done. Saved to " << args.output_path << std::endl;
    } else {
        for (const auto& res : results) {
            std::cout << res << "\n";
        }
    }

    return 0;
}
