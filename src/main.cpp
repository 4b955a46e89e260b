//
//  main.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cadencefix.hpp"
#include "cadencefix_version.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace {

void emit_json(const cadencefix::ContainerSummary &s) {
    nlohmann::json j;
    j["doc_type"] = s.doc_type;
    j["timecode_scale"] = s.timecode_scale ? nlohmann::json(*s.timecode_scale) : nlohmann::json();
    j["duration_ms"] = s.duration ? nlohmann::json(*s.duration) : nlohmann::json();
    j["segment_unknown_size"] = s.segment_unknown_size;
    j["frames"] = s.block_timecodes.size();
    j["elements"] = s.element_count;

    nlohmann::json clusters = nlohmann::json::array();
    for (const auto &c : s.clusters) {
        nlohmann::json entry;
        entry["timecode"] = c.timecode ? nlohmann::json(*c.timecode) : nlohmann::json();
        entry["frames"] = c.block_count;
        entry["unknown_size"] = c.unknown_size;
        clusters.push_back(entry);
    }
    j["clusters"] = clusters;
    j["block_timecodes"] = s.block_timecodes;

    std::cout << j.dump(2) << "\n";
}

void print_usage() {
    std::cerr << "CadenceFix " << CADENCEFIX_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage for inspecting:\n"
              << "  cadencefix <input.webm> [--log-level warn|info|debug]\n"
              << "usage for retiming:\n"
              << "  cadencefix <chunk> [chunk ...] <output.webm> [--fps N] [--frames N] "
              << "[--strict] [--log-level warn|info|debug]\n"
              << "  cadencefix --job job.json\n"
              << "Options:\n"
              << "  --fps N             Constant output frame rate (default: 60).\n"
              << "  --frames N          Frames submitted by the producer (default: count of\n"
              << "                      SimpleBlocks in the input).\n"
              << "  --strict            Fail instead of writing the raw input when the\n"
              << "                      rewrite fails.\n"
              << "  --job FILE          Read inputs, output and options from a JSON job file.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

int run_retime(const std::vector<std::string> &inputs, const std::string &output,
               const cadencefix::RetimeOptions &options) {
    bool used_fallback = false;
    auto status = cadencefix::retime_file(inputs, output, options, &used_fallback);
    if (!status.ok) {
        CF_LOG("error", "cadencefix: failed to retime: " << status.message);
        return 1;
    }
    std::cout << "Wrote: " << output << (used_fallback ? " (unmodified, retime failed)" : "")
              << "\n";
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CadenceFix " << CADENCEFIX_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::string job_path;
    cadencefix::RetimeOptions options;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--strict") {
                options.allow_fallback = false;
            } else if (arg == "--fps" && i + 1 < argc) {
                options.fps = std::stod(argv[++i]);
            } else if (arg == "--frames" && i + 1 < argc) {
                options.frame_count = std::stoull(argv[++i]);
            } else if (arg == "--job" && i + 1 < argc) {
                job_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                cadencefix::set_log_verbosity(cadencefix::parse_log_verbosity(argv[i + 1]));
                ++i;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 2;
            } else {
                positional.emplace_back(std::move(arg));
            }
        }
    } catch (const std::logic_error &e) {
        std::cerr << "Invalid numeric argument (" << e.what() << ")\n";
        return 2;
    }

    if (!job_path.empty()) {
        cadencefix::RetimeJob job;
        auto status = cadencefix::load_job_json(job_path, job);
        if (!status.ok) {
            CF_LOG("error", "cadencefix: failed to load job: " << status.message);
            return 1;
        }
        if (job.log_level) {
            cadencefix::set_log_verbosity(*job.log_level);
        }
        return run_retime(job.inputs, job.output, job.options);
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    // Inspect mode: one positional argument (input).
    if (positional.size() == 1) {
        auto res = cadencefix::inspect_file(positional[0]);
        if (!res.status.ok) {
            CF_LOG("error", "cadencefix: failed to read container: " << res.status.message);
            return 1;
        }
        emit_json(res.summary);
        return 0;
    }

    // Retime mode: chunks followed by the output path.
    const std::string output = positional.back();
    positional.pop_back();
    return run_retime(positional, output, options);
}
