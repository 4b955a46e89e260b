//
//  cadencefix.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "cadencefix.hpp"
#include "cadencefix_version.hpp"

#include <cerrno>
#include <cmath>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>

#include "ebml_error.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace cadencefix {

std::string version_string() { return CADENCEFIX_VERSION_DISPLAY; }

}  // namespace cadencefix

namespace {

using cadencefix::RetimeJob;
using cadencefix::RetimeStatus;

RetimeStatus fail(std::string message) {
    CF_LOG("error", message);
    RetimeStatus s;
    s.message = std::move(message);
    return s;
}

std::string errno_text() {
    return "errno=" + std::to_string(errno) + " (" + std::generic_category().message(errno) + ")";
}

bool read_file(const std::string &path, std::vector<uint8_t> &out, std::string &error) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        error = "open failed for " + path + " " + errno_text();
        return false;
    }
    f.seekg(0, std::ios::end);
    std::streamoff len = f.tellg();
    if (len < 0) {
        error = "cannot determine size of " + path;
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        error = "short read for " + path;
        return false;
    }
    return true;
}

bool write_bytes(const std::string &path, const std::vector<uint8_t> &data, std::string &error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        error = "open failed for " + path + " " + errno_text();
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out.good()) {
        error = "write failed for " + path + " " + errno_text();
        return false;
    }
    return true;
}

RetimeStatus parse_job(const std::string &text, const std::filesystem::path &base,
                       RetimeJob &job) {
    auto resolve_path = [&](const std::string &p) {
        std::filesystem::path path(p);
        return (path.is_absolute() || base.empty() ? path : base / path).string();
    };
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return fail("job file must contain a JSON object");
        }
        if (!j.contains("inputs") || !j["inputs"].is_array() || j["inputs"].empty()) {
            return fail("job file needs a non-empty \"inputs\" array");
        }
        if (!j.contains("output") || !j["output"].is_string()) {
            return fail("job file needs an \"output\" path");
        }
        RetimeJob parsed;
        for (const auto &in : j["inputs"]) {
            parsed.inputs.push_back(resolve_path(in.get<std::string>()));
        }
        parsed.output = resolve_path(j["output"].get<std::string>());
        parsed.options.fps = j.value("fps", parsed.options.fps);
        if (j.contains("frame_count") && !j["frame_count"].is_null()) {
            parsed.options.frame_count = j["frame_count"].get<uint64_t>();
        }
        parsed.options.allow_fallback = j.value("fallback", parsed.options.allow_fallback);
        if (j.contains("log_level")) {
            parsed.log_level =
                cadencefix::parse_log_verbosity(j["log_level"].get<std::string>());
        }
        job = std::move(parsed);
    } catch (const json::exception &e) {
        return fail(std::string("invalid job file: ") + e.what());
    }
    RetimeStatus ok;
    ok.ok = true;
    return ok;
}

}  // namespace

namespace cadencefix {

std::vector<uint8_t> assemble_chunks(const std::vector<std::vector<uint8_t>> &chunks) {
    size_t total = 0;
    for (const auto &c : chunks) {
        total += c.size();
    }
    std::vector<uint8_t> out;
    out.reserve(total);
    size_t used = 0;
    for (const auto &c : chunks) {
        if (c.empty()) {
            continue;
        }
        out.insert(out.end(), c.begin(), c.end());
        ++used;
    }
    CF_LOG("io", "assembled " << used << " of " << chunks.size() << " chunks, " << out.size()
                              << " bytes");
    return out;
}

FinalizeResult finalize_recording(const std::vector<uint8_t> &raw, const RetimeOptions &options) {
    FinalizeResult result;
    if (raw.empty()) {
        result.status = fail("recording is empty");
        return result;
    }
    // A bad rate is a caller error, not a damaged recording: no fallback.
    if (!std::isfinite(options.fps) || options.fps <= 0.0) {
        std::ostringstream oss;
        oss << "unsupported: frame rate must be a positive number, got " << options.fps;
        result.status = fail(oss.str());
        return result;
    }

    auto use_raw = [&](const std::string &reason) {
        CF_LOG("warn", "retime failed, keeping raw recording: " << reason);
        result.data = raw;
        result.used_fallback = true;
        result.fallback_reason = reason;
        result.status.ok = true;
        result.status.message.clear();
    };

    if (options.frame_count) {
        result.frame_count = *options.frame_count;
    } else {
        try {
            result.frame_count = count_frames(raw);
        } catch (const EbmlError &e) {
            const std::string reason = std::string(error_kind_name(e.kind())) + ": " + e.what();
            if (options.allow_fallback) {
                use_raw(reason);
            } else {
                result.status = fail(reason);
            }
            return result;
        }
        CF_LOG("debug", "frame count taken from container: " << result.frame_count);
    }

    const auto t0 = std::chrono::steady_clock::now();
    RetimeOutcome outcome = try_fix_frame_rate(raw, options.fps, result.frame_count);
    if (outcome.needs_fallback()) {
        if (options.allow_fallback) {
            use_raw(outcome.status.message);
        } else {
            result.status = fail(outcome.status.message);
        }
        return result;
    }
    result.data = outcome.chunks.flatten(raw);
    result.status.ok = true;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    CF_LOG("debug", "finalize_recording: frames=" << outcome.stats.frames
                                                  << " clusters=" << outcome.stats.clusters
                                                  << " bytes=" << result.data.size()
                                                  << " took " << ms << " ms");
    return result;
}

RetimeStatus retime_file(const std::vector<std::string> &input_paths,
                         const std::string &output_path, const RetimeOptions &options,
                         bool *used_fallback) {
    if (input_paths.empty()) {
        return fail("no input chunks given");
    }
    std::vector<std::vector<uint8_t>> chunks;
    chunks.reserve(input_paths.size());
    for (const auto &path : input_paths) {
        std::vector<uint8_t> bytes;
        std::string error;
        if (!read_file(path, bytes, error)) {
            return fail(error);
        }
        CF_LOG("io", "read " << bytes.size() << " bytes from " << path);
        chunks.push_back(std::move(bytes));
    }

    FinalizeResult res = finalize_recording(assemble_chunks(chunks), options);
    if (!res.status.ok) {
        return res.status;
    }
    std::string error;
    if (!write_bytes(output_path, res.data, error)) {
        return fail(error);
    }
    if (used_fallback) {
        *used_fallback = res.used_fallback;
    }
    CF_LOG("info", "wrote " << res.data.size() << " bytes to " << output_path
                            << (res.used_fallback ? " (raw, retime failed)" : ""));
    return res.status;
}

InspectResult inspect_file(const std::string &path) {
    InspectResult result;
    std::vector<uint8_t> bytes;
    std::string error;
    if (!read_file(path, bytes, error)) {
        result.status = fail(error);
        return result;
    }
    try {
        result.summary = inspect_container(bytes);
        result.status.ok = true;
    } catch (const EbmlError &e) {
        result.status = fail(std::string(error_kind_name(e.kind())) + ": " + e.what());
    }
    return result;
}

RetimeStatus load_job_json(const std::string &path, RetimeJob &job) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return fail("open failed for " + path + " " + errno_text());
    }
    std::ostringstream text;
    text << f.rdbuf();
    return parse_job(text.str(), std::filesystem::path(path).parent_path(), job);
}

#ifdef CADENCEFIX_TESTING
namespace testing {
RetimeStatus parse_job_json_for_test(const std::string &text, const std::string &base_dir,
                                     RetimeJob &job) {
    return parse_job(text, std::filesystem::path(base_dir), job);
}
}  // namespace testing
#endif

}  // namespace cadencefix
