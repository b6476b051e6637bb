/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bookmark_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    bool minimal = false;
    bool all_contents = false;
    bool numeric_longs = false;
    bool keep_going = false;
    bool to_stdout = false;
    bool debug = false;
};

static void print_usage() {
    YKR_LOG_INFO(
        "Usage:\n" \
        "    yukari_blob_parser <file-or-dir> [--minimal] [--all-contents] [--numeric-longs] [--keep-going] [--stdout] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a bookmarks.json export or a directory of them\n" \
        "    --minimal        skips the <name>_metadata.json generation\n" \
        "    --all-contents   emits every stream content per record instead of the first one\n" \
        "    --numeric-longs  writes long fields as JSON numbers instead of decimal strings\n" \
        "    --keep-going     writes null for records that fail to decode instead of failing the file\n" \
        "    --stdout         prints the records to stdout and writes no files\n" \
        "    --debug          enables extra logging\n"
    );
}

static std::string dump_json(const nlohmann::ordered_json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

static void write_outputs(
    const fs::path& out_json_dir,
    const std::string& base,
    const ykr::bookmarks::DecodeResult& res,
    const Settings& settings
) {
    if (settings.to_stdout) {
        const std::string text = dump_json(res.records, -1);
        std::fputs(text.c_str(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
        return;
    }

    const fs::path json_path = out_json_dir / (base + std::string(".json"));
    ykr::fs_utils::write_text_file(json_path, dump_json(res.records, 2));
    YKR_LOG_INFO("Wrote: %s", json_path.string().c_str());

    if (settings.minimal) {
        return;
    }
    if (!res.metadata.is_object() || res.metadata.empty()) {
        return;
    }
    const fs::path meta_path = out_json_dir / (base + std::string("_metadata.json"));
    ykr::fs_utils::write_text_file(meta_path, dump_json(res.metadata, 2));
    YKR_LOG_INFO("Wrote: %s", meta_path.string().c_str());
}

static bool process_file(const fs::path& path, const fs::path& out_json_dir, const Settings& settings) {
    if (path.extension() != ".json" || ykr::fs_utils::is_metadata_json(path)) {
        YKR_LOG_INFO("Skipped: %s", path.string().c_str());
        return true;
    }

    const std::string base = path.stem().string();
    try {
        ykr::bookmarks::ParserDecodeOptions opt{};
        opt.all_contents = settings.all_contents;
        opt.keep_going = settings.keep_going;
        opt.longs_as_strings = !settings.numeric_longs;
        opt.collect_metadata = !settings.minimal && !settings.to_stdout;
        opt.debug = settings.debug;
        const auto res = ykr::bookmarks::BookmarkParser::DecodeExportFile(path, opt);
        write_outputs(out_json_dir, base, res, settings);
        if (res.failed_records != 0) {
            YKR_LOG_WARN(
                "%s: %zu record(s) failed to decode", path.string().c_str(), res.failed_records
            );
        }
        return true;
    } catch (const std::exception& e) {
        YKR_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
        return false;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        YKR_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--minimal") {
            settings.minimal = true;
            continue;
        }
        if (arg == "--all-contents") {
            settings.all_contents = true;
            continue;
        }
        if (arg == "--numeric-longs") {
            settings.numeric_longs = true;
            continue;
        }
        if (arg == "--keep-going") {
            settings.keep_going = true;
            continue;
        }
        if (arg == "--stdout") {
            settings.to_stdout = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        YKR_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        print_usage();
        return 2;
    }

    if (settings.to_stdout) {
        ykr::log::set_info_to_stderr(true);
    }

    if (!fs::exists(input)) {
        YKR_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_json_dir = ykr::fs_utils::output_root() / "json";
    if (!settings.to_stdout) {
        ykr::fs_utils::ensure_dir(out_json_dir);
    }

    int failed = 0;
    if (fs::is_directory(input)) {
        const auto inputs = ykr::fs_utils::collect_inputs(input);
        for (const auto& p : inputs) {
            if (!process_file(p, out_json_dir, settings)) {
                failed++;
            }
        }
    } else if (!process_file(input, out_json_dir, settings)) {
        failed++;
    }
    return failed == 0 ? 0 : 1;
}
