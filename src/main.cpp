/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool typed = false;
    bool strict = false;
    bool to_stdout = false;
    bool debug = false;
    int indent = 2;
    int max_depth = nbt2dict::nbt::kDefaultMaxDepth;
};

static void print_usage() {
    NBT2DICT_LOG_INFO(
        "Usage:\n" \
        "    nbt2dict <file-or-dir> [--typed] [--strict] [--max-depth <n>] [--indent <n>] [--stdout] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be an uncompressed .nbt/.dat file or a directory of them\n" \
        "    --typed       wraps every value with its tag type (__type/__elementType)\n" \
        "    --strict      fails on bytes left over after the root compound\n" \
        "    --max-depth   maximum List/Compound nesting, 0-2048 (default 512)\n" \
        "    --indent      JSON indentation, -1 for a single line (default 2)\n" \
        "    --stdout      prints JSON instead of writing output/json/<name>.json\n" \
        "    --debug       enables extra logging\n"
    );
}

static std::optional<int> parse_int_arg(std::string_view text) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(std::string(text), &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static nbt2dict::ParserDecodeOptions decode_options(const Settings& settings) {
    nbt2dict::ParserDecodeOptions opt{};
    opt.max_depth = settings.max_depth;
    opt.allow_trailing_bytes = !settings.strict;
    opt.typed_json = settings.typed;
    opt.debug = settings.debug;
    return opt;
}

static void write_output(
    const fs::path& out_json_dir,
    const std::string& base,
    const nbt2dict::DecodeResult& res,
    const Settings& settings
) {
    const auto text = res.json.dump(
        settings.indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace
    );
    if (settings.to_stdout) {
        NBT2DICT_LOG_INFO("%s", text.c_str());
        return;
    }
    const fs::path json_path = out_json_dir / (base + std::string(".json"));
    nbt2dict::fs_utils::write_text_file(json_path, text);
    NBT2DICT_LOG_INFO("Wrote: %s", json_path.string().c_str());
}

static bool
process_file(const fs::path& path, const fs::path& out_json_dir, const Settings& settings) {
    const std::string base = path.stem().string();
    try {
        const auto res = nbt2dict::NbtParser::DecodeNbtFile(path, decode_options(settings));
        write_output(out_json_dir, base, res, settings);
        return true;
    } catch (const std::exception& e) {
        NBT2DICT_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
        return false;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        NBT2DICT_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--typed") {
            settings.typed = true;
            continue;
        }
        if (arg == "--strict") {
            settings.strict = true;
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
        if (arg == "--max-depth" || arg == "--indent") {
            if (i + 1 >= argc) {
                NBT2DICT_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            const auto value = parse_int_arg(argv[++i]);
            const bool bad_depth = value.has_value() && arg == "--max-depth"
                && (*value < 0 || *value > nbt2dict::nbt::kMaxDepthLimit);
            if (!value.has_value() || bad_depth) {
                NBT2DICT_LOG_ERROR("Invalid value for %s: %s", std::string(arg).c_str(), argv[i]);
                return 2;
            }
            if (arg == "--max-depth") {
                settings.max_depth = *value;
            } else {
                settings.indent = *value;
            }
            continue;
        }
        NBT2DICT_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }
    nbt2dict::log::set_debug(settings.debug);

    if (!fs::exists(input)) {
        NBT2DICT_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_json_dir =
        nbt2dict::fs_utils::executable_dir(argv[0]) / "output" / "json";
    if (!settings.to_stdout) {
        try {
            nbt2dict::fs_utils::ensure_dir(out_json_dir);
        } catch (const std::exception& e) {
            NBT2DICT_LOG_ERROR("%s", e.what());
            return 1;
        }
    }

    std::vector<fs::path> inputs;
    if (fs::is_directory(input)) {
        inputs = nbt2dict::fs_utils::collect_inputs(input);
        NBT2DICT_LOG_DEBUG("Found %zu inputs under %s", inputs.size(), input.string().c_str());
    } else {
        inputs.push_back(input);
    }

    bool all_ok = true;
    for (const auto& p : inputs) {
        if (!process_file(p, out_json_dir, settings)) {
            all_ok = false;
        }
    }
    return all_ok ? 0 : 1;
}
