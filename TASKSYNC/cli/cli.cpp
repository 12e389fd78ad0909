#include "cli/cli.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>

#include "core/errors.hpp"
#include "core/settings.hpp"
#include "markdown/hierarchy_builder.hpp"
#include "markdown/markdown_renderer.hpp"
#include "merge/merge_engine.hpp"
#include "store/task_store.hpp"
#include "utils/date.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace tasksync::cli {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

bool is_stdin(const std::string& path) {
    return path.empty() || path == "-";
}

std::string read_input(const std::string& path, std::istream& in) {
    if (is_stdin(path)) {
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Error reading input file '" + path + "'");
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Error writing to output file '" + path + "'");
    }
    file << content;
    if (!file.good()) {
        throw std::runtime_error("Failed while writing output file '" + path + "'");
    }
}

void write_output(const std::string& path, const std::string& content, std::ostream& out) {
    if (path.empty()) {
        out << content;
        out.flush();
        return;
    }
    write_file(path, content);
}

// Splits "--name=value" and otherwise pulls the value from the next argument.
std::string take_value(const std::vector<std::string>& args, std::size_t& i, const std::string& name,
                       const std::optional<std::string>& inline_value) {
    if (inline_value) {
        return *inline_value;
    }
    if (i + 1 >= args.size()) {
        throw UsageError("option '" + name + "' requires a value");
    }
    return args[++i];
}

struct Runtime {
    Settings settings;
    Date today;
    markdown::ParseContext ctx;
};

int run_convert(const Options& opts, const Runtime& rt, std::istream& in, std::ostream& out) {
    if (opts.from.empty()) throw UsageError("--from <FORMAT> is required for conversion mode");
    if (opts.to.empty()) throw UsageError("--to <FORMAT> is required for conversion mode");
    const auto from = parse_format(opts.from);
    const auto to = parse_format(opts.to);
    if (!from || !to) {
        throw UsageError("unsupported conversion from '" + opts.from + "' to '" + opts.to + "'");
    }

    const std::string input = read_input(opts.input, in);
    std::vector<Task> tasks = (*from == Format::Markdown)
        ? markdown::parse_document(input, rt.ctx, rt.settings.indent_width)
        : store::decode_records(input);

    const std::string rendered = (*to == Format::Markdown)
        ? markdown::render_document(tasks, rt.settings.indent_width)
        : store::encode_records(tasks);
    write_output(opts.output, rendered, out);
    return kExitOk;
}

int run_fmt(const Options& opts, const Runtime& rt, std::istream& in, std::ostream& out, std::ostream& err) {
    if (opts.in_place && !opts.output.empty()) {
        throw UsageError("--in-place cannot be used with --output (-o)");
    }
    if (opts.in_place && is_stdin(opts.input)) {
        throw UsageError("--in-place requires a named input file, not stdin");
    }

    const std::string input = read_input(opts.input, in);
    const std::vector<Task> tasks = markdown::parse_document(input, rt.ctx, rt.settings.indent_width);
    const std::string formatted = markdown::render_document(tasks, rt.settings.indent_width);

    if (opts.in_place) {
        write_file(opts.input, formatted);
        err << "Formatted file in-place: " << opts.input << "\n";
    } else {
        write_output(opts.output, formatted, out);
    }
    return kExitOk;
}

void print_section(std::ostream& out, const char* title, const std::vector<std::int64_t>& ids,
                   const std::unordered_map<std::int64_t, std::string>& names) {
    out << title << "\n";
    for (std::int64_t id : ids) {
        auto it = names.find(id);
        out << "  " << (it != names.end() ? it->second : std::string()) << " (id:" << id << ")\n";
    }
}

int run_apply(const Options& opts, const Runtime& rt, std::istream& in, std::ostream& out) {
    if (!opts.from.empty()) {
        const auto from = parse_format(opts.from);
        if (!from || *from != Format::Markdown) {
            throw UsageError("--from must be 'markdown' for apply command");
        }
    }
    if (opts.target_json.empty()) {
        throw UsageError("apply requires --target-json <FILE>");
    }

    const std::string input = read_input(opts.input, in);
    const store::TaskStore task_store(opts.target_json);
    std::vector<Task> previous = task_store.load();
    std::vector<Task> edited = markdown::parse_document(input, rt.ctx, rt.settings.indent_width);

    std::unordered_map<std::int64_t, std::string> previous_names;
    for (const Task& t : previous) {
        previous_names.emplace(t.id, t.name);
    }

    merge::MergeResult result = merge::merge_tasks(std::move(previous), std::move(edited), rt.today);

    if (opts.dry_run) {
        std::unordered_map<std::int64_t, std::string> merged_names;
        for (const Task& t : result.tasks) {
            merged_names.emplace(t.id, t.name);
        }
        std::ostringstream summary;
        summary << "Dry run summary:\n";
        print_section(summary, "Added tasks:", result.added, merged_names);
        print_section(summary, "Updated tasks:", result.updated, merged_names);
        print_section(summary, "Deleted tasks:", result.deleted, previous_names);
        write_output(opts.output, summary.str(), out);
        return kExitOk;
    }

    task_store.save(result.tasks);
    log::info("[Cli] wrote " + std::to_string(result.tasks.size()) + " record(s) to '" + opts.target_json + "'");
    write_output(opts.output, markdown::render_document(result.tasks, rt.settings.indent_width), out);
    return kExitOk;
}

}

std::optional<Format> parse_format(const std::string& name) {
    const std::string lower = strings::to_lower_copy(strings::trim_copy(name));
    if (lower == "markdown" || lower == "md") return Format::Markdown;
    if (lower == "json" || lower == "jsonl") return Format::Json;
    return std::nullopt;
}

Options parse_args(const std::vector<std::string>& args) {
    Options opts;
    bool command_seen = false;
    bool input_seen = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;
        if (strings::starts_with(arg, "--")) {
            const auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            ++opts.verbosity;
        } else if (arg == "-f" || arg == "--from") {
            opts.from = take_value(args, i, arg, inline_value);
        } else if (arg == "-t" || arg == "--to") {
            opts.to = take_value(args, i, arg, inline_value);
        } else if (arg == "-o" || arg == "--output") {
            opts.output = take_value(args, i, arg, inline_value);
        } else if (arg == "--config") {
            opts.config = take_value(args, i, arg, inline_value);
        } else if (arg == "--date") {
            opts.date = take_value(args, i, arg, inline_value);
        } else if (arg == "--target-json") {
            opts.target_json = take_value(args, i, arg, inline_value);
        } else if (arg == "-i" || arg == "--in-place") {
            opts.in_place = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg != "-" && strings::starts_with(arg, "-")) {
            throw UsageError("unknown option '" + arg + "'");
        } else if (!command_seen && !input_seen && (arg == "fmt" || arg == "apply")) {
            opts.command = (arg == "fmt") ? Command::Fmt : Command::Apply;
            command_seen = true;
        } else if (!input_seen) {
            opts.input = arg;
            input_seen = true;
        } else {
            throw UsageError("unexpected argument '" + arg + "'");
        }
    }

    if (opts.in_place && opts.command != Command::Fmt) {
        throw UsageError("--in-place is only valid with the fmt command");
    }
    if ((opts.dry_run || !opts.target_json.empty()) && opts.command != Command::Apply) {
        throw UsageError("--target-json and --dry-run are only valid with the apply command");
    }
    return opts;
}

std::string usage() {
    return
        "Usage:\n"
        "  tasksync --from <markdown|json> --to <markdown|json> [-o FILE] [INPUT|-]\n"
        "  tasksync fmt [INPUT|-] [-i|--in-place] [-o FILE]\n"
        "  tasksync apply --from markdown --target-json FILE [--dry-run] [INPUT|-]\n"
        "\n"
        "Options:\n"
        "  -f, --from FORMAT     input format (markdown or json)\n"
        "  -t, --to FORMAT       output format (markdown or json)\n"
        "  -o, --output FILE     write output to FILE instead of stdout\n"
        "  -i, --in-place        fmt: rewrite the input file\n"
        "      --target-json FILE  apply: task store to update\n"
        "      --dry-run         apply: report changes without writing\n"
        "      --config FILE     settings file (default $TASKSYNC_CONFIG or .tasksync.json)\n"
        "      --date YYYY-MM-DD processing date (default: today)\n"
        "  -v, --verbose         more logging on stderr (repeatable)\n"
        "  -h, --help            show this help\n";
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    Options opts;
    try {
        opts = parse_args(args);
    } catch (const UsageError& e) {
        err << "tasksync: " << e.what() << "\n" << "Try 'tasksync --help'.\n";
        return kExitUsage;
    }
    if (opts.help) {
        out << usage();
        return kExitOk;
    }

    Runtime rt;
    rt.settings = load_settings(settings_path(opts.config));
    apply_log_settings(rt.settings);
    if (opts.verbosity == 1) {
        log::set_level(log::Level::Info);
    } else if (opts.verbosity > 1) {
        log::set_level(log::Level::Debug);
    }

    if (opts.date.empty()) {
        rt.today = Date::today();
    } else if (auto date = Date::parse_iso(opts.date)) {
        rt.today = *date;
    } else {
        err << "tasksync: --date expects YYYY-MM-DD, got '" << opts.date << "'\n";
        return kExitUsage;
    }
    rt.ctx = markdown::ParseContext::for_date(rt.today);

    try {
        switch (opts.command) {
            case Command::Convert: return run_convert(opts, rt, in, out);
            case Command::Fmt:     return run_fmt(opts, rt, in, out, err);
            case Command::Apply:   return run_apply(opts, rt, in, out);
        }
    } catch (const UsageError& e) {
        err << "tasksync: " << e.what() << "\n" << "Try 'tasksync --help'.\n";
        return kExitUsage;
    } catch (const ParseError& e) {
        log::debug("[Cli] offending line: " + e.line_text());
        err << "tasksync: " << e.what() << "\n";
        return kExitFailure;
    } catch (const std::exception& e) {
        err << "tasksync: " << e.what() << "\n";
        return kExitFailure;
    }
    return kExitFailure;
}

}
