#include "assembly/persistence.hh"
#include "core/logging.hh"
#include "host/ledger_host.hh"
#include "host/pipeline.hh"
#include "model/parser.hh"
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace suitegen;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <schema.json> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --out FILE             Write metadata as JSON (default: stdout)\n"
              << "  --binary FILE          Also write the compact binary encoding\n"
              << "  --order a,b,c          Execution order (default: schema order)\n"
              << "  --label NAME           Context label (default: \"default\")\n"
              << "  --program-id KEY       Program id when the schema declares none\n"
              << "  --account NAME=KEY     Bind an account public key (base58)\n"
              << "  --arg NAME=TEXT        Bind a string argument\n"
              << "  --arg-int NAME=N       Bind an integer argument\n"
              << "  --no-placeholders      Do not give signers placeholder keys\n"
              << "  --no-heuristics        Reject seed names that are not declared exactly\n"
              << "  --big-endian-seeds     Encode integer seeds big-endian\n"
              << "  --ledger               Run under the ledger compute budget and chunk ceiling\n"
              << "  --compute-budget N     Ledger compute units per transaction\n"
              << "  --chunk-ceiling N      Ledger bytes per stored chunk\n"
              << "  --log-level LEVEL      trace|debug|info|warn|error|off (default: warn)\n"
              << "  --log-file FILE        Also log to FILE\n";
}

std::vector<std::string> split(std::string_view text, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(sep, start);
        if (end == std::string_view::npos) end = text.size();
        if (end > start) parts.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

bool split_binding(std::string_view text, std::string& name, std::string& value) {
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) return false;
    name = std::string(text.substr(0, eq));
    value = std::string(text.substr(eq + 1));
    return true;
}

template<typename T>
bool parse_number(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

int report(const Failure& failure) {
    std::cerr << "error: " << failure.to_string() << "\n";
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string schema_path;
    std::string json_out;
    std::string binary_out;
    bool ledger = false;
    LedgerLimits limits;
    PipelineConfig config;
    LogConfig log_config;
    log_config.default_level = LogLevel::WARN;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " needs a value\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--out") {
            json_out = next();
        } else if (arg == "--binary") {
            binary_out = next();
        } else if (arg == "--order") {
            config.execution_order = split(next(), ',');
        } else if (arg == "--label") {
            config.label = next();
        } else if (arg == "--program-id") {
            auto key = Pubkey::from_base58(next());
            if (!key) {
                std::cerr << "error: --program-id is not a base58 public key\n";
                return 1;
            }
            config.assembly.program_id = *key;
        } else if (arg == "--account") {
            std::string name, value;
            auto key = split_binding(next(), name, value) ? Pubkey::from_base58(value) : std::nullopt;
            if (!key) {
                std::cerr << "error: --account expects NAME=BASE58KEY\n";
                return 1;
            }
            config.accounts[name] = *key;
        } else if (arg == "--arg") {
            std::string name, value;
            if (!split_binding(next(), name, value)) {
                std::cerr << "error: --arg expects NAME=TEXT\n";
                return 1;
            }
            config.arguments[name] = ArgumentValue::from_string(value);
        } else if (arg == "--arg-int") {
            std::string name, value;
            if (!split_binding(next(), name, value)) {
                std::cerr << "error: --arg-int expects NAME=N\n";
                return 1;
            }
            std::uint64_t u = 0;
            std::int64_t s = 0;
            if (parse_number(value, u)) {
                config.arguments[name] = ArgumentValue::from_unsigned(u);
            } else if (parse_number(value, s)) {
                config.arguments[name] = ArgumentValue::from_signed(s);
            } else {
                std::cerr << "error: --arg-int value is not an integer\n";
                return 1;
            }
        } else if (arg == "--no-placeholders") {
            config.bind_placeholder_signers = false;
        } else if (arg == "--no-heuristics") {
            config.assembly.graph.allow_heuristic_matching = false;
        } else if (arg == "--big-endian-seeds") {
            config.assembly.resolver.integer_byte_order = ByteOrder::BIG;
        } else if (arg == "--ledger") {
            ledger = true;
        } else if (arg == "--compute-budget") {
            if (!parse_number(next(), limits.compute_budget)) {
                std::cerr << "error: --compute-budget is not a number\n";
                return 1;
            }
        } else if (arg == "--chunk-ceiling") {
            if (!parse_number(next(), limits.account_ceiling)) {
                std::cerr << "error: --chunk-ceiling is not a number\n";
                return 1;
            }
        } else if (arg == "--log-level") {
            log_config.default_level = parse_log_level(next(), LogLevel::WARN);
        } else if (arg == "--log-file") {
            log_config.file_enabled = true;
            log_config.file_path = next();
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown option " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (schema_path.empty()) {
            schema_path = arg;
        } else {
            std::cerr << "error: unexpected argument " << arg << "\n";
            return 1;
        }
    }

    if (schema_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    init_logging(log_config);

    int status = 0;
    TestSuiteMetadata metadata;

    if (ledger) {
        auto parsed = parse_interface_file(schema_path);
        if (!parsed.ok()) {
            shutdown_logging();
            return report(parsed.failure);
        }
        SuiteContext context(config.label);
        prepare_context(*parsed.model, config, context);

        LedgerHost host(limits, config.assembly);
        auto run = host.generate(*parsed.model, context, config.execution_order);
        if (!run.ok()) {
            shutdown_logging();
            return report(run.failure);
        }
        std::cerr << "stored " << run.history.chunk_count << " chunks, " << run.history.compute_used
                  << " compute units\n";
        metadata = std::move(*run.metadata);
    } else {
        OfflinePipeline pipeline(config);
        auto result = pipeline.run_file(schema_path);
        if (!result.ok()) {
            shutdown_logging();
            return report(result.failure);
        }
        metadata = std::move(*result.metadata);
    }

    if (json_out.empty()) {
        std::cout << metadata_to_json(metadata) << "\n";
    } else {
        JsonFileSink sink(json_out);
        Failure failure = sink.accept(metadata);
        if (failure.code != ErrorCode::OK) status = report(failure);
    }

    if (status == 0 && !binary_out.empty()) {
        BinaryFileSink sink(binary_out);
        Failure failure = sink.accept(metadata);
        if (failure.code != ErrorCode::OK) status = report(failure);
    }

    shutdown_logging();
    return status;
}
