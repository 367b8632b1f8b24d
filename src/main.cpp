#include "config/config_loader.hpp"
#include "core/answer_source.hpp"
#include "core/query_pipeline.hpp"
#include "core/signal_watcher.hpp"
#include "core/stream_event.hpp"
#include "core/utils.hpp"
#include "db/generic_query_executor.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/schema_introspector.hpp"
#include "db/tenant_pool_registry.hpp"
#include "notify/run_notifier.hpp"
#include "security/statement_validator.hpp"

#include <atomic>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace nlsql;

namespace {

// Set by the signal watcher thread; the event sink stops on it
std::atomic<bool> g_interrupted{false};

void print_usage() {
    std::cerr <<
        "Usage: nlsql [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  validate <sql>                    Check a statement against the read-only gate\n"
        "  ping <tenant>                     Open a test connection to the tenant's database\n"
        "  schema <tenant>                   Print the tenant's schema as model context\n"
        "  ask <tenant> <answer.json>        Replay a structured answer and run its SQL\n"
        "  stream <tenant> <fragments.jsonl> Replay a streamed answer, print SSE events\n";
}

/**
 * @brief Writes events to stdout as server-sent-event lines
 */
class StdoutEventSink : public IEventSink {
public:
    void send(const StreamEvent& event) override {
        std::cout << event.to_sse() << std::flush;
    }

    bool is_open() const override {
        return !g_interrupted.load(std::memory_order_acquire) && std::cout.good();
    }
};

int run_validate(const std::string& sql) {
    const StatementValidator validator;
    const auto verdict = validator.validate(sql);

    if (verdict.accepted) {
        std::cout << R"({"accepted":true})" << '\n';
        return 0;
    }

    std::cout << std::format(R"({{"accepted":false,"reason":"{}","keyword":"{}","pattern":"{}","message":"{}"}})",
        rejection_kind_to_string(verdict.reason),
        utils::escape_json(verdict.keyword),
        utils::escape_json(verdict.pattern),
        utils::escape_json(verdict.message)) << '\n';
    return 1;
}

void print_error(ErrorCode code, const std::string& message, const ValidationVerdict* rejection = nullptr) {
    if (rejection && rejection->reason != RejectionKind::NONE) {
        std::cout << std::format(R"({{"error":"{}","message":"{}","reason":"{}","keyword":"{}","pattern":"{}"}})",
            error_code_to_string(code), utils::escape_json(message),
            rejection_kind_to_string(rejection->reason),
            utils::escape_json(rejection->keyword),
            utils::escape_json(rejection->pattern)) << '\n';
        return;
    }
    std::cout << std::format(R"({{"error":"{}","message":"{}"}})",
        error_code_to_string(code), utils::escape_json(message)) << '\n';
}

void print_ask_result(const AskResult& result) {
    std::cout << std::format(
        R"({{"sql":"{}","explanation":"{}","data":{},"rowCount":{},"elapsedMillis":{}}})",
        utils::escape_json(result.sql),
        utils::escape_json(result.explanation),
        rows_to_json(result.column_names, result.rows),
        result.row_count,
        result.elapsed.count()) << '\n';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string config_file = "config/nlsql.toml";
    if (args.size() >= 2 && args[0] == "--config") {
        config_file = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        print_usage();
        return 2;
    }

    const std::string& command = args[0];

    // Needs no database and no config
    if (command == "validate") {
        if (args.size() != 2) {
            print_usage();
            return 2;
        }
        return run_validate(args[1]);
    }

    if (args.size() < 2) {
        print_usage();
        return 2;
    }

    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return 2;
    }
    const auto& cfg = config_result.config;

    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    const std::string& tenant_id = args[1];
    const auto* tenant = cfg.find_tenant(tenant_id);
    if (!tenant) {
        utils::log::error(std::format("Tenant '{}' is not configured in {}", tenant_id, config_file));
        return 2;
    }

    TenantPoolRegistry::Config registry_config;
    auto& pool_defaults = registry_config.pool_defaults;
    pool_defaults.max_connections = static_cast<size_t>(cfg.pool.max_connections);
    pool_defaults.acquire_timeout = std::chrono::milliseconds(cfg.pool.acquire_timeout_ms);
    pool_defaults.idle_timeout = std::chrono::milliseconds(cfg.pool.idle_timeout_ms);
    pool_defaults.drain_timeout = std::chrono::milliseconds(cfg.pool.drain_timeout_ms);
    pool_defaults.max_lifetime = std::chrono::seconds(cfg.pool.max_lifetime_seconds);

    auto connection_factory = std::make_shared<PgConnectionFactory>(
        static_cast<uint32_t>(cfg.pool.connect_timeout_ms));
    auto registry = std::make_shared<TenantPoolRegistry>(registry_config, connection_factory);

    // Before the notifier starts its thread, so every later thread inherits the mask.
    // close_all cancels any statement still running once the drain timeout expires.
    SignalWatcher signal_watcher({SIGINT, SIGTERM}, [registry](int) {
        g_interrupted.store(true, std::memory_order_release);
        registry->close_all();
    });

    GenericQueryExecutor::Config executor_config;
    executor_config.max_result_rows = static_cast<uint32_t>(cfg.executor.max_result_rows);
    executor_config.statement_timeout_ms = static_cast<uint32_t>(cfg.executor.statement_timeout_ms);
    auto executor = std::make_shared<GenericQueryExecutor>(registry, executor_config);

    auto notifier = std::make_shared<RunNotifier>();
    notifier->add_listener(std::make_unique<LoggingRunListener>());

    QueryPipeline::Config pipeline_config;
    pipeline_config.max_stream_buffer_bytes = static_cast<size_t>(cfg.stream.max_buffer_bytes);
    QueryPipeline pipeline(executor, notifier, pipeline_config);

    const AskRequest request_base{tenant->id, tenant->dsn, {}};
    int exit_code = 0;

    if (command == "ping" && args.size() == 2) {
        const auto ok = registry->test_connection(tenant->dsn);
        if (ok.is_ok()) {
            std::cout << R"({"connected":true})" << '\n';
        } else {
            print_error(ok.error_code(), ok.error_message());
            exit_code = 1;
        }
    } else if (command == "schema" && args.size() == 2) {
        const auto schema = pipeline.describe(tenant->id, tenant->dsn);
        if (schema.is_ok()) {
            std::cout << SchemaIntrospector::format_context(schema.value());
        } else {
            print_error(schema.error_code(), schema.error_message());
            exit_code = 1;
        }
    } else if ((command == "ask" || command == "stream") && args.size() == 3) {
        auto source = (command == "ask")
            ? ReplayAnswerSource::from_answer_file(args[2])
            : ReplayAnswerSource::from_fragment_file(args[2]);
        if (source.is_error()) {
            utils::log::error(source.error_message());
            exit_code = 2;
        } else {
            AskRequest request = request_base;
            request.question = std::format("Replay of {}", args[2]);

            if (command == "ask") {
                ValidationVerdict rejection;
                const auto result = pipeline.ask(request, source.value(), &rejection);
                if (result.is_ok()) {
                    print_ask_result(result.value());
                } else {
                    print_error(result.error_code(), result.error_message(), &rejection);
                    exit_code = 1;
                }
            } else {
                StdoutEventSink sink;
                const auto result = pipeline.ask_streaming(request, source.value(), sink);
                exit_code = result.is_ok() ? 0 : 1;
            }
        }
    } else {
        print_usage();
        exit_code = 2;
    }

    notifier->shutdown();
    signal_watcher.stop();
    const auto report = registry->close_all();
    if (!report.errors.empty()) {
        exit_code = exit_code == 0 ? 1 : exit_code;
    }

    utils::log::info("Shutdown complete");
    return exit_code;
}
