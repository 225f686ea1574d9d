#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "operations/command_operation.hpp"
#include "operations/filesystem_operations.hpp"
#include "operations/math_operation.hpp"
#include "operations/operation_registry.hpp"
#include "protocol/conversation_contract.hpp"
#include "response/response_normalizer.hpp"
#include "runtime/conversation_loop.hpp"
#include "runtime/process_backend.hpp"
#include "runtime/resilient_invoker.hpp"
#include "runtime/scripted_backend.hpp"
#include "session/session_store.hpp"

namespace {

namespace errors = harbor::core::errors;

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitNotConfirmed = 3;
constexpr int kExitCancelled = 4;

// Set once the session token exists; SIGINT/SIGTERM only flip the flag.
std::atomic<std::atomic_bool*> g_cancel_flag{nullptr};

void handle_stop_signal(int) {
    std::atomic_bool* flag = g_cancel_flag.load();
    if (flag != nullptr) {
        flag->store(true);
    }
}

int report_input_error(const errors::AgentError& err) {
    HARBOR_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        HARBOR_LOG_INFO("Hint: " + err.hint);
    }
    return kExitInputError;
}

errors::Result<harbor::core::config::EngineConfig> resolve_config(
    const harbor::app::cli::CliCommand& cmd) {
    harbor::core::config::EngineConfig config;
    if (cmd.config_file) {
        auto loaded = harbor::core::config::load_engine_config(cmd.config_file.value());
        if (errors::is_error(loaded)) {
            return errors::get_error(loaded);
        }
        config = errors::get_value(loaded);
    }

    if (cmd.cache_root) config.cache_root = cmd.cache_root.value();
    if (cmd.max_iterations) config.max_iterations = cmd.max_iterations.value();
    if (cmd.max_retries) config.max_retries = cmd.max_retries.value();
    return harbor::core::config::validate_engine_config(config);
}

errors::Result<std::string> register_catalog(
    harbor::operations::OperationRegistry& registry,
    const harbor::core::config::EngineConfig& config) {
    using namespace harbor::operations;
    std::unique_ptr<Operation> catalog[] = {
        std::make_unique<DirectoryCreateOperation>(),
        std::make_unique<DirectoryListOperation>(),
        std::make_unique<DirectoryDeleteOperation>(),
        std::make_unique<FileReadOperation>(),
        std::make_unique<FileWriteOperation>(),
        std::make_unique<FileDeleteOperation>(),
        std::make_unique<ChangeDirectoryOperation>(),
        std::make_unique<PrintWorkingDirectoryOperation>(),
        std::make_unique<ExternalCommandOperation>(config.operation_timeout),
        std::make_unique<MathEvaluatorOperation>(),
    };
    for (auto& operation : catalog) {
        auto registered = registry.register_operation(std::move(operation));
        if (errors::is_error(registered)) {
            return errors::get_error(registered);
        }
    }
    registry.freeze();
    return std::to_string(registry.size()) + " operations";
}

int run_cleanup(const harbor::app::cli::CliCommand& cmd,
                const harbor::core::config::EngineConfig& config) {
    harbor::session::SessionStore store(config.cache_root);
    auto removed = store.cleanup_session(cmd.session_id.value());
    if (errors::is_error(removed)) {
        const auto& err = errors::get_error(removed);
        HARBOR_LOG_ERROR("Cleanup failed [" + err.code + "]: " + err.message);
        return kExitFailed;
    }
    HARBOR_LOG_INFO(errors::get_value(removed)
                        ? "Removed session " + cmd.session_id.value()
                        : "Nothing to remove for session " + cmd.session_id.value());
    return kExitCompleted;
}

int run_conversation(const harbor::app::cli::CliCommand& cmd,
                     const harbor::core::config::EngineConfig& config) {
    harbor::operations::OperationRegistry registry;
    auto registered = register_catalog(registry, config);
    if (errors::is_error(registered)) {
        const auto& err = errors::get_error(registered);
        HARBOR_LOG_ERROR("Catalog setup failed [" + err.code + "]: " + err.message);
        return kExitFailed;
    }
    HARBOR_LOG_DEBUG("Catalog ready: " + errors::get_value(registered));

    harbor::session::SessionStore store(config.cache_root);
    auto opened = cmd.session_id ? store.open_session(cmd.session_id.value())
                                 : store.create_session();
    if (errors::is_error(opened)) {
        return report_input_error(errors::get_error(opened));
    }
    const auto scope = errors::get_value(opened);

    auto token_result = store.get_cancel_token(scope->session_id());
    if (errors::is_error(token_result)) {
        const auto& err = errors::get_error(token_result);
        HARBOR_LOG_ERROR("Failed to get cancellation token [" + err.code + "]: " + err.message);
        return kExitFailed;
    }
    const auto cancel_token = errors::get_value(token_result);
    g_cancel_flag.store(cancel_token.get());
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    std::unique_ptr<harbor::protocol::Backend> backend;
    if (cmd.script_file) {
        auto script = harbor::runtime::ScriptedBackend::load_script(cmd.script_file.value());
        if (errors::is_error(script)) {
            return report_input_error(errors::get_error(script));
        }
        backend = std::make_unique<harbor::runtime::ScriptedBackend>(errors::get_value(script));
    } else {
        harbor::runtime::ProcessBackendOptions options;
        options.command = cmd.backend_command.value();
        options.timeout = config.backend_timeout;
        options.cancel_token = cancel_token;
        backend = std::make_unique<harbor::runtime::ProcessBackend>(std::move(options));
    }

    const harbor::runtime::ResilientInvoker invoker(
        harbor::runtime::RetryPolicy{config.max_retries, config.base_delay});
    const harbor::response::ResponseNormalizer normalizer(
        harbor::response::NormalizerSettings{config.min_completion_confidence,
                                             config.min_reasoning_length},
        &registry);
    const harbor::runtime::ConversationLoop loop(*backend, registry, invoker, normalizer,
                                                 config.max_iterations);

    HARBOR_LOG_INFO("Session " + scope->session_id() + " rooted at " + scope->root().string() +
                    " (backend: " + backend->name() + ")");
    const auto outcome = harbor::runtime::run_opened_session(store, loop, scope, cmd.task);
    g_cancel_flag.store(nullptr);

    std::cout << outcome.response << std::endl;
    if (!outcome.completion_confirmed) {
        std::cout << "[completion not confirmed: " << harbor::protocol::to_string(outcome.state)
                  << "]" << std::endl;
    }
    if (outcome.error) {
        HARBOR_LOG_ERROR("Conversation error [" + outcome.error->code + "]: " +
                         outcome.error->message);
    }
    HARBOR_LOG_INFO("Session " + outcome.session_id + " finished as " +
                    harbor::protocol::to_string(outcome.state) + " after " +
                    std::to_string(outcome.backend_round_trips) + " backend round trip(s)");

    switch (outcome.state) {
        case harbor::protocol::ConversationState::Completed:
            return kExitCompleted;
        case harbor::protocol::ConversationState::Aborted:
            return kExitNotConfirmed;
        case harbor::protocol::ConversationState::Cancelled:
            return kExitCancelled;
        default:
            return kExitFailed;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    harbor::core::logging::Logger::get().set_label("harbor");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = harbor::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        return report_input_error(errors::get_error(parsed));
    }
    const auto& cmd = errors::get_value(parsed);
    if (cmd.verbose) {
        harbor::core::logging::Logger::get().set_min_level(
            harbor::core::logging::LogLevel::DEBUG);
    }

    // 2. Layer the config file and flag overrides
    auto config = resolve_config(cmd);
    if (errors::is_error(config)) {
        return report_input_error(errors::get_error(config));
    }

    // 3. Dispatch
    if (cmd.kind == harbor::app::cli::CommandKind::Cleanup) {
        return run_cleanup(cmd, errors::get_value(config));
    }
    return run_conversation(cmd, errors::get_value(config));
}
