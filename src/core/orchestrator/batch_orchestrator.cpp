#include "batch_orchestrator.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/validator/path_validator.hpp"
#include "infra/interrupt.hpp"

namespace ftool::core {

using infra::ErrorCode;

namespace {

auto verb_message_key(Verb verb) -> std::string_view {
    switch (verb) {
        case Verb::Move:   return "moving";
        case Verb::Copy:   return "copying";
        case Verb::Rename: return "renaming";
        case Verb::Remove: return "removing";
        case Verb::Backup: return "backing_up";
    }
    return "moving";
}

} // namespace

BatchOrchestrator::BatchOrchestrator(const infra::Config& config,
                                     const i18n::MessageProvider& messages,
                                     Prompt& prompt,
                                     const adapters::fs::FsProbe& probe,
                                     adapters::fs::FsOps& ops,
                                     adapters::trash::RecoverableStore& trash,
                                     ProgressSink& sink)
    : config_(config)
    , messages_(messages)
    , prompt_(prompt)
    , sink_(sink)
    , selector_(config, probe)
    , executor_(config, selector_, probe, ops, trash) {}

void BatchOrchestrator::abort_remaining(const OperationRequest& request, std::size_t from,
                                        const infra::Error& reason, BatchSummary& summary)
{
    for (std::size_t i = from; i < request.sources.size(); ++i) {
        auto result = OperationResult::aborted(request.sources[i], reason);
        if (request.options.verbose) {
            sink_.on_status(i18n::format(messages_, "not_started", fmt::arg("path", result.path.string())));
        }
        summary.counts.merge(result.leaves);
        summary.results.push_back(std::move(result));
    }
}

void BatchOrchestrator::fail_all(const OperationRequest& request, const infra::Error& reason,
                                 BatchSummary& summary)
{
    for (const auto& source : request.sources) {
        auto result = OperationResult::failed(source, reason);
        summary.counts.merge(result.leaves);
        summary.results.push_back(std::move(result));
    }
}

auto BatchOrchestrator::prepare_destination(const OperationRequest& request,
                                            Options& options,
                                            BatchSummary& summary) -> bool
{
    const auto& destination = *request.destination;
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::status(destination, ec))) {
        // Каталог или нет — решит проверка каждого элемента
        return true;
    }

    if (!options.auto_mkdir && !confirm_directory_creation(prompt_, destination)) {
        auto reason = infra::make_error(ErrorCode::MissingTargetDirectory,
            fmt::format("Target directory does not exist: {}", destination.string()));
        spdlog::warn("{}", reason.message);
        summary.aborted_by_user = true;
        abort_remaining(request, 0, reason, summary);
        summary.batch_error = std::move(reason);
        return false;
    }

    if (options.verbose) {
        sink_.on_status(i18n::format(messages_, "creating_dirs", fmt::arg("path", destination.string())));
    }
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        auto reason = infra::log_and_return(infra::from_error_code(ec, "Cannot create destination", destination));
        fail_all(request, reason, summary);
        summary.batch_error = std::move(reason);
        return false;
    }

    spdlog::debug("Created {}", destination.string());
    options.auto_mkdir = true;
    return true;
}

void BatchOrchestrator::announce(const OperationRequest& request, const TransferPlan& plan,
                                 std::size_t index, std::size_t total)
{
    if (!request.options.verbose) return;

    std::string line;
    if (total > 1) {
        line = i18n::format(messages_, "entry_prefix", fmt::arg("current", index), fmt::arg("total", total));
    }
    line += i18n::format(messages_, verb_message_key(request.verb),
                         fmt::arg("source", plan.source_path.string()),
                         fmt::arg("target", plan.resolved_target_path.string()));
    sink_.on_status(line);
}

void BatchOrchestrator::report(const OperationResult& result, bool verbose) {
    if (!verbose) return;

    switch (result.outcome) {
        case Outcome::Succeeded:
            if (result.has_warning(Warning::SourceRetained)) {
                sink_.on_status(i18n::format(messages_, "source_retained", fmt::arg("path", result.path.string())));
            }
            break;
        case Outcome::Skipped:
            sink_.on_status(i18n::format(messages_, "skipped", fmt::arg("path", result.path.string())));
            break;
        case Outcome::Failed:
            sink_.on_status(i18n::format(messages_, "failed",
                                         fmt::arg("path", result.path.string()),
                                         fmt::arg("reason", result.error ? result.error->message : "")));
            break;
        case Outcome::Aborted:
            // Элемент начат и прерван на середине
            sink_.on_status(i18n::format(messages_, "stopped", fmt::arg("path", result.path.string())));
            break;
    }
}

auto BatchOrchestrator::run(const OperationRequest& request) -> BatchSummary {
    BatchSummary summary;

    if (auto valid = validate_request(request); !valid) {
        summary.batch_error = infra::log_and_return(std::move(valid.error()));
        return summary;
    }

    Options options = request.options;
    OverwriteResolver resolver(prompt_, options);
    const std::size_t total = request.sources.size();
    const bool batch_progress = total >= config_.multi_entry_threshold;

    if (needs_directory_destination(request.verb) && !prepare_destination(request, options, summary)) {
        return summary;
    }

    spdlog::debug("Starting {} of {} item(s)", to_string(request.verb), total);

    for (std::size_t i = 0; i < total; ++i) {
        const auto& source = request.sources[i];

        if (resolver.aborted()) {
            abort_remaining(request, i,
                infra::make_error(ErrorCode::Aborted, "Batch aborted by user"), summary);
            break;
        }
        if (infra::is_interrupted()) {
            spdlog::warn("Received signal {}, stopping", infra::interrupt_signal());
            resolver.abort();
            abort_remaining(request, i,
                infra::make_error(ErrorCode::Interrupted, "Interrupted by signal"), summary);
            break;
        }

        if (batch_progress) {
            sink_.on_batch_progress(i, total);
        }

        OperationResult result;
        if (auto valid = PathValidator::validate(source, request.destination, request.verb, options); !valid) {
            result = OperationResult::failed(source, infra::log_and_return(std::move(valid.error())));
        } else if (auto plan = selector_.select(PlanInput{
                       .verb = request.verb,
                       .source = source,
                       .destination = request.destination,
                       .entry_count = total,
                   }); !plan) {
            result = OperationResult::failed(source, infra::log_and_return(std::move(plan.error())));
        } else {
            announce(request, *plan, i + 1, total);
            result = executor_.execute(*plan, resolver, sink_, EntryPosition{.index = i + 1, .total = total});
        }

        report(result, options.verbose);
        summary.counts.merge(result.leaves);
        summary.results.push_back(std::move(result));
    }

    if (batch_progress) {
        sink_.on_batch_progress(summary.results.size(), total);
    }

    summary.aborted_by_user = summary.aborted_by_user || (resolver.aborted() && !infra::is_interrupted());
    summary.interrupted = infra::is_interrupted();

    if (options.verbose) {
        sink_.on_status(i18n::format(messages_, "summary",
                                     fmt::arg("succeeded", summary.counts.succeeded),
                                     fmt::arg("skipped", summary.counts.skipped),
                                     fmt::arg("failed", summary.counts.failed),
                                     fmt::arg("aborted", summary.counts.aborted)));
    }
    spdlog::debug("{} finished: {} succeeded, {} skipped, {} failed, {} aborted",
                  to_string(request.verb), summary.counts.succeeded, summary.counts.skipped,
                  summary.counts.failed, summary.counts.aborted);
    return summary;
}

} // namespace ftool::core
