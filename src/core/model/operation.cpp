#include "operation.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace ftool::core {

auto to_string(Verb verb) -> std::string_view {
    switch (verb) {
        case Verb::Move:   return "move";
        case Verb::Copy:   return "copy";
        case Verb::Rename: return "rename";
        case Verb::Remove: return "remove";
        case Verb::Backup: return "backup";
    }
    return "unknown";
}

auto to_string(Strategy strategy) -> std::string_view {
    switch (strategy) {
        case Strategy::AtomicRename:   return "AtomicRename";
        case Strategy::BufferedCopy:   return "BufferedCopy";
        case Strategy::CopyThenDelete: return "CopyThenDelete";
        case Strategy::CopyOnly:       return "CopyOnly";
        case Strategy::SoftDelete:     return "SoftDelete";
    }
    return "unknown";
}

auto to_string(Outcome outcome) -> std::string_view {
    switch (outcome) {
        case Outcome::Succeeded: return "Succeeded";
        case Outcome::Skipped:   return "Skipped";
        case Outcome::Failed:    return "Failed";
        case Outcome::Aborted:   return "Aborted";
    }
    return "unknown";
}

auto validate_request(const OperationRequest& request) -> infra::VoidResult {
    using infra::ErrorCode;

    if (request.sources.empty()) {
        return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation, "No source paths given"));
    }
    if (request.options.force_overwrite && request.options.no_clobber) {
        return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
                                                 "Cannot use --force and --no-clobber together"));
    }

    switch (request.verb) {
        case Verb::Move:
        case Verb::Copy:
            if (!request.destination || request.destination->empty()) {
                return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
                    fmt::format("{} requires a target directory", to_string(request.verb))));
            }
            break;
        case Verb::Rename:
            if (request.sources.size() != 1) {
                return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
                                                         "rename takes exactly one source"));
            }
            if (!request.destination || request.destination->empty()) {
                return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
                                                         "rename requires a new name"));
            }
            break;
        case Verb::Remove:
        case Verb::Backup:
            if (request.destination) {
                return std::unexpected(infra::make_error(ErrorCode::InvalidInvocation,
                    fmt::format("{} does not take a destination", to_string(request.verb))));
            }
            break;
    }
    return {};
}

void OutcomeCounts::add(Outcome outcome) {
    switch (outcome) {
        case Outcome::Succeeded: ++succeeded; break;
        case Outcome::Skipped:   ++skipped;   break;
        case Outcome::Failed:    ++failed;    break;
        case Outcome::Aborted:   ++aborted;   break;
    }
}

void OutcomeCounts::merge(const OutcomeCounts& other) {
    succeeded += other.succeeded;
    skipped += other.skipped;
    failed += other.failed;
    aborted += other.aborted;
}

auto OperationResult::has_warning(Warning warning) const -> bool {
    return std::find(warnings.begin(), warnings.end(), warning) != warnings.end();
}

auto OperationResult::leaf(std::filesystem::path path, Outcome outcome) -> OperationResult {
    OperationResult result;
    result.path = std::move(path);
    result.outcome = outcome;
    result.leaves.add(outcome);
    return result;
}

auto OperationResult::failed(std::filesystem::path path, infra::Error error) -> OperationResult {
    auto result = leaf(std::move(path), Outcome::Failed);
    result.error = std::move(error);
    return result;
}

auto OperationResult::aborted(std::filesystem::path path, std::optional<infra::Error> reason)
    -> OperationResult
{
    auto result = leaf(std::move(path), Outcome::Aborted);
    result.error = std::move(reason);
    return result;
}

auto BatchSummary::exit_code() const -> int {
    if (interrupted) return 130;
    if (aborted_by_user) return 2;
    if (batch_error) return batch_error->to_exit_code();
    if (counts.failed > 0) return 1;
    return 0;
}

} // namespace ftool::core
