#include <gtest/gtest.h>

#include <cerrno>
#include <system_error>

#include "infra/error_handler/error.hpp"
#include "core/model/operation.hpp"

using ftool::infra::ErrorCode;
using ftool::infra::from_error_code;
using ftool::infra::make_error;

namespace {

auto code_for(int err) -> ErrorCode {
    return from_error_code(std::error_code(err, std::generic_category()), "Cannot open", "/x/y").code;
}

} // namespace

TEST(ErrorTest, MapsOsErrorsToTaxonomy)
{
    EXPECT_EQ(code_for(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_for(EPERM), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_for(EROFS), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_for(ENOSPC), ErrorCode::InsufficientSpace);
    EXPECT_EQ(code_for(EDQUOT), ErrorCode::InsufficientSpace);
    EXPECT_EQ(code_for(EXDEV), ErrorCode::CrossDeviceError);
    EXPECT_EQ(code_for(ENOENT), ErrorCode::SourceNotFound);
    EXPECT_EQ(code_for(EIO), ErrorCode::IoError);
}

TEST(ErrorTest, MessageNamesActionAndPath)
{
    auto err = from_error_code(std::error_code(EACCES, std::generic_category()), "Cannot open", "/x/y");
    EXPECT_NE(err.message.find("Cannot open /x/y"), std::string::npos);
    EXPECT_STREQ(err.what(), err.message.c_str());
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, MakeErrorRecordsCallSite)
{
    const int expected_line = __LINE__ + 1;
    auto err = make_error(ErrorCode::IoError, "boom");
    EXPECT_EQ(err.line, expected_line);
    EXPECT_NE(err.file.find("test_error.cpp"), std::string::npos);
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::InvalidInvocation, "").to_exit_code(), 3);
    EXPECT_EQ(make_error(ErrorCode::Aborted, "").to_exit_code(), 2);
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::IoError, "").to_exit_code(), 1);
}

TEST(ErrorTest, OnlyAbortAndInterruptStopTheBatch)
{
    EXPECT_TRUE(make_error(ErrorCode::Aborted, "").stops_batch());
    EXPECT_TRUE(make_error(ErrorCode::Interrupted, "").stops_batch());
    EXPECT_FALSE(make_error(ErrorCode::PermissionDenied, "").stops_batch());
    EXPECT_TRUE(make_error(ErrorCode::PermissionDenied, "").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::MissingTargetDirectory, "").is_fatal());
}

TEST(ErrorTest, ToStringCoversCodes)
{
    EXPECT_EQ(ftool::infra::to_string(ErrorCode::RecursiveConflict), "RecursiveConflict");
    EXPECT_EQ(ftool::infra::to_string(ErrorCode::TrashUnavailable), "TrashUnavailable");
}

// --- OperationRequest / results -------------------------------------------

using namespace ftool::core;

TEST(OperationRequestTest, RejectsForceWithNoClobber)
{
    OperationRequest request;
    request.verb = Verb::Copy;
    request.sources = {"/a"};
    request.destination = "/d";
    request.options.force_overwrite = true;
    request.options.no_clobber = true;

    auto res = validate_request(request);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidInvocation);
}

TEST(OperationRequestTest, ChecksDestinationPerVerb)
{
    auto accepted = [](Verb verb, std::vector<std::filesystem::path> sources,
                       std::optional<std::filesystem::path> destination) {
        OperationRequest request;
        request.verb = verb;
        request.sources = std::move(sources);
        request.destination = std::move(destination);
        return validate_request(request).has_value();
    };

    EXPECT_FALSE(accepted(Verb::Move, {"/a"}, std::nullopt));
    EXPECT_FALSE(accepted(Verb::Remove, {"/a"}, "/d"));
    EXPECT_FALSE(accepted(Verb::Rename, {"/a", "/b"}, "c"));
    EXPECT_FALSE(accepted(Verb::Backup, {}, std::nullopt));

    EXPECT_TRUE(accepted(Verb::Move, {"/a", "/b"}, "/d"));
    EXPECT_TRUE(accepted(Verb::Rename, {"/a"}, "c"));
    EXPECT_TRUE(accepted(Verb::Remove, {"/a"}, std::nullopt));
}

TEST(OperationResultTest, LeafCountsItself)
{
    auto ok = OperationResult::leaf("/a", Outcome::Succeeded);
    EXPECT_EQ(ok.leaves.succeeded, 1u);
    EXPECT_EQ(ok.leaves.total(), 1u);

    auto failed = OperationResult::failed("/b", make_error(ErrorCode::IoError, "boom"));
    EXPECT_EQ(failed.outcome, Outcome::Failed);
    ASSERT_TRUE(failed.error);
    EXPECT_EQ(failed.error->code, ErrorCode::IoError);
    EXPECT_EQ(failed.leaves.failed, 1u);
}

TEST(BatchSummaryTest, ExitCodePrecedence)
{
    BatchSummary summary;
    EXPECT_EQ(summary.exit_code(), 0);

    summary.counts.skipped = 2;
    EXPECT_EQ(summary.exit_code(), 0);

    summary.counts.failed = 1;
    EXPECT_EQ(summary.exit_code(), 1);

    summary.aborted_by_user = true;
    EXPECT_EQ(summary.exit_code(), 2);

    summary.interrupted = true;
    EXPECT_EQ(summary.exit_code(), 130);

    BatchSummary invalid;
    invalid.batch_error = make_error(ErrorCode::InvalidInvocation, "bad");
    EXPECT_EQ(invalid.exit_code(), 3);
}

TEST(StrategyTest, CopyClass)
{
    EXPECT_TRUE(is_copy_class(Strategy::BufferedCopy));
    EXPECT_TRUE(is_copy_class(Strategy::CopyThenDelete));
    EXPECT_TRUE(is_copy_class(Strategy::CopyOnly));
    EXPECT_FALSE(is_copy_class(Strategy::AtomicRename));
    EXPECT_FALSE(is_copy_class(Strategy::SoftDelete));
}
