#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <vector>

#include "cli/args_parser/args_parser.hpp"
#include "cli/prompt/terminal_prompt.hpp"
#include "i18n/messages.hpp"

using ftool::args_parser::parse_args;
using ftool::args_parser::to_request;
using ftool::core::Verb;

namespace {

auto parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "ftool");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ArgsParserTest, MoveWithMkdir)
{
    auto args = parse({"mv", "a.txt", "b.txt", "out", "-p", "-v"});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->verb, Verb::Move);
    EXPECT_EQ(args->sources, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(args->destination, "out");
    EXPECT_TRUE(args->mkdir);
    EXPECT_TRUE(args->verbose);
    EXPECT_FALSE(args->force);
}

TEST(ArgsParserTest, LongNamesAndAliases)
{
    auto copy = parse({"copy", "--force", "--verify", "src", "dst"});
    ASSERT_TRUE(copy);
    EXPECT_EQ(copy->verb, Verb::Copy);
    EXPECT_TRUE(copy->force);
    EXPECT_TRUE(copy->verify);

    auto backup = parse({"bak", "report.txt"});
    ASSERT_TRUE(backup);
    EXPECT_EQ(backup->verb, Verb::Backup);
    EXPECT_FALSE(backup->destination);

    auto remove = parse({"rm", "-q", "x", "y"});
    ASSERT_TRUE(remove);
    EXPECT_EQ(remove->verb, Verb::Remove);
    EXPECT_EQ(remove->sources.size(), 2u);
    EXPECT_TRUE(remove->quiet);
}

TEST(ArgsParserTest, RenameTakesPathAndName)
{
    auto args = parse({"ren", "old.txt", "new.txt"});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->verb, Verb::Rename);
    EXPECT_EQ(args->sources, (std::vector<std::string>{"old.txt"}));
    EXPECT_EQ(args->destination, "new.txt");

    auto too_many = parse({"ren", "a", "b", "c"});
    ASSERT_FALSE(too_many);
    EXPECT_EQ(too_many.error(), 3);
}

TEST(ArgsParserTest, InvalidInvocationsExitWithThree)
{
    auto missing_target = parse({"cp", "only-one"});
    ASSERT_FALSE(missing_target);
    EXPECT_EQ(missing_target.error(), 3);

    auto conflicting = parse({"mv", "-f", "-n", "a", "d"});
    ASSERT_FALSE(conflicting);
    EXPECT_EQ(conflicting.error(), 3);

    auto no_verb = parse({});
    ASSERT_FALSE(no_verb);
    EXPECT_EQ(no_verb.error(), 3);
}

TEST(ArgsParserTest, HelpExitsWithZero)
{
    auto help = parse({"--help"});
    ASSERT_FALSE(help);
    EXPECT_EQ(help.error(), 0);
}

TEST(ArgsParserTest, RequestUsesAbsolutePathsExceptNewName)
{
    auto moved = parse({"mv", "a.txt", "out"});
    ASSERT_TRUE(moved);
    auto request = to_request(*moved);
    ASSERT_EQ(request.sources.size(), 1u);
    EXPECT_TRUE(request.sources[0].is_absolute());
    ASSERT_TRUE(request.destination);
    EXPECT_TRUE(request.destination->is_absolute());

    auto renamed = parse({"ren", "a.txt", "b.txt"});
    ASSERT_TRUE(renamed);
    auto rename_request = to_request(*renamed);
    EXPECT_EQ(rename_request.destination, std::filesystem::path("b.txt"));
}

// --- TerminalPrompt ----------------------------------------------------------

using ftool::cli::TerminalPrompt;

TEST(TerminalPromptTest, InterpretsShortAndLongAnswers)
{
    EXPECT_EQ(TerminalPrompt::interpret(""), '\n');
    EXPECT_EQ(TerminalPrompt::interpret("  "), '\n');
    EXPECT_EQ(TerminalPrompt::interpret("Y"), 'y');
    EXPECT_EQ(TerminalPrompt::interpret("yes"), 'y');
    EXPECT_EQ(TerminalPrompt::interpret("No"), 'n');
    EXPECT_EQ(TerminalPrompt::interpret("all"), 'a');
    EXPECT_EQ(TerminalPrompt::interpret("skip"), 's');
    EXPECT_EQ(TerminalPrompt::interpret("quit"), 'q');
    EXPECT_EQ(TerminalPrompt::interpret("是"), 'y');
    EXPECT_EQ(TerminalPrompt::interpret("跳过"), 's');
    EXPECT_EQ(TerminalPrompt::interpret("maybe"), '?');
}

TEST(TerminalPromptTest, ReadsOneLinePerQuestion)
{
    ftool::i18n::MessageCatalog messages;
    std::istringstream in("all\n\n");
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);

    TerminalPrompt prompt(messages, in, out);
    EXPECT_EQ(prompt.ask(ftool::core::PromptKind::Overwrite, "/d/a.txt"), 'a');
    EXPECT_EQ(prompt.ask(ftool::core::PromptKind::DirectoryCreation, "/d"), '\n');
    // Конец ввода — выход
    EXPECT_EQ(prompt.ask(ftool::core::PromptKind::Overwrite, "/d/b.txt"), 'q');

    std::fclose(out);
}
