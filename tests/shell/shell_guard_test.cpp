#include <gtest/gtest.h>

#include "shell/shell_guard.hpp"

namespace sandcell::shell {
namespace {

ShellVerdict Validate(const std::string& line, const ShellPolicy& policy = ShellPolicy{}) {
    return ShellGuard::Validate(line, policy);
}

TEST(ShellGuardTest, AcceptsSafeCommands) {
    const auto verdict = Validate("ls -la");
    EXPECT_TRUE(verdict.accepted) << verdict.reason;
    EXPECT_EQ(verdict.commands, (std::vector<std::string>{"ls"}));
    EXPECT_EQ(verdict.command.Render(), "ls -la");
}

TEST(ShellGuardTest, RejectsUnknownCommand) {
    const auto verdict = Validate("rm -rf /");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Command 'rm' is not in the list of safe commands.");
}

TEST(ShellGuardTest, AdditionalCommandsExtendTheList) {
    ShellPolicy policy{};
    EXPECT_FALSE(Validate("python3 script.py", policy).accepted);
    policy.additional_safe_commands = {"python3"};
    EXPECT_TRUE(Validate("python3 script.py", policy).accepted);
}

TEST(ShellGuardTest, ChecksEveryCommandInAPipeline) {
    auto verdict = Validate("cat data.txt | sort | uniq -c && echo ok");
    EXPECT_TRUE(verdict.accepted) << verdict.reason;
    EXPECT_EQ(verdict.commands, (std::vector<std::string>{"cat", "sort", "uniq", "echo"}));
    EXPECT_EQ(verdict.operators, (std::vector<std::string>{"|", "|", "&&"}));

    verdict = Validate("ls; curl http://example.com");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Command 'curl' is not in the list of safe commands.");
}

TEST(ShellGuardTest, RejectsOperatorsOutsideTheList) {
    auto verdict = Validate("echo hi > out.txt");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Control operator '>' is not allowed.");

    verdict = Validate("sleep 1 &");
    EXPECT_FALSE(verdict.accepted);

    ShellPolicy policy{};
    policy.additional_safe_operators = {">"};
    EXPECT_TRUE(Validate("echo hi > out.txt", policy).accepted);
}

TEST(ShellGuardTest, SubstitutionCountsAsOperator) {
    auto verdict = Validate("echo $(whoami)");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Control operator '$(' is not allowed.");

    verdict = Validate("echo `id`");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Control operator '`' is not allowed.");
}

TEST(ShellGuardTest, RejectsDangerousArgumentsOfSafeCommands) {
    auto verdict = Validate("find . -name '*.tmp' -delete");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Argument '-delete' is not allowed for command 'find'.");

    EXPECT_FALSE(Validate("find . -exec cat {} ;").accepted);
    EXPECT_FALSE(Validate("sort -o out.txt in.txt").accepted);
    EXPECT_FALSE(Validate("sort --output=out.txt in.txt").accepted);
    EXPECT_FALSE(Validate("rg --pre=./x pattern").accepted);
    EXPECT_TRUE(Validate("find . -name '*.py'").accepted);
    EXPECT_TRUE(Validate("sort -r in.txt").accepted);
}

TEST(ShellGuardTest, RejectsVariableNameOptions) {
    auto verdict = Validate("printf -v 'a[$(touch /tmp/marker)]' x");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Argument '-v' is not allowed for command 'printf'.");

    verdict = Validate("test -v 'a[$(touch /tmp/marker)]'");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Argument '-v' is not allowed for command 'test'.");

    EXPECT_FALSE(Validate("printf -vname '%s' x").accepted);
    EXPECT_FALSE(Validate("ls && test -R ref").accepted);
    EXPECT_TRUE(Validate("printf '%s\\n' x").accepted);
    EXPECT_TRUE(Validate("test -f data.txt && cat data.txt").accepted);
}

TEST(ShellGuardTest, QuotedOperatorsAreArguments) {
    const auto verdict = Validate("echo 'a && b; rm -rf /'");
    EXPECT_TRUE(verdict.accepted) << verdict.reason;
    EXPECT_TRUE(verdict.operators.empty());
}

TEST(ShellGuardTest, LeadingAssignmentsAreSkipped) {
    const auto verdict = Validate("LC_ALL=C sort data.txt");
    EXPECT_TRUE(verdict.accepted) << verdict.reason;
    EXPECT_EQ(verdict.commands, (std::vector<std::string>{"sort"}));
}

TEST(ShellGuardTest, AssignmentWithoutCommandIsRejected) {
    auto verdict = Validate("x='a b'");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Variable assignment 'x='a b'' without a command is not allowed.");

    verdict = Validate("ls; LANG=C");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Variable assignment 'LANG=C' without a command is not allowed.");

    EXPECT_TRUE(Validate("LANG='C.UTF-8' ls").accepted);
}

TEST(ShellGuardTest, RejectsAssignmentsThatRedirectLookup) {
    auto verdict = Validate("PATH=/tmp/bin ls");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "Assignment to variable 'PATH' is not allowed.");
    EXPECT_FALSE(Validate("LD_PRELOAD=/tmp/x.so cat a").accepted);

    ShellPolicy bypass{};
    bypass.bypass_shell_safety = true;
    EXPECT_TRUE(Validate("PATH=/tmp/bin ls", bypass).accepted);
}

TEST(ShellGuardTest, PathCommandsNeedExplicitApproval) {
    EXPECT_FALSE(Validate("/bin/ls").accepted);
    ShellPolicy policy{};
    policy.additional_safe_commands = {"/bin/ls"};
    EXPECT_TRUE(Validate("/bin/ls", policy).accepted);
}

TEST(ShellGuardTest, WildcardApprovesAnyCommand) {
    ShellPolicy policy{};
    policy.additional_safe_commands = {"*"};
    EXPECT_TRUE(Validate("make -j4", policy).accepted);
    EXPECT_TRUE(Validate("find . -delete", policy).accepted);
    EXPECT_FALSE(Validate("make > log", policy).accepted);
}

TEST(ShellGuardTest, BypassAcceptsEverything) {
    ShellPolicy policy{};
    policy.bypass_shell_safety = true;
    EXPECT_TRUE(Validate("rm -rf build && echo $(date) > log", policy).accepted);

    const auto verdict = Validate("echo 'unterminated", policy);
    EXPECT_TRUE(verdict.accepted);
    EXPECT_EQ(verdict.command.Render(), "echo 'unterminated");
}

TEST(ShellGuardTest, RejectsEmptyAndMalformedInput) {
    EXPECT_EQ(Validate("   ").reason, "Empty command.");
    EXPECT_FALSE(Validate("echo 'unterminated").accepted);
}

TEST(ShellGuardTest, RendersFromValidatedTokens) {
    const auto verdict = Validate("  grep   -n 'a b'   file.txt  ");
    ASSERT_TRUE(verdict.accepted);
    EXPECT_EQ(verdict.command.Render(), "grep -n 'a b' file.txt");
    const auto json = verdict.ToJson();
    EXPECT_EQ(json["rendered"], "grep -n 'a b' file.txt");
    EXPECT_TRUE(json["accepted"].get<bool>());
}

}  // namespace
}  // namespace sandcell::shell
