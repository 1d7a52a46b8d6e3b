#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "builtin.h"
#include "echo_command.h"
#include "job_control.h"
#include "job_control_commands.h"
#include "shell_script_interpreter.h"
#include "test_command.h"
#include "test_support.h"

using esh_test::run_script;
using esh_test::ScriptOutput;
using esh_test::TempDir;

namespace {

class BuiltinTest : public ::testing::Test {
   protected:
    ShellScriptInterpreter shell{false};

    ScriptOutput run(const std::string& text) {
        return run_script(shell, text);
    }
};

}  // namespace

TEST(BuiltinRegistry, KnowsCoreBuiltins) {
    Built_ins builtins;
    for (const char* name : {":", "true", "false", "echo", "cd", "pwd", "exit", "set", "shift",
                             "export", "unset", "declare", "typeset", "test", "[", "jobs",
                             "wait", "fg", "bg", "eval", "break", "continue"}) {
        EXPECT_TRUE(builtins.is_builtin_command(name)) << name;
    }
    EXPECT_FALSE(builtins.is_builtin_command("ls"));

    auto names = builtins.get_builtin_commands();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
}

TEST(BuiltinRegistry, ShellQuoting) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST_F(BuiltinTest, RegisteredBuiltinIsDispatched) {
    Built_ins builtins;
    std::vector<std::string> seen;
    builtins.register_builtin("greet",
                              [&seen](const std::vector<std::string>& args, BuiltinContext&) {
                                  seen = args;
                                  return ExecResult::normal(3);
                              });
    EXPECT_TRUE(builtins.is_builtin_command("greet"));

    BuiltinContext ctx{shell.environment(), shell.options(), shell.job_manager(),
                       IoContext::standard(), shell};
    ExecResult result = builtins.builtin_command({"greet", "world"}, ctx);
    EXPECT_EQ(result.exit_status(), 3);
    EXPECT_EQ(seen, (std::vector<std::string>{"greet", "world"}));

    ExecResult missing = builtins.builtin_command({"nosuch"}, ctx);
    EXPECT_TRUE(missing.is_failure());
    EXPECT_EQ(missing.exit_status(), 127);
}

TEST_F(BuiltinTest, ColonTrueFalse) {
    EXPECT_EQ(run(":").status, 0);
    EXPECT_EQ(run("true").status, 0);
    EXPECT_EQ(run("false").status, 1);
}

TEST_F(BuiltinTest, EchoOptions) {
    EXPECT_EQ(run("echo a b").out, "a b\n");
    EXPECT_EQ(run("echo -n no newline").out, "no newline");
    EXPECT_EQ(run("echo -e 'tab\\there'").out, "tab\there\n");
    EXPECT_EQ(run("echo 'raw\\tslash'").out, "raw\\tslash\n");
    EXPECT_EQ(run("echo -e 'stop\\cignored'").out, "stop");
    EXPECT_EQ(run("echo -x").out, "-x\n");
}

TEST(EchoEscapes, ProcessesSequences) {
    bool stop = false;
    EXPECT_EQ(process_escape_sequences("a\\nb\\\\c", stop), "a\nb\\c");
    EXPECT_FALSE(stop);
    EXPECT_EQ(process_escape_sequences("\\0101", stop), "A");
    EXPECT_EQ(process_escape_sequences("keep\\cdrop", stop), "keep");
    EXPECT_TRUE(stop);
}

TEST_F(BuiltinTest, CdAndPwd) {
    TempDir dir;
    std::string original = std::filesystem::current_path().string();
    std::string target = std::filesystem::canonical(dir.path()).string();
    shell.set_env("DIR", target);

    auto result = run("cd \"$DIR\" && pwd && echo \"$PWD\"");
    EXPECT_EQ(result.status, 0);
    EXPECT_EQ(result.out, target + "\n" + target + "\n");
    EXPECT_EQ(shell.get_env("OLDPWD").value_or(""), original);

    auto back = run("cd -");
    EXPECT_EQ(back.out, original + "\n");

    auto missing = run("cd /esh/definitely/missing");
    EXPECT_EQ(missing.status, 1);
    EXPECT_FALSE(missing.err.empty());

    std::filesystem::current_path(original);
}

TEST_F(BuiltinTest, CdHome) {
    TempDir dir;
    std::string original = std::filesystem::current_path().string();
    std::string home = std::filesystem::canonical(dir.path()).string();
    shell.set_env("HOME", home);
    EXPECT_EQ(run("cd; pwd").out, home + "\n");
    std::filesystem::current_path(original);
}

TEST_F(BuiltinTest, ExitStatuses) {
    EXPECT_EQ(run("exit").status, 0);
    EXPECT_EQ(run("false; exit").status, 1);
    EXPECT_EQ(run("exit 300").status, 300 & 0xff);
    EXPECT_EQ(run("exit abc").status, 2);
}

TEST_F(BuiltinTest, SetPositionalParametersAndShift) {
    auto result = run("set -- a b c\necho $# $1\nshift\necho $# $1\nshift 2\necho $#");
    EXPECT_EQ(result.out, "3 a\n2 b\n0\n");
    EXPECT_EQ(run("shift 5").status, 1);
    EXPECT_EQ(run("shift x").status, 1);
}

TEST_F(BuiltinTest, SetOptions) {
    run("set -eu");
    EXPECT_TRUE(shell.options().errexit);
    EXPECT_TRUE(shell.options().nounset);
    run("set +e -o noclobber");
    EXPECT_FALSE(shell.options().errexit);
    EXPECT_TRUE(shell.options().noclobber);
    EXPECT_NE(run("set -o").out.find("noclobber"), std::string::npos);
    EXPECT_NE(run("set +o").out.find("set -o noclobber"), std::string::npos);
    EXPECT_EQ(run("set -o nosuchoption").status, 2);
}

TEST_F(BuiltinTest, SetListsVariables) {
    run("alpha='one two'");
    auto listing = run("set").out;
    EXPECT_NE(listing.find("alpha='one two'\n"), std::string::npos);
    EXPECT_EQ(listing.find("\n#="), std::string::npos);
}

TEST_F(BuiltinTest, ExportAndUnset) {
    auto exported = run("export ESH_BUILTIN_EXPORT=yes\nsh -c 'echo $ESH_BUILTIN_EXPORT'");
    EXPECT_EQ(exported.out, "yes\n");
    EXPECT_NE(run("export").out.find("export ESH_BUILTIN_EXPORT='yes'"), std::string::npos);

    run("unset ESH_BUILTIN_EXPORT");
    EXPECT_FALSE(shell.get_env("ESH_BUILTIN_EXPORT").has_value());
    EXPECT_EQ(run("export 1bad=x").status, 1);
}

TEST_F(BuiltinTest, UnsetFunctionsAndVariables) {
    run("f() { :; }\nv=1");
    EXPECT_EQ(run("unset -v v").status, 0);
    EXPECT_FALSE(shell.get_env("v").has_value());
    EXPECT_TRUE(shell.has_function("f"));
    run("unset -f f");
    EXPECT_FALSE(shell.has_function("f"));
}

TEST_F(BuiltinTest, DeclareKinds) {
    run("declare -a list\nlist[2]=c\ndeclare -A map\nmap[key]=value\ndeclare plain=p");
    EXPECT_EQ(shell.environment().kind_of("list"), VariableKind::ARRAY);
    EXPECT_EQ(shell.environment().kind_of("map"), VariableKind::ASSOC);
    EXPECT_EQ(shell.get_env("plain").value_or(""), "p");

    auto listing = run("declare -p").out;
    EXPECT_NE(listing.find("declare -a list=([0]='' [1]='' [2]='c')"), std::string::npos);
    EXPECT_NE(listing.find("declare -A map=([key]='value')"), std::string::npos);
    EXPECT_NE(listing.find("plain='p'"), std::string::npos);
}

TEST_F(BuiltinTest, TypesetIsDeclare) {
    run("typeset -a t=(x y)");
    EXPECT_EQ(run("echo ${t[1]}").out, "y\n");
}

TEST_F(BuiltinTest, DeclareExport) {
    EXPECT_EQ(run("declare -x ESH_DECLARED=1\nsh -c 'echo $ESH_DECLARED'").out, "1\n");
}

TEST_F(BuiltinTest, TestAndBracket) {
    EXPECT_EQ(run("test 3 -lt 5").status, 0);
    EXPECT_EQ(run("[ abc = abd ]").status, 1);
    EXPECT_EQ(run("[ -z '' ]").status, 0);
    EXPECT_EQ(run("[ ! -n '' ]").status, 0);
    EXPECT_EQ(run("[ 1 -eq 1 -a 2 -eq 3 ]").status, 1);
    EXPECT_EQ(run("[ 1 -eq 1 -o 2 -eq 3 ]").status, 0);
    EXPECT_EQ(run("[ \\( x = x \\) ]").status, 0);
    EXPECT_EQ(run("[ 1 -eq 1").status, 2);
    EXPECT_EQ(run("test a -lt 3").status, 2);
}

TEST_F(BuiltinTest, TestFilePredicates) {
    TempDir dir;
    shell.set_env("DIR", dir.path());
    EXPECT_EQ(run("[ -d \"$DIR\" ]").status, 0);
    EXPECT_EQ(run("[ -f \"$DIR\" ]").status, 1);
    EXPECT_EQ(run("echo x > \"$DIR/f\"; [ -s \"$DIR/f\" ] && [ -r \"$DIR/f\" ]").status, 0);
    EXPECT_EQ(run("[ -e \"$DIR/none\" ]").status, 1);
}

TEST(TestExpression, EvaluatesWithoutShell) {
    EXPECT_EQ(evaluate_test_expression({"abc"}, nullptr), 0);
    EXPECT_EQ(evaluate_test_expression({}, nullptr), 1);
    EXPECT_EQ(evaluate_test_expression({"5", "-gt", "2"}, nullptr), 0);
    EXPECT_EQ(evaluate_test_expression({"x", "-gt", "2"}, nullptr), 2);
}

TEST_F(BuiltinTest, EvalRunsInCurrentShell) {
    EXPECT_EQ(run("eval 'x=5; echo $x'\necho $x").out, "5\n5\n");
    EXPECT_EQ(run("eval").status, 0);
    EXPECT_EQ(run("cmd='echo built'; eval \"$cmd up\"").out, "built up\n");
}

TEST_F(BuiltinTest, BreakAndContinueCounts) {
    EXPECT_EQ(run("for i in 1 2; do for j in 1 2; do continue 2; echo no; done; echo no; done; "
                   "echo done")
                  .out,
              "done\n");
    EXPECT_EQ(run("for i in 1; do break 0; done").status, 1);
}

TEST_F(BuiltinTest, JobsListing) {
    auto result = run("sleep 0 &\nwait\njobs");
    EXPECT_EQ(result.status, 0);
    EXPECT_EQ(shell.job_manager().get_all_jobs().size(), 0u);

    auto running = run("sleep 1 &\njobs");
    EXPECT_NE(running.out.find("[2]+  Running"), std::string::npos);
    EXPECT_NE(running.out.find("sleep 1"), std::string::npos);
    EXPECT_EQ(run("jobs -p").out, shell.get_env("!").value_or("") + "\n");
    run("wait");
}

TEST_F(BuiltinTest, WaitAndFgStatuses) {
    EXPECT_EQ(run("sh -c 'exit 3' &\nwait %1").status, 3);
    EXPECT_EQ(run("wait %9").status, 127);
    EXPECT_EQ(run("fg %9").status, 1);
    EXPECT_EQ(run("sh -c 'exit 5' &\nfg").status, 5);
}

TEST_F(BuiltinTest, BgResumesStoppedJob) {
    EXPECT_EQ(run("bg").status, 1);
    EXPECT_EQ(run("bg %9").status, 1);

    const char* script =
        "sh -c 'kill -STOP $$; exit 4' &\n"
        "until grep -q stopped /proc/$!/status; do sleep 0.01; done\n"
        "bg\n"
        "wait %1";
    auto result = run(script);
    EXPECT_EQ(result.status, 4);
    EXPECT_NE(result.out.find("[1]+ "), std::string::npos);
    EXPECT_NE(result.out.find(" &\n"), std::string::npos);
}

TEST(JobSpecifiers, ResolveAgainstManager) {
    JobManager jobs;
    pid_t first = fork();
    if (first == 0) {
        _exit(0);
    }
    pid_t second = fork();
    if (second == 0) {
        _exit(0);
    }
    jobs.add_job({first}, "first");
    jobs.add_job({second}, "second");

    using job_control_helpers::parse_job_specifier;
    EXPECT_EQ(parse_job_specifier("%1", jobs).value_or(-1), 1);
    EXPECT_EQ(parse_job_specifier("%%", jobs).value_or(-1), 2);
    EXPECT_EQ(parse_job_specifier("%+", jobs).value_or(-1), 2);
    EXPECT_EQ(parse_job_specifier("%-", jobs).value_or(-1), 1);
    EXPECT_FALSE(parse_job_specifier("%7", jobs).has_value());
    EXPECT_FALSE(parse_job_specifier("%x", jobs).has_value());

    auto by_pid = job_control_helpers::resolve_job(std::to_string(second), jobs);
    ASSERT_NE(by_pid, nullptr);
    EXPECT_EQ(by_pid->id(), 2);
    jobs.wait_for_all();
}
