// CLI tests
//
// Argument parsing for `wolf compile` and the command dispatcher.

#include "cli/driver.hpp"
#include "commands/cmd_compile.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;
using namespace wolf;
using namespace wolf::cli;

class CliTest : public ::testing::Test {
protected:
    fs::path temp_dir_;

    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() /
                    ("wolf_cli_test_" +
                     std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(temp_dir_);
        reset_globals();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        reset_globals();
        log::Logger::init(log::LogConfig{});
    }

    static void reset_globals() {
        CompilerOptions::verbose = false;
        CompilerOptions::optimization_level = 0;
        CompilerOptions::target_triple.clear();
    }

    auto write_source(const std::string& name, const std::string& code) -> fs::path {
        auto path = temp_dir_ / name;
        std::ofstream out(path);
        out << code;
        return path;
    }

    /// Writes an executable shell script standing in for `cc`.
    auto write_script(const std::string& name, const std::string& body) -> fs::path {
        auto path = temp_dir_ / name;
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
        out.close();
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path;
    }

    /// Runs wolf_main and returns {exit code, stdout, stderr}.
    static auto run(std::vector<std::string> args) -> std::tuple<int, std::string, std::string> {
        args.insert(args.begin(), "wolf");
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        int code = wolf_main(static_cast<int>(args.size()), argv.data());
        std::string out = testing::internal::GetCapturedStdout();
        std::string err = testing::internal::GetCapturedStderr();
        return {code, out, err};
    }
};

// ============================================================================
// Compile Arguments
// ============================================================================

TEST_F(CliTest, SourceOnly) {
    auto parsed = parse_compile_args({"prog.wolf"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->source, "prog.wolf");
    EXPECT_FALSE(parsed->options.output_path.has_value());
    EXPECT_EQ(parsed->options.linker, nullptr);
    EXPECT_EQ(parsed->options.codegen.optimization_level, 0);
}

TEST_F(CliTest, AllOptions) {
    auto parsed = parse_compile_args({"-O2", "prog.wolf", "-o", "out/prog", "--linker=clang",
                                      "--link-timeout=30", "--target=x86_64-unknown-linux-gnu",
                                      "-vv"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->source, "prog.wolf");
    ASSERT_TRUE(parsed->options.output_path.has_value());
    EXPECT_EQ(*parsed->options.output_path, fs::path("out/prog"));
    EXPECT_EQ(parsed->options.link_options.program, "clang");
    EXPECT_EQ(parsed->options.link_options.timeout_seconds, 30);
    EXPECT_EQ(parsed->options.codegen.optimization_level, 2);
    EXPECT_EQ(parsed->options.codegen.target_triple, "x86_64-unknown-linux-gnu");
}

TEST_F(CliTest, ParsingLeavesGlobalsUntouched) {
    auto first = parse_compile_args({"-O3", "--target=aarch64-unknown-linux-gnu", "a.wolf"});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(CompilerOptions::optimization_level, 0);
    EXPECT_TRUE(CompilerOptions::target_triple.empty());

    auto second = parse_compile_args({"b.wolf"});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->options.codegen.optimization_level, 0);
    EXPECT_TRUE(second->options.codegen.target_triple.empty());
}

TEST_F(CliTest, MissingSource) {
    testing::internal::CaptureStderr();
    auto parsed = parse_compile_args({"-O1"});
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_FALSE(parsed.has_value());
    EXPECT_EQ(err, "Error: The compile command requires a source path.\n");
}

TEST_F(CliTest, RejectsBadArguments) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse_compile_args({"a.wolf", "b.wolf"}).has_value());
    EXPECT_FALSE(parse_compile_args({"a.wolf", "--frobnicate"}).has_value());
    EXPECT_FALSE(parse_compile_args({"a.wolf", "-o"}).has_value());
    EXPECT_FALSE(parse_compile_args({"a.wolf", "--link-timeout=soon"}).has_value());
    EXPECT_FALSE(parse_compile_args({"a.wolf", "-O7"}).has_value());
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Error: Unexpected argument: b.wolf"), std::string::npos);
    EXPECT_NE(err.find("Error: Unknown option: --frobnicate"), std::string::npos);
    EXPECT_NE(err.find("Error: Invalid link timeout: soon"), std::string::npos);
}

// ============================================================================
// Dispatcher
// ============================================================================

TEST_F(CliTest, Version) {
    auto [code, out, err] = run({"version"});
    EXPECT_EQ(code, 0);
    EXPECT_EQ(out, "wolf version 0.1.0\n");

    auto [code2, out2, err2] = run({"--version"});
    EXPECT_EQ(code2, 0);
    EXPECT_EQ(out2, out);
}

TEST_F(CliTest, UsageWithoutArguments) {
    auto [code, out, err] = run({});
    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("Usage: wolf <command> [options]"), std::string::npos);
}

TEST_F(CliTest, UnknownCommand) {
    auto [code, out, err] = run({"frobnicate"});
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "Error: Unknown command: frobnicate\n");
}

TEST_F(CliTest, CompileReportsParseError) {
    auto source = write_source("bad.wolf", "let x 5;");
    auto [code, out, err] = run({"compile", source.string()});
    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err, "Error: Compilation failed: Parse failed: Expected '=' after variable name "
                   "'x', found integer '5' at line 1, column 7\n");
}

TEST_F(CliTest, CompileReportsMissingFile) {
    auto [code, out, err] = run({"compile", (temp_dir_ / "absent.wolf").string()});
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err.rfind("Error: Compilation failed: Failed to read file: ", 0), 0u) << err;
}

TEST_F(CliTest, CompileReportsLinkFailure) {
    auto source = write_source("prog.wolf", "1;");
    auto [code, out, err] = run({"compile", source.string(), "--linker=false"});
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "Error: Compilation failed: Linking failed: Linker failed with status 1\n");
    EXPECT_TRUE(fs::exists(temp_dir_ / "prog.o"));
}

TEST_F(CliTest, CompileReportsMultiLineLinkerOutputOnOneLine) {
    auto source = write_source("prog.wolf", "1;");
    auto linker = write_script("fake-cc", "echo 'ld: first problem' >&2\n"
                                          "echo 'collect2: error: ld returned 1' >&2\n"
                                          "exit 1\n");
    auto [code, out, err] = run({"compile", source.string(), "--linker=" + linker.string()});
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "Error: Compilation failed: Linking failed: Linker failed with status 1: "
                   "ld: first problem; collect2: error: ld returned 1\n");
    EXPECT_EQ(std::count(err.begin(), err.end(), '\n'), 1);
}

TEST_F(CliTest, CompileSuccessMessage) {
    auto source = write_source("prog.wolf", "let x = 2 + 3; x;");
    auto exe = temp_dir_ / "five";
    auto [code, out, err] = run({"compile", source.string(), "-o", exe.string(), "--linker=true"});
    EXPECT_EQ(code, 0) << err;
    EXPECT_EQ(out, "Executable written to " + exe.string() + "\n");
}

TEST_F(CliTest, LexCommand) {
    auto source = write_source("lex.wolf", "let x = 5;");
    auto [code, out, err] = run({"lex", source.string()});
    EXPECT_EQ(code, 0) << err;
    EXPECT_EQ(out, "1:1 KwLet\n"
                   "1:5 Identifier `x`\n"
                   "1:7 Assign\n"
                   "1:9 IntLiteral `5`\n"
                   "1:10 Semi\n"
                   "1:11 Eof\n");
}

TEST_F(CliTest, ParseCommand) {
    auto source = write_source("parse.wolf", "1 + 2;");
    auto [code, out, err] = run({"parse", source.string()});
    EXPECT_EQ(code, 0) << err;
    EXPECT_EQ(out, "Program\n"
                   "  ExpressionStatement\n"
                   "    BinaryOperation(Add)\n"
                   "      NumberLiteral(1)\n"
                   "      NumberLiteral(2)\n");
}

TEST_F(CliTest, IrCommand) {
    auto source = write_source("ir.wolf", "let x = 2; x;");
    auto [code, out, err] = run({"ir", source.string()});
    EXPECT_EQ(code, 0) << err;
    EXPECT_EQ(out.rfind("function main() -> i64 {\n", 0), 0u) << out;
    EXPECT_NE(out.find("define i64 @main()"), std::string::npos) << out;
}

TEST_F(CliTest, IrCommandReportsUndefinedVariable) {
    auto source = write_source("ir.wolf", "y;");
    auto [code, out, err] = run({"ir", source.string()});
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "Error: Undefined variable: y\n");
}

TEST_F(CliTest, DebugCommandRequiresPath) {
    auto [code, out, err] = run({"parse", "-v"});
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "Error: The parse command requires a source path.\n");
}
