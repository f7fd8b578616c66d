/**
 * @file test_command_generator.cpp
 * @brief CommandResponseGenerator 외부 프로세스 경로
 */

#include <gtest/gtest.h>

#include "generator/CommandResponseGenerator.hpp"

namespace {

PolicyDescriptor promptOf(const QString& prompt)
{
    PolicyDescriptor p;
    p.level = 2;
    p.intent = States::Intent::OrderToLeave;
    p.prompt = prompt;
    return p;
}

GeneratorConfig cmd(const QString& program, const QStringList& args = {}, int timeoutMs = 5000)
{
    GeneratorConfig g;
    g.command = program;
    g.args = args;
    g.timeoutMs = timeoutMs;
    return g;
}

} // namespace

TEST(CommandResponseGeneratorTest, PromptGoesToStdinAndReplyComesFromStdout)
{
    CommandResponseGenerator gen(cmd("/bin/cat"));
    const QString reply = gen.generate(promptOf("Leave the area.\n"), "hello");
    EXPECT_EQ(reply, "Leave the area.");            // 앞뒤 공백 제거
    EXPECT_TRUE(gen.lastError().isEmpty());
}

TEST(CommandResponseGeneratorTest, NonZeroExitIsFailure)
{
    CommandResponseGenerator gen(cmd("/bin/sh", {"-c", "echo partial; echo boom >&2; exit 3"}));
    EXPECT_TRUE(gen.generate(promptOf("x"), "x").isEmpty());
    EXPECT_TRUE(gen.lastError().contains("exit code 3"));
    EXPECT_TRUE(gen.lastError().contains("boom"));
}

TEST(CommandResponseGeneratorTest, MissingProgramIsFailure)
{
    CommandResponseGenerator gen(cmd("/nonexistent/trustguard-llm"));
    EXPECT_TRUE(gen.generate(promptOf("x"), "x").isEmpty());
    EXPECT_TRUE(gen.lastError().startsWith("start failed"));
}

TEST(CommandResponseGeneratorTest, SlowProgramIsKilledOnTimeout)
{
    CommandResponseGenerator gen(cmd("/bin/sh", {"-c", "sleep 5"}, 200));
    EXPECT_TRUE(gen.generate(promptOf("x"), "x").isEmpty());
    EXPECT_TRUE(gen.lastError().startsWith("timeout"));
}

TEST(CommandResponseGeneratorTest, ErrorIsClearedOnNextSuccess)
{
    CommandResponseGenerator bad(cmd("/bin/sh", {"-c", "exit 1"}));
    bad.generate(promptOf("x"), "x");
    ASSERT_FALSE(bad.lastError().isEmpty());

    CommandResponseGenerator ok(cmd("/bin/cat"));
    EXPECT_EQ(ok.generate(promptOf("fine"), "x"), "fine");
    EXPECT_TRUE(ok.lastError().isEmpty());
}
