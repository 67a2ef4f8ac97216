#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "src/core/launchcommand.h"

TEST(LaunchCommand, NativeInvocationPassesTargetOnly) {
    RuntimeConfig runtime;
    const LaunchRequest req = LaunchCommand::build("/games/Foo/foo.exe", runtime, false);

    EXPECT_EQ(req.program, QStringLiteral("wine"));
    EXPECT_EQ(req.arguments, QStringList{QStringLiteral("/games/Foo/foo.exe")});
    EXPECT_EQ(req.workingDirectory, QStringLiteral("/games/Foo"));
    EXPECT_EQ(req.targetPath, QStringLiteral("/games/Foo/foo.exe"));
}

TEST(LaunchCommand, SandboxedInvocationWrapsWineInHostSpawn) {
    RuntimeConfig runtime;
    const LaunchRequest req = LaunchCommand::build("/home/u/setup.exe", runtime, true);

    EXPECT_EQ(req.program, QStringLiteral("flatpak-spawn"));
    EXPECT_EQ(req.arguments, (QStringList{"--host", "wine", "/home/u/setup.exe"}));
    EXPECT_EQ(req.workingDirectory, QStringLiteral("/home/u"));
}

TEST(LaunchCommand, DescribeQuotesArgumentsWithSpaces) {
    RuntimeConfig runtime;
    const LaunchRequest req = LaunchCommand::build("/games/My Game/run.exe", runtime, false);

    EXPECT_EQ(LaunchCommand::describe(req), QStringLiteral("wine \"/games/My Game/run.exe\""));
}

TEST(LaunchCommand, ResolvesAbsoluteExecutable) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("wine");
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("#!/bin/sh\n");
    f.close();

    RuntimeConfig runtime;
    runtime.wineCommand = path;
    EXPECT_TRUE(LaunchCommand::findRuntime(runtime).isEmpty()); // not executable yet

    ASSERT_TRUE(f.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner));
    EXPECT_EQ(LaunchCommand::findRuntime(runtime), QDir::cleanPath(path));
}

TEST(LaunchCommand, MissingRuntimeResolvesToEmpty) {
    RuntimeConfig runtime;
    runtime.wineCommand = QStringLiteral("wui-no-such-wine-binary");
    EXPECT_TRUE(LaunchCommand::findRuntime(runtime).isEmpty());

    runtime.wineCommand = QStringLiteral("/nonexistent/bin/wine");
    EXPECT_TRUE(LaunchCommand::findRuntime(runtime).isEmpty());

    EXPECT_TRUE(LaunchCommand::resolveProgram(QStringLiteral("  ")).isEmpty());
}

TEST(LaunchCommand, ResolvesProgramsOnPath) {
    // /bin/sh is present on every host the tests run on.
    EXPECT_FALSE(LaunchCommand::resolveProgram(QStringLiteral("sh")).isEmpty());
}
