/**
 * @file test_capture.cpp
 * @brief Tool catalogue filtering and the fault-tolerant capture chain
 */

#include "test_helpers.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QTemporaryDir>

#include <algorithm>

namespace
{

QStringList programs(const std::vector<CaptureToolSpec>& tools)
{
    QStringList out;
    for (const auto& t : tools)
    {
        out << t.program;
    }
    return out;
}

EnvironmentProfile profile(DisplayServer ds, const QString& hint = QString())
{
    EnvironmentProfile p;
    p.displayServer = ds;
    p.compositorHint = hint;
    return p;
}

} // namespace

class ToolSelectionTest : public ::testing::Test
{
};

TEST_F(ToolSelectionTest, CatalogueIsOrderedByTier)
{
    const auto& cat = captureCatalogue();
    ASSERT_FALSE(cat.empty());
    EXPECT_TRUE(std::is_sorted(cat.begin(), cat.end(),
                               [](const CaptureToolSpec& a, const CaptureToolSpec& b) { return a.tier < b.tier; }));
    EXPECT_EQ(cat.front().tier, ToolTier::Portal);
    EXPECT_EQ(cat.back().tier, ToolTier::LegacyX11);
}

TEST_F(ToolSelectionTest, WaylandDropsX11Tools)
{
    const QStringList p = programs(selectTools(profile(DisplayServer::Wayland, QStringLiteral("sway"))));

    EXPECT_EQ(p, (QStringList{QStringLiteral("flameshot"), QStringLiteral("grim")}));
}

TEST_F(ToolSelectionTest, X11KeepsLegacyToolsLast)
{
    const QStringList p = programs(selectTools(profile(DisplayServer::X11, QStringLiteral("xfce"))));

    EXPECT_EQ(p, (QStringList{QStringLiteral("flameshot"), QStringLiteral("maim"), QStringLiteral("scrot"),
                              QStringLiteral("import")}));
}

TEST_F(ToolSelectionTest, DesktopToolOnlyOnItsDesktop)
{
    const QStringList gnome = programs(selectTools(profile(DisplayServer::Wayland, QStringLiteral("ubuntu:gnome"))));
    EXPECT_TRUE(gnome.contains(QStringLiteral("gnome-screenshot")));
    EXPECT_FALSE(gnome.contains(QStringLiteral("spectacle")));
    EXPECT_LT(gnome.indexOf(QStringLiteral("gnome-screenshot")), gnome.indexOf(QStringLiteral("grim")));

    const QStringList kde = programs(selectTools(profile(DisplayServer::Wayland, QStringLiteral("kde"))));
    EXPECT_TRUE(kde.contains(QStringLiteral("spectacle")));
    EXPECT_FALSE(kde.contains(QStringLiteral("gnome-screenshot")));
}

TEST_F(ToolSelectionTest, UnknownDesktopTriesEverythingForTheServer)
{
    const QStringList p = programs(selectTools(profile(DisplayServer::X11)));

    EXPECT_TRUE(p.contains(QStringLiteral("gnome-screenshot")));
    EXPECT_TRUE(p.contains(QStringLiteral("spectacle")));
    EXPECT_FALSE(p.contains(QStringLiteral("grim")));
}

TEST_F(ToolSelectionTest, OutputPlaceholderIsSubstituted)
{
    const CaptureToolSpec& flameshot = captureCatalogue().front();
    const QStringList args = flameshot.argumentsFor(QStringLiteral("/tmp/x.png"));

    EXPECT_TRUE(args.contains(QStringLiteral("/tmp/x.png")));
    EXPECT_FALSE(args.contains(QStringLiteral("{out}")));
}

class CaptureChainTest : public ::testing::Test
{
protected:
    QTemporaryDir dir;
    FakeCaptureRunner runner;
};

TEST_F(CaptureChainTest, FallsThroughMissingToolToWorkingOne)
{
    runner.behaviour[QStringLiteral("toolB")] = AttemptStatus::Succeeded;
    CaptureChain chain(runner);

    const CaptureResult r = chain.capture({makeTool(QStringLiteral("toolA")), makeTool(QStringLiteral("toolB"))},
                                          dir.path());

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.image.provenance, QStringLiteral("toolB"));
    EXPECT_EQ(r.image.bgr.cols, 320);
    EXPECT_EQ(runner.calls, (QStringList{QStringLiteral("toolA"), QStringLiteral("toolB")}));
    ASSERT_EQ(r.attempts.size(), 2u);
    EXPECT_EQ(r.attempts[0].status, AttemptStatus::Missing);
    EXPECT_EQ(r.attempts[1].status, AttemptStatus::Succeeded);
}

TEST_F(CaptureChainTest, StopsAtFirstSuccess)
{
    runner.behaviour[QStringLiteral("a")] = AttemptStatus::Succeeded;
    runner.behaviour[QStringLiteral("b")] = AttemptStatus::Succeeded;
    CaptureChain chain(runner);

    const CaptureResult r = chain.capture({makeTool(QStringLiteral("a")), makeTool(QStringLiteral("b"))}, dir.path());

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(runner.calls, QStringList{QStringLiteral("a")});
}

TEST_F(CaptureChainTest, EmptyAndUndecodableOutputAreRejected)
{
    runner.behaviour[QStringLiteral("silent")] = AttemptStatus::Succeeded;
    runner.behaviour[QStringLiteral("junk")] = AttemptStatus::Succeeded;
    runner.behaviour[QStringLiteral("good")] = AttemptStatus::Succeeded;
    runner.silent << QStringLiteral("silent");
    runner.garbage << QStringLiteral("junk");
    CaptureChain chain(runner);

    const CaptureResult r = chain.capture(
        {makeTool(QStringLiteral("silent")), makeTool(QStringLiteral("junk")), makeTool(QStringLiteral("good"))},
        dir.path());

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.image.provenance, QStringLiteral("good"));
    EXPECT_EQ(r.attempts[0].status, AttemptStatus::EmptyOutput);
    EXPECT_EQ(r.attempts[1].status, AttemptStatus::Undecodable);
}

TEST_F(CaptureChainTest, ExhaustionReportsEveryTool)
{
    runner.behaviour[QStringLiteral("crashy")] = AttemptStatus::Failed;
    runner.behaviour[QStringLiteral("slow")] = AttemptStatus::TimedOut;
    CaptureChain chain(runner);

    auto missing = makeTool(QStringLiteral("absent"));
    missing.installHint = QStringLiteral("install the 'absent' package");
    const CaptureResult r = chain.capture({makeTool(QStringLiteral("crashy")), makeTool(QStringLiteral("slow")), missing},
                                          dir.path());

    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.image.empty());
    ASSERT_EQ(r.attempts.size(), 3u);
    const QString report = r.failureReport();
    EXPECT_TRUE(report.contains(QStringLiteral("crashy: failed")));
    EXPECT_TRUE(report.contains(QStringLiteral("slow: timed out")));
    EXPECT_TRUE(report.contains(QStringLiteral("install the 'absent' package")));
}

TEST_F(CaptureChainTest, EachAttemptGetsItsOwnFile)
{
    runner.behaviour[QStringLiteral("a")] = AttemptStatus::Succeeded;
    runner.silent << QStringLiteral("a");
    runner.behaviour[QStringLiteral("b")] = AttemptStatus::Succeeded;
    CaptureChain chain(runner);

    const CaptureResult r = chain.capture({makeTool(QStringLiteral("a")), makeTool(QStringLiteral("b"))}, dir.path());

    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.image.filePath.startsWith(dir.path()));
    EXPECT_TRUE(QFileInfo(r.image.filePath).fileName().contains(QStringLiteral("-b")));
}

TEST_F(CaptureChainTest, NoCandidatesIsAFailure)
{
    CaptureChain chain(runner);
    const CaptureResult r = chain.capture(std::vector<CaptureToolSpec>{}, dir.path());

    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(runner.calls.isEmpty());
    EXPECT_FALSE(r.failureReport().isEmpty());
}

class ProcessRunnerTest : public ::testing::Test
{
protected:
    QTemporaryDir dir;
    ProcessCaptureRunner runner;
    QString detail;
};

TEST_F(ProcessRunnerTest, MissingExecutable)
{
    const auto spec = makeTool(QStringLiteral("lensix-no-such-capture-tool"));
    EXPECT_EQ(runner.attempt(spec, dir.filePath(QStringLiteral("x.png")), 1000, detail), AttemptStatus::Missing);
}

TEST_F(ProcessRunnerTest, NonZeroExitIsFailure)
{
    CaptureToolSpec spec = makeTool(QStringLiteral("sh"));
    spec.arguments = {QStringLiteral("-c"), QStringLiteral("exit 3")};

    EXPECT_EQ(runner.attempt(spec, dir.filePath(QStringLiteral("x.png")), 5000, detail), AttemptStatus::Failed);
    EXPECT_TRUE(detail.contains(QStringLiteral("3")));
}

TEST_F(ProcessRunnerTest, HangingToolIsKilled)
{
    CaptureToolSpec spec = makeTool(QStringLiteral("sh"));
    spec.arguments = {QStringLiteral("-c"), QStringLiteral("sleep 10")};

    EXPECT_EQ(runner.attempt(spec, dir.filePath(QStringLiteral("x.png")), 200, detail), AttemptStatus::TimedOut);
}

TEST_F(ProcessRunnerTest, TimeoutBoundsTheWholeAttempt)
{
    CaptureToolSpec spec = makeTool(QStringLiteral("sh"));
    spec.arguments = {QStringLiteral("-c"), QStringLiteral("sleep 10")};

    QElapsedTimer clock;
    clock.start();
    EXPECT_EQ(runner.attempt(spec, dir.filePath(QStringLiteral("x.png")), 400, detail), AttemptStatus::TimedOut);
    // start and run share one budget
    EXPECT_LT(clock.elapsed(), 800);
    EXPECT_TRUE(detail.contains(QStringLiteral("400")));
}

TEST_F(ProcessRunnerTest, LoadImageFileReportsMissingFile)
{
    const CaptureResult r = loadImageFile(dir.filePath(QStringLiteral("nope.png")));
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.attempts.size(), 1u);
    EXPECT_EQ(r.attempts[0].status, AttemptStatus::Missing);
}
