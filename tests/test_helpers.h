/**
 * @file test_helpers.h
 * @brief Fakes and synthetic images shared by the lensix test suites
 */

#pragma once

#include "../src/CaptureChain.h"
#include "../src/Config.h"
#include "../src/Consensus.h"
#include "../src/FrameProcessor.h"
#include "../src/MaskCrop.h"
#include "../src/OcrEngine.h"
#include "../src/Pipeline.h"
#include "../src/RegionPath.h"
#include "../src/Router.h"

#include <QFile>
#include <QString>
#include <QStringList>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <map>
#include <string>
#include <vector>

/**
 * @brief BGR image with a uniform background and dark text drawn on it
 */
inline cv::Mat makeTextImage(int w, int h, uchar bg, uchar fg, const std::string& text)
{
    cv::Mat img(h, w, CV_8UC3, cv::Scalar(bg, bg, bg));
    if (!text.empty())
    {
        cv::putText(img, text, {w / 8, h / 2 + 10}, cv::FONT_HERSHEY_SIMPLEX, 1.0,
                    cv::Scalar(fg, fg, fg), 2);
    }
    return img;
}

inline CaptureToolSpec makeTool(const QString& program, ToolRequirement req = ToolRequirement::Any)
{
    CaptureToolSpec spec{program, program, {QStringLiteral("{out}")}};
    spec.requirement = req;
    return spec;
}

/**
 * @brief CaptureRunner whose per-program outcome is scripted
 *
 * Succeeded writes a PNG unless the program is listed in @c garbage (writes
 * undecodable bytes) or @c silent (writes nothing).
 */
class FakeCaptureRunner : public CaptureRunner
{
public:
    std::map<QString, AttemptStatus> behaviour;
    QStringList garbage;
    QStringList silent;
    QStringList calls;
    cv::Mat image = makeTextImage(320, 200, 230, 20, "lensix");

    AttemptStatus attempt(const CaptureToolSpec& spec, const QString& outputPath, int, QString& detail) override
    {
        calls << spec.program;
        const auto it = behaviour.find(spec.program);
        const AttemptStatus status = it == behaviour.end() ? AttemptStatus::Missing : it->second;
        if (status != AttemptStatus::Succeeded)
        {
            detail = QStringLiteral("scripted");
            return status;
        }
        if (garbage.contains(spec.program))
        {
            QFile f(outputPath);
            if (f.open(QIODevice::WriteOnly))
            {
                f.write("definitely not a png");
            }
        }
        else if (!silent.contains(spec.program))
        {
            cv::imwrite(outputPath.toStdString(), image);
        }
        return status;
    }
};

/**
 * @brief TextRecognizer answering the n-th call with script[n] (empty past the end)
 */
class ScriptedRecognizer : public TextRecognizer
{
public:
    std::vector<std::vector<WordObservation>> script;
    std::vector<int> throwOnCall;
    int calls = 0;

    std::vector<WordObservation> recognize(const cv::Mat&) override
    {
        const int n = calls++;
        for (int t : throwOnCall)
        {
            if (t == n)
            {
                throw OcrError("scripted failure");
            }
        }
        if (n < static_cast<int>(script.size()))
        {
            return script[static_cast<size_t>(n)];
        }
        return {};
    }
};

inline CandidateImage makeCandidate(StrategyId id)
{
    return {id, cv::Mat(8, 8, CV_8UC1, cv::Scalar(255))};
}
