// Consensus.cpp
#include "Consensus.h"
#include "Logging.h"
#include <QDir>
#include <QFile>
#include <QStringList>
#include <opencv2/imgcodecs.hpp>
#include <cctype>

namespace {

std::string trimmed(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Removes the candidate dumps on scope exit.
class ScopedArtifacts {
public:
    ~ScopedArtifacts() {
        for (const QString& f : files_)
            if (!QFile::remove(f)) qCWarning(lcOcr) << "could not remove" << f;
    }
    void write(const QString& dir, const CandidateImage& c) {
        const QString path = QDir(dir).filePath(QStringLiteral("candidate-%1.png").arg(strategyName(c.id)));
        try {
            if (cv::imwrite(path.toStdString(), c.gray)) files_ << path;
        }
        catch (const cv::Exception& e) {
            qCWarning(lcOcr) << "cannot dump" << path << ":" << e.what();
        }
    }

private:
    QStringList files_;
};

} // namespace

StrategyResult scoreObservations(StrategyId id, const std::vector<WordObservation>& words, int wordFloor) {
    StrategyResult r;
    r.id = id;
    long sum = 0;
    for (const auto& w : words) {
        if (w.confidence <= wordFloor) continue;
        const std::string token = trimmed(w.text);
        if (token.empty()) continue;
        if (!r.joinedText.empty()) r.joinedText += ' ';
        r.joinedText += token;
        sum += w.confidence;
        ++r.acceptedWords;
    }
    r.averageConfidence = r.acceptedWords ? static_cast<double>(sum) / r.acceptedWords : 0.0;
    return r;
}

ConsensusResult ConsensusExtractor::extract(const std::vector<CandidateImage>& candidates,
                                            const QString& artifactDir) {
    ConsensusResult out;
    ScopedArtifacts artifacts;
    const bool dump = settings_.saveCandidates && !artifactDir.isEmpty();

    for (const auto& c : candidates) {
        if (dump) artifacts.write(artifactDir, c);

        StrategyResult r;
        try {
            r = scoreObservations(c.id, recognizer_.recognize(c.gray), settings_.wordFloor);
        }
        catch (const OcrError& e) {
            qCWarning(lcOcr) << strategyName(c.id) << "recognition failed:" << e.what();
            r.id = c.id;
            r.failed = true;
        }
        catch (const cv::Exception& e) {
            qCWarning(lcOcr) << strategyName(c.id) << "recognition failed:" << e.what();
            r.id = c.id;
            r.failed = true;
        }

        qCDebug(lcOcr).nospace() << strategyName(c.id) << ": " << r.acceptedWords << " words, avg "
                                 << r.averageConfidence << " \"" << r.joinedText.c_str() << "\"";

        // strict '>' keeps the earlier strategy on ties
        if (r.acceptedWords > 0 && (out.empty() || r.averageConfidence > out.best.averageConfidence))
            out.best = r;
        out.perStrategy.push_back(std::move(r));
    }

    if (out.empty()) qCInfo(lcOcr) << "no usable text in" << candidates.size() << "candidates";
    else qCInfo(lcOcr) << "best:" << strategyName(out.best.id) << "confidence" << out.best.averageConfidence;
    return out;
}
