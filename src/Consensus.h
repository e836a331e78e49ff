// Consensus.h
#pragma once
#include <QString>
#include <string>
#include <utility>
#include <vector>
#include "Config.h"
#include "FrameProcessor.h"
#include "OcrEngine.h"

struct StrategyResult {
    StrategyId id{ StrategyId::AdaptiveThreshold };
    std::string joinedText;
    double averageConfidence{ 0.0 };
    int acceptedWords{ 0 };
    bool failed{ false };   // recognizer threw on this candidate
};

struct ConsensusResult {
    StrategyResult best;                    // empty text, 0 confidence when nothing was accepted
    std::vector<StrategyResult> perStrategy;

    bool empty() const { return best.acceptedWords == 0; }
    const std::string& text() const { return best.joinedText; }
    double confidence() const { return best.averageConfidence; }
};

// Words at or below the floor are noise; the rest are joined with single spaces.
StrategyResult scoreObservations(StrategyId id, const std::vector<WordObservation>& words, int wordFloor);

class ConsensusExtractor {
public:
    ConsensusExtractor(TextRecognizer& recognizer, OcrSettings settings)
        : recognizer_(recognizer), settings_(std::move(settings)) {}

    // artifactDir: where candidates are dumped when saveCandidates is set.
    // Dumped files are gone again when this returns.
    ConsensusResult extract(const std::vector<CandidateImage>& candidates,
                            const QString& artifactDir = QString());

private:
    TextRecognizer& recognizer_;
    OcrSettings settings_;
};
