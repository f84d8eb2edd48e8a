/**
 * @file compare_embeddings.cpp
 * @brief Compare two stored embeddings given as JSON array files
 *
 * Prints cosine, Euclidean and Manhattan similarities and the match
 * decision at the configured threshold (SIMILARITY_THRESHOLD, default 0.6).
 */

#include <FaceGate/FaceGate.h>

#include <iomanip>
#include <iostream>
#include <string>

using namespace FaceGate;

Match::Embedding LoadEmbedding(const std::string& path) {
    ByteBuffer bytes = IO::ReadFileBytes(path);
    return Match::ParseStoredEmbedding(std::string(bytes.begin(), bytes.end()));
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <embedding_a.json> <embedding_b.json> [metric]"
                  << std::endl;
        return 1;
    }

    try {
        Match::MatchParams params = Match::MatchParams::FromEnvironment();
        if (argc > 3) {
            params.SetMetric(Match::ParseMetric(argv[3]));
        }

        Match::Embedding a = LoadEmbedding(argv[1]);
        Match::Embedding b = LoadEmbedding(argv[2]);

        Match::SimilarityReport report = Match::AllSimilarities(a, b);
        Match::MatchResult result = Match::Compare(a, b, params);

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Dimension: " << a.size() << "\n";
        std::cout << "Cosine:    " << report.cosine << "\n";
        std::cout << "Euclidean: " << report.euclidean.similarity
                  << " (distance " << report.euclidean.distance << ")\n";
        std::cout << "Manhattan: " << report.manhattan.similarity
                  << " (distance " << report.manhattan.distance << ")\n";
        std::cout << "\n" << Match::MetricName(result.metric) << " similarity "
                  << result.similarity << " vs threshold " << std::setprecision(2)
                  << result.threshold << ": " << (result.isMatch ? "MATCH" : "NO MATCH")
                  << std::endl;
        return result.isMatch ? 0 : 3;
    } catch (const Exception& e) {
        std::cerr << "Error [" << e.KindName() << "]: " << e.what() << std::endl;
        return 1;
    }
}
