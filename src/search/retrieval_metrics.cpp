#include <sme/core/format.h>
#include <sme/search/retrieval_metrics.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>

namespace sme::search {

using json = nlohmann::json;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

int assessRelevance(const std::string& text, const std::vector<std::string>& keywords) {
    const auto haystack = toLower(text);
    size_t matches = 0;
    for (const auto& kw : keywords) {
        if (haystack.find(toLower(kw)) != std::string::npos) {
            ++matches;
        }
    }
    if (matches == 0) {
        return 0;
    }
    return matches == keywords.size() ? 2 : 1;
}

int hitAtK(const std::vector<int>& relevance, size_t k) {
    const size_t n = std::min(k, relevance.size());
    return std::any_of(relevance.begin(), relevance.begin() + static_cast<std::ptrdiff_t>(n),
                       [](int r) { return r > 0; })
               ? 1
               : 0;
}

double reciprocalRank(const std::vector<int>& relevance) {
    for (size_t i = 0; i < relevance.size(); ++i) {
        if (relevance[i] > 0) {
            return 1.0 / static_cast<double>(i + 1);
        }
    }
    return 0.0;
}

double dcgAtK(const std::vector<int>& relevance, size_t k) {
    const size_t n = std::min(k, relevance.size());
    double dcg = 0.0;
    for (size_t i = 0; i < n; ++i) {
        dcg += relevance[i] / std::log2(static_cast<double>(i) + 2.0);
    }
    return dcg;
}

double ndcgAtK(const std::vector<int>& relevance, size_t k) {
    auto ideal = relevance;
    std::sort(ideal.begin(), ideal.end(), std::greater<int>());
    const double idcg = dcgAtK(ideal, k);
    return idcg > 0.0 ? dcgAtK(relevance, k) / idcg : 0.0;
}

Result<EvaluationSummary> evaluateRetrieval(const HybridRetriever& retriever,
                                            const std::string& model,
                                            const std::vector<EvalQuery>& queries, size_t k) {
    EvaluationSummary summary;
    summary.model = model;
    summary.k = k;

    for (const auto& q : queries) {
        auto passages = retriever.searchAndRerank(q.query, model);
        if (!passages) {
            return Error{passages.error().code,
                         sme::format("Query '{}' failed: {}", q.query, passages.error().message)};
        }

        QueryEvaluation eval;
        eval.query = q.query;
        for (const auto& p : passages.value()) {
            eval.relevance.push_back(assessRelevance(p.text, q.expected_keywords));
        }
        eval.hit = hitAtK(eval.relevance, k);
        eval.reciprocal_rank = reciprocalRank(eval.relevance);
        eval.ndcg = ndcgAtK(eval.relevance, k);
        spdlog::info("[{}] '{}': hit@{}={} mrr={:.3f} ndcg@{}={:.3f}", model, q.query, k,
                     eval.hit, eval.reciprocal_rank, k, eval.ndcg);
        summary.queries.push_back(std::move(eval));
    }

    if (!summary.queries.empty()) {
        const auto n = static_cast<double>(summary.queries.size());
        for (const auto& e : summary.queries) {
            summary.hit_rate += e.hit;
            summary.mrr += e.reciprocal_rank;
            summary.ndcg += e.ndcg;
        }
        summary.hit_rate /= n;
        summary.mrr /= n;
        summary.ndcg /= n;
    }
    return summary;
}

Result<std::vector<EvalQuery>> loadEvalQueries(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound,
                     sme::format("Cannot open evaluation queries {}", path.string())};
    }
    try {
        auto j = json::parse(in);
        if (!j.is_array()) {
            return Error{ErrorCode::InvalidData, "Evaluation file must hold a JSON array"};
        }
        std::vector<EvalQuery> queries;
        for (const auto& item : j) {
            EvalQuery q;
            q.query = item.at("query").get<std::string>();
            q.expected_keywords = item.at("expected_keywords").get<std::vector<std::string>>();
            queries.push_back(std::move(q));
        }
        return queries;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     sme::format("Malformed evaluation file {}: {}", path.string(), e.what())};
    }
}

std::vector<EvalQuery> defaultEvalQueries() {
    return {
        {"What is bauxite used for?", {"aluminum", "alumina"}},
        {"Environmental impact of strip mining",
         {"habitat", "destruction", "erosion", "pollution", "soil"}},
        {"What are rare earth elements?",
         {"lanthanides", "scandium", "yttrium", "magnets", "electronics"}},
        {"Process of hydraulic fracturing", {"fracking", "shale", "gas", "oil", "water", "pressure"}},
        {"What is geothermal energy?", {"heat", "earth", "steam", "turbine", "magma"}},
    };
}

} // namespace sme::search
