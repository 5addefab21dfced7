#pragma once

#include <sme/core/types.h>
#include <sme/search/hybrid_retriever.h>

#include <filesystem>
#include <string>
#include <vector>

namespace sme::search {

struct EvalQuery {
    std::string query;
    std::vector<std::string> expected_keywords;
};

struct QueryEvaluation {
    std::string query;
    std::vector<int> relevance; // graded relevance per returned rank
    int hit = 0;
    double reciprocal_rank = 0.0;
    double ndcg = 0.0;
};

struct EvaluationSummary {
    std::string model;
    size_t k = 10;
    std::vector<QueryEvaluation> queries;
    double hit_rate = 0.0;
    double mrr = 0.0;
    double ndcg = 0.0;
};

// 0: no keyword present, 2: every keyword present, 1: otherwise (case-insensitive substring)
int assessRelevance(const std::string& text, const std::vector<std::string>& keywords);

int hitAtK(const std::vector<int>& relevance, size_t k);
double reciprocalRank(const std::vector<int>& relevance);
double dcgAtK(const std::vector<int>& relevance, size_t k);
double ndcgAtK(const std::vector<int>& relevance, size_t k);

// Runs every query through the retriever; the first retrieval error aborts the evaluation
Result<EvaluationSummary> evaluateRetrieval(const HybridRetriever& retriever,
                                            const std::string& model,
                                            const std::vector<EvalQuery>& queries, size_t k);

// JSON file: [{"query": "...", "expected_keywords": ["..."]}]
Result<std::vector<EvalQuery>> loadEvalQueries(const std::filesystem::path& path);

std::vector<EvalQuery> defaultEvalQueries();

} // namespace sme::search
