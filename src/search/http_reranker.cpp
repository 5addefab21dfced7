#include <sme/core/format.h>
#include <sme/search/reranker.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace sme::search {

using json = nlohmann::json;

HttpReranker::HttpReranker(HttpRerankerConfig config, std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 16;
    }
}

bool HttpReranker::isReady() const {
    return http_ != nullptr && !config_.endpoint.empty();
}

Result<std::vector<float>> HttpReranker::parseScores(const std::string& body, size_t expected) {
    try {
        auto j = json::parse(body);
        std::vector<float> scores;
        if (j.is_object() && j.contains("scores")) {
            scores = j["scores"].get<std::vector<float>>();
        } else if (j.is_array()) {
            scores.assign(expected, std::nanf(""));
            for (const auto& item : j) {
                auto idx = item.at("index").get<size_t>();
                if (idx >= expected) {
                    return Error{ErrorCode::InvalidData,
                                 sme::format("Rerank index {} out of range", idx)};
                }
                scores[idx] = item.at("score").get<float>();
            }
            if (std::any_of(scores.begin(), scores.end(), [](float s) { return std::isnan(s); })) {
                return Error{ErrorCode::InvalidData, "Rerank response is missing scores"};
            }
        } else {
            return Error{ErrorCode::InvalidData, "Unrecognized rerank response"};
        }
        if (scores.size() != expected) {
            return Error{ErrorCode::InvalidData,
                         sme::format("Reranker returned {} scores for {} documents",
                                     scores.size(), expected)};
        }
        return scores;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, sme::format("Malformed rerank response: {}", e.what())};
    }
}

Result<std::vector<float>> HttpReranker::scoreDocuments(const std::string& query,
                                                        const std::vector<std::string>& documents) {
    if (!isReady()) {
        return Error{ErrorCode::InvalidState, "Reranker endpoint not configured"};
    }

    std::vector<float> all;
    all.reserve(documents.size());
    std::vector<net::Header> headers;
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    for (size_t begin = 0; begin < documents.size(); begin += config_.batch_size) {
        size_t end = std::min(documents.size(), begin + config_.batch_size);
        std::vector<std::string> batch(documents.begin() + static_cast<std::ptrdiff_t>(begin),
                                       documents.begin() + static_cast<std::ptrdiff_t>(end));
        json request{{"model", config_.model}, {"query", query}, {"texts", batch}};

        auto response = http_->post(config_.endpoint, request.dump(), headers);
        if (!response) {
            return response.error();
        }
        if (!response.value().ok()) {
            return net::statusToError(response.value(), "rerank request");
        }
        auto scores = parseScores(response.value().body, batch.size());
        if (!scores) {
            return scores.error();
        }
        const auto& s = scores.value();
        all.insert(all.end(), s.begin(), s.end());
    }
    return all;
}

} // namespace sme::search
