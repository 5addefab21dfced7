#pragma once

#include <sme/net/http_client.h>
#include <sme/vector/vector_store.h>

#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sme::test {

/**
 * In-memory IVectorStore that records every call.
 *
 * Scores are dense dot product plus sparse dot product. Failures can be injected per
 * namespace, per document id or for records whose file path matches.
 */
class FakeVectorStore : public vector::IVectorStore {
public:
    struct Call {
        std::string op; // "create", "upsert", "delete", "query"
        std::string ns;
        std::string detail; // doc_id for deletes, record count for upserts
    };

    Result<std::optional<vector::IndexDescription>> describeIndex() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (describeError) {
            return *describeError;
        }
        return index;
    }

    Result<void> createIndex(size_t dimension, const std::string& metric) override {
        std::lock_guard<std::mutex> lock(mutex_);
        index = vector::IndexDescription{"test-index", dimension, metric};
        calls.push_back({"create", "", std::to_string(dimension)});
        return Result<void>();
    }

    Result<void> upsert(const std::vector<vector::VectorRecord>& records,
                        const std::string& ns) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back({"upsert", ns, std::to_string(records.size())});
        if (failUpsertNamespaces.count(ns)) {
            return Error{ErrorCode::ServiceUnavailable, "injected upsert failure"};
        }
        for (const auto& r : records) {
            if (failUpsertPaths.count(r.metadata.file_path)) {
                return Error{ErrorCode::ServiceUnavailable, "injected upsert failure"};
            }
        }
        for (const auto& r : records) {
            data[ns][r.id] = r;
        }
        return Result<void>();
    }

    Result<std::vector<vector::QueryMatch>> query(const vector::QueryRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back({"query", request.ns, std::to_string(request.top_k)});
        lastQuery = request;
        if (queryError) {
            return *queryError;
        }
        if (!cannedMatches.empty()) {
            auto matches = cannedMatches;
            if (matches.size() > request.top_k) {
                matches.resize(request.top_k);
            }
            return matches;
        }

        std::vector<vector::QueryMatch> matches;
        auto it = data.find(request.ns);
        if (it == data.end()) {
            return matches;
        }
        for (const auto& [id, record] : it->second) {
            if (!request.filter.matches(record.metadata)) {
                continue;
            }
            matches.push_back({id, score(request, record), record.metadata});
        }
        std::stable_sort(matches.begin(), matches.end(),
                         [](const auto& a, const auto& b) { return a.score > b.score; });
        if (matches.size() > request.top_k) {
            matches.resize(request.top_k);
        }
        return matches;
    }

    Result<void> deleteByFilter(const vector::MetadataFilter& filter,
                                const std::string& ns) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string docId;
        if (auto f = filter.equals.find("doc_id"); f != filter.equals.end()) {
            if (const auto* s = std::get_if<std::string>(&f->second)) {
                docId = *s;
            }
        }
        calls.push_back({"delete", ns, docId});
        if (failDeleteDocIds.count(docId)) {
            return Error{ErrorCode::NetworkError, "injected delete failure"};
        }
        auto it = data.find(ns);
        if (it == data.end()) {
            return Result<void>();
        }
        for (auto rec = it->second.begin(); rec != it->second.end();) {
            if (filter.matches(rec->second.metadata)) {
                rec = it->second.erase(rec);
            } else {
                ++rec;
            }
        }
        return Result<void>();
    }

    size_t count(const std::string& ns) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data.find(ns);
        return it == data.end() ? 0 : it->second.size();
    }

    size_t countCalls(const std::string& op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
                                                 [&](const Call& c) { return c.op == op; }));
    }

    std::optional<vector::IndexDescription> index;
    std::map<std::string, std::map<std::string, vector::VectorRecord>> data;
    std::vector<Call> calls;

    std::optional<Error> describeError;
    std::optional<Error> queryError;
    std::vector<vector::QueryMatch> cannedMatches;
    std::set<std::string> failUpsertNamespaces;
    std::set<std::string> failUpsertPaths;
    std::set<std::string> failDeleteDocIds;
    std::optional<vector::QueryRequest> lastQuery;

private:
    static float score(const vector::QueryRequest& request, const vector::VectorRecord& record) {
        float s = 0.0f;
        for (size_t i = 0; i < std::min(request.dense.size(), record.values.size()); ++i) {
            s += request.dense[i] * record.values[i];
        }
        const auto& q = request.sparse;
        const auto& d = record.sparse_values;
        for (size_t i = 0; i < q.indices.size(); ++i) {
            auto pos = std::lower_bound(d.indices.begin(), d.indices.end(), q.indices[i]);
            if (pos != d.indices.end() && *pos == q.indices[i]) {
                s += q.values[i] * d.values[static_cast<size_t>(pos - d.indices.begin())];
            }
        }
        return s;
    }

    mutable std::mutex mutex_;
};

/**
 * Scripted IHttpClient: records requests and replays queued responses in order.
 */
class FakeHttpClient : public net::IHttpClient {
public:
    struct Request {
        std::string method;
        std::string url;
        std::string body;
        std::vector<net::Header> headers;
    };

    Result<net::HttpResponse> get(const std::string& url,
                                  const std::vector<net::Header>& headers) override {
        return next({"GET", url, "", headers});
    }

    Result<net::HttpResponse> post(const std::string& url, const std::string& body,
                                   const std::vector<net::Header>& headers) override {
        return next({"POST", url, body, headers});
    }

    void respond(long status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses.push_back(net::HttpResponse{status, std::move(body)});
    }

    void fail(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses.push_back(std::move(error));
    }

    std::vector<Request> requests;

private:
    Result<net::HttpResponse> next(Request request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(std::move(request));
        if (responses.empty()) {
            return Error{ErrorCode::NetworkError, "no scripted response"};
        }
        auto r = std::move(responses.front());
        responses.pop_front();
        return r;
    }

    std::deque<Result<net::HttpResponse>> responses;
    std::mutex mutex_;
};

} // namespace sme::test
