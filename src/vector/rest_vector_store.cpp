#include <sme/core/format.h>
#include <sme/vector/rest_vector_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sme::vector {

using json = nlohmann::json;

namespace {

json metadataToJson(const VectorMetadata& m) {
    return json{{"text", m.text},
                {"source", m.source},
                {"doc_id", m.doc_id},
                {"chunk_size", m.chunk_size},
                {"chunk_index", m.chunk_index},
                {"parent_chunk_id", m.parent_chunk_id},
                {"parent_doc_id", m.parent_doc_id},
                {"subject", m.subject},
                {"file_path", m.file_path}};
}

VectorMetadata metadataFromJson(const json& j) {
    VectorMetadata m;
    if (!j.is_object()) {
        return m;
    }
    auto str = [&](const char* key) {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
    };
    auto num = [&](const char* key) -> size_t {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) {
            return 0;
        }
        // The store may hand integers back as floats
        return static_cast<size_t>(it->get<double>());
    };
    m.text = str("text");
    m.source = str("source");
    m.doc_id = str("doc_id");
    m.chunk_size = num("chunk_size");
    m.chunk_index = num("chunk_index");
    m.parent_chunk_id = str("parent_chunk_id");
    m.parent_doc_id = str("parent_doc_id");
    m.subject = str("subject");
    m.file_path = str("file_path");
    return m;
}

json filterToJson(const MetadataFilter& filter) {
    json out = json::object();
    for (const auto& [field, value] : filter.equals) {
        std::visit([&](const auto& v) { out[field] = json{{"$eq", v}}; }, value);
    }
    return out;
}

json sparseToJson(const sparse::SparseVector& sv) {
    return json{{"indices", sv.indices}, {"values", sv.values}};
}

} // namespace

RestVectorStore::RestVectorStore(RestVectorStoreConfig config,
                                 std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

std::vector<net::Header> RestVectorStore::headers() const {
    return {{"Api-Key", config_.api_key}, {"X-Pinecone-API-Version", config_.api_version}};
}

Result<std::optional<IndexDescription>> RestVectorStore::describeIndex() {
    auto response = http_->get(config_.control_url + "/indexes/" + config_.index_name, headers());
    if (!response) {
        return response.error();
    }
    if (response.value().status == 404) {
        return std::optional<IndexDescription>{};
    }
    if (!response.value().ok()) {
        return net::statusToError(response.value(), "describe index");
    }

    try {
        auto j = json::parse(response.value().body);
        IndexDescription desc;
        desc.name = j.value("name", config_.index_name);
        desc.dimension = j.at("dimension").get<size_t>();
        desc.metric = j.value("metric", std::string{});
        if (auto host = j.value("host", std::string{}); !host.empty()) {
            std::lock_guard<std::mutex> lock(host_mutex_);
            host_ = host.rfind("http", 0) == 0 ? host : "https://" + host;
        }
        return std::optional<IndexDescription>{std::move(desc)};
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     sme::format("Malformed index description: {}", e.what())};
    }
}

Result<void> RestVectorStore::createIndex(size_t dimension, const std::string& metric) {
    json body{{"name", config_.index_name},
              {"dimension", dimension},
              {"metric", metric},
              {"spec", {{"serverless", {{"cloud", config_.cloud}, {"region", config_.region}}}}}};
    auto response = http_->post(config_.control_url + "/indexes", body.dump(), headers());
    if (!response) {
        return response.error();
    }
    if (!response.value().ok()) {
        return net::statusToError(response.value(), "create index");
    }
    spdlog::info("Created index '{}' (dim {}, metric {})", config_.index_name, dimension, metric);

    // Pick up the data-plane host
    auto described = describeIndex();
    if (!described) {
        return described.error();
    }
    return Result<void>();
}

Result<std::string> RestVectorStore::dataPlaneUrl() {
    {
        std::lock_guard<std::mutex> lock(host_mutex_);
        if (!host_.empty()) {
            return host_;
        }
    }
    auto described = describeIndex();
    if (!described) {
        return described.error();
    }
    if (!described.value()) {
        return Error{ErrorCode::NotFound,
                     sme::format("Index '{}' does not exist", config_.index_name)};
    }
    std::lock_guard<std::mutex> lock(host_mutex_);
    if (host_.empty()) {
        return Error{ErrorCode::InvalidData,
                     sme::format("Index '{}' description has no host", config_.index_name)};
    }
    return host_;
}

Result<void> RestVectorStore::postData(const std::string& path, const std::string& body,
                                       const char* what) {
    auto base = dataPlaneUrl();
    if (!base) {
        return base.error();
    }
    auto response = http_->post(base.value() + path, body, headers());
    if (!response) {
        return response.error();
    }
    if (!response.value().ok()) {
        return net::statusToError(response.value(), what);
    }
    return Result<void>();
}

std::string RestVectorStore::upsertBody(const std::vector<VectorRecord>& records,
                                        const std::string& ns) {
    json vectors = json::array();
    for (const auto& r : records) {
        json v{{"id", r.id}, {"values", r.values}, {"metadata", metadataToJson(r.metadata)}};
        if (!r.sparse_values.empty()) {
            v["sparseValues"] = sparseToJson(r.sparse_values);
        }
        vectors.push_back(std::move(v));
    }
    return json{{"vectors", std::move(vectors)}, {"namespace", ns}}.dump();
}

std::string RestVectorStore::queryBody(const QueryRequest& request) {
    json body{{"vector", request.dense},
              {"topK", request.top_k},
              {"includeMetadata", request.include_metadata},
              {"includeValues", false},
              {"namespace", request.ns}};
    if (!request.sparse.empty()) {
        body["sparseVector"] = sparseToJson(request.sparse);
    }
    if (!request.filter.equals.empty()) {
        body["filter"] = filterToJson(request.filter);
    }
    return body.dump();
}

std::string RestVectorStore::deleteBody(const MetadataFilter& filter, const std::string& ns) {
    return json{{"filter", filterToJson(filter)}, {"namespace", ns}}.dump();
}

Result<std::vector<QueryMatch>> RestVectorStore::parseQueryResponse(const std::string& body) {
    try {
        auto j = json::parse(body);
        std::vector<QueryMatch> matches;
        auto it = j.find("matches");
        if (it == j.end() || it->is_null()) {
            return matches;
        }
        for (const auto& m : *it) {
            QueryMatch match;
            match.id = m.at("id").get<std::string>();
            match.score = m.value("score", 0.0f);
            if (auto md = m.find("metadata"); md != m.end()) {
                match.metadata = metadataFromJson(*md);
            }
            matches.push_back(std::move(match));
        }
        return matches;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, sme::format("Malformed query response: {}", e.what())};
    }
}

Result<void> RestVectorStore::upsert(const std::vector<VectorRecord>& records,
                                     const std::string& ns) {
    if (records.empty()) {
        return Result<void>();
    }
    return postData("/vectors/upsert", upsertBody(records, ns), "upsert");
}

Result<std::vector<QueryMatch>> RestVectorStore::query(const QueryRequest& request) {
    auto base = dataPlaneUrl();
    if (!base) {
        return base.error();
    }
    auto response = http_->post(base.value() + "/query", queryBody(request), headers());
    if (!response) {
        return response.error();
    }
    if (!response.value().ok()) {
        return net::statusToError(response.value(), "query");
    }
    return parseQueryResponse(response.value().body);
}

Result<void> RestVectorStore::deleteByFilter(const MetadataFilter& filter, const std::string& ns) {
    if (filter.equals.empty()) {
        // An empty filter would match everything
        return Error{ErrorCode::InvalidArgument, "Refusing to delete with an empty filter"};
    }
    return postData("/vectors/delete", deleteBody(filter, ns), "delete");
}

} // namespace sme::vector
