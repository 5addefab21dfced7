#pragma once

#include <sme/net/http_client.h>
#include <sme/vector/vector_store.h>

#include <memory>
#include <mutex>
#include <string>

namespace sme::vector {

struct RestVectorStoreConfig {
    std::string index_name;
    std::string api_key;
    std::string control_url = "https://api.pinecone.io";
    std::string cloud = "aws";
    std::string region = "us-east-1";
    std::string api_version = "2024-07";
};

/**
 * Pinecone-compatible REST client.
 *
 * Control plane: GET/POST {control_url}/indexes. The data-plane host is taken from the index
 * description and cached: POST /vectors/upsert, /query, /vectors/delete.
 */
class RestVectorStore final : public IVectorStore {
public:
    RestVectorStore(RestVectorStoreConfig config, std::shared_ptr<net::IHttpClient> http);

    Result<std::optional<IndexDescription>> describeIndex() override;
    Result<void> createIndex(size_t dimension, const std::string& metric) override;
    Result<void> upsert(const std::vector<VectorRecord>& records, const std::string& ns) override;
    Result<std::vector<QueryMatch>> query(const QueryRequest& request) override;
    Result<void> deleteByFilter(const MetadataFilter& filter, const std::string& ns) override;

    // JSON wire format, exposed for tests
    static std::string upsertBody(const std::vector<VectorRecord>& records, const std::string& ns);
    static std::string queryBody(const QueryRequest& request);
    static std::string deleteBody(const MetadataFilter& filter, const std::string& ns);
    static Result<std::vector<QueryMatch>> parseQueryResponse(const std::string& body);

private:
    std::vector<net::Header> headers() const;
    Result<std::string> dataPlaneUrl();
    Result<void> postData(const std::string& path, const std::string& body, const char* what);

    RestVectorStoreConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
    std::mutex host_mutex_;
    std::string host_;
};

} // namespace sme::vector
