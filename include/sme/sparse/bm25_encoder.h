#pragma once

#include <sme/core/types.h>
#include <sme/sparse/sparse_vector.h>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sme::sparse {

struct BM25Params {
    double k1 = 1.2;
    double b = 0.75;
};

/**
 * Term-weighted sparse model.
 *
 * fit() learns document frequencies and the average document length over a corpus. A term's
 * sparse index is derived from its SHA-256 digest, so it never depends on the corpus and
 * vectors stored before a refit stay comparable with queries encoded after it. Documents are
 * encoded with BM25 term-frequency saturation, queries with normalized inverse document
 * frequency. A fitted encoder is immutable and safe to share between threads.
 */
class BM25Encoder {
public:
    static constexpr const char* kFormatTag = "sme-bm25";
    static constexpr int kFormatVersion = 2;

    explicit BM25Encoder(BM25Params params = {});

    // InvalidArgument when the corpus has no non-blank text
    Result<void> fit(const std::vector<std::string>& corpus);

    std::vector<SparseVector> encodeDocuments(const std::vector<std::string>& texts) const;
    SparseVector encodeDocument(std::string_view text) const;
    SparseVector encodeQuery(std::string_view text) const;

    Result<void> save(const std::filesystem::path& path) const;

    // MissingArtifact when absent, CorruptedData when malformed
    static Result<BM25Encoder> load(const std::filesystem::path& path);

    bool isFitted() const noexcept { return fitted_; }
    size_t vocabularySize() const noexcept { return doc_freq_.size(); }
    size_t documentCount() const noexcept { return n_docs_; }
    double averageDocumentLength() const noexcept { return avgdl_; }
    const BM25Params& params() const noexcept { return params_; }

    // Lower-cased alphanumeric runs, stop words and single characters removed
    static std::vector<std::string> tokenize(std::string_view text);
    static bool isStopWord(std::string_view token);

    // First four bytes of the term's SHA-256, big-endian
    static uint32_t termIndex(std::string_view term);

private:
    void rebuildIndex();
    uint32_t indexOf(const std::string& term) const;

    BM25Params params_;
    bool fitted_ = false;
    size_t n_docs_ = 0;
    double avgdl_ = 0.0;
    std::map<std::string, uint32_t> doc_freq_;          // term -> document frequency
    std::unordered_map<std::string, uint32_t> index_;   // term -> sparse index
};

} // namespace sme::sparse
