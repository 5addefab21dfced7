#include <sme/core/format.h>
#include <sme/crypto/hasher.h>
#include <sme/sparse/bm25_encoder.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

namespace sme::sparse {

using json = nlohmann::json;

namespace {

// English stop words (NLTK list)
const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> kStopWords{
        "a",          "about",   "above",   "after",    "again",    "against",    "ain",
        "all",        "am",      "an",      "and",      "any",      "are",        "aren",
        "as",         "at",      "be",      "because",  "been",     "before",     "being",
        "below",      "between", "both",    "but",      "by",       "can",        "couldn",
        "d",          "did",     "didn",    "do",       "does",     "doesn",      "doing",
        "don",        "down",    "during",  "each",     "few",      "for",        "from",
        "further",    "had",     "hadn",    "has",      "hasn",     "have",       "haven",
        "having",     "he",      "her",     "here",     "hers",     "herself",    "him",
        "himself",    "his",     "how",     "i",        "if",       "in",         "into",
        "is",         "isn",     "it",      "its",      "itself",   "just",       "ll",
        "m",          "ma",      "me",      "mightn",   "more",     "most",       "mustn",
        "my",         "myself",  "needn",   "no",       "nor",      "not",        "now",
        "o",          "of",      "off",     "on",       "once",     "only",       "or",
        "other",      "our",     "ours",    "ourselves", "out",     "over",       "own",
        "re",         "s",       "same",    "shan",     "she",      "should",     "shouldn",
        "so",         "some",    "such",    "t",        "than",     "that",       "the",
        "their",      "theirs",  "them",    "themselves", "then",   "there",      "these",
        "they",       "this",    "those",   "through",  "to",       "too",        "under",
        "until",      "up",      "ve",      "very",     "was",      "wasn",       "we",
        "were",       "weren",   "what",    "when",     "where",    "which",      "while",
        "who",        "whom",    "why",     "will",     "with",     "won",        "wouldn",
        "y",          "you",     "your",    "yours",    "yourself", "yourselves"};
    return kStopWords;
}

inline bool isTokenChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

std::map<std::string, uint32_t> termCounts(const std::vector<std::string>& tokens) {
    std::map<std::string, uint32_t> counts;
    for (const auto& t : tokens) {
        ++counts[t];
    }
    return counts;
}

} // namespace

BM25Encoder::BM25Encoder(BM25Params params) : params_(params) {}

bool BM25Encoder::isStopWord(std::string_view token) {
    return stopWords().count(std::string(token)) > 0;
}

std::vector<std::string> BM25Encoder::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isTokenChar(text[i])) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && isTokenChar(text[i])) {
            ++i;
        }
        if (i - start < 2) {
            continue;
        }
        std::string token(text.substr(start, i - start));
        std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c) {
            return static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        });
        if (!isStopWord(token)) {
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

Result<void> BM25Encoder::fit(const std::vector<std::string>& corpus) {
    std::map<std::string, uint32_t> df;
    size_t nDocs = 0;
    size_t totalLength = 0;

    for (const auto& text : corpus) {
        if (std::all_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; })) {
            continue;
        }
        auto tokens = tokenize(text);
        ++nDocs;
        totalLength += tokens.size();
        std::set<std::string> distinct(tokens.begin(), tokens.end());
        for (const auto& term : distinct) {
            ++df[term];
        }
    }

    if (nDocs == 0) {
        return Error{ErrorCode::InvalidArgument, "Cannot fit BM25 on an empty corpus"};
    }

    n_docs_ = nDocs;
    avgdl_ = static_cast<double>(totalLength) / static_cast<double>(nDocs);
    doc_freq_ = std::move(df);
    rebuildIndex();
    fitted_ = true;

    spdlog::info("Fitted BM25 on {} documents: {} terms, avgdl {:.2f}", n_docs_, doc_freq_.size(),
                 avgdl_);
    return Result<void>();
}

uint32_t BM25Encoder::termIndex(std::string_view term) {
    auto hex = crypto::DigestHasher::sha256Hex(term);
    return static_cast<uint32_t>(std::stoul(hex.substr(0, 8), nullptr, 16));
}

void BM25Encoder::rebuildIndex() {
    index_.clear();
    index_.reserve(doc_freq_.size());
    for (const auto& [term, _] : doc_freq_) {
        index_.emplace(term, termIndex(term));
    }
}

uint32_t BM25Encoder::indexOf(const std::string& term) const {
    auto it = index_.find(term);
    return it != index_.end() ? it->second : termIndex(term);
}

SparseVector BM25Encoder::encodeDocument(std::string_view text) const {
    SparseVector out;
    if (!fitted_) {
        return out;
    }

    auto tokens = tokenize(text);
    const double docLength = static_cast<double>(tokens.size());
    const double avgdl = avgdl_ > 0.0 ? avgdl_ : 1.0;
    const double norm = params_.k1 * (1.0 - params_.b + params_.b * docLength / avgdl);

    // Terms whose digests collide share one entry
    std::map<uint32_t, double> weights;
    for (const auto& [term, tf] : termCounts(tokens)) {
        auto it = index_.find(term);
        if (it == index_.end()) {
            continue;
        }
        weights[it->second] += tf * (params_.k1 + 1.0) / (tf + norm);
    }

    out.indices.reserve(weights.size());
    out.values.reserve(weights.size());
    for (const auto& [idx, weight] : weights) {
        out.indices.push_back(idx);
        out.values.push_back(static_cast<float>(weight));
    }
    return out;
}

std::vector<SparseVector> BM25Encoder::encodeDocuments(const std::vector<std::string>& texts) const {
    std::vector<SparseVector> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(encodeDocument(text));
    }
    return out;
}

SparseVector BM25Encoder::encodeQuery(std::string_view text) const {
    SparseVector out;
    if (!fitted_) {
        return out;
    }

    auto tokens = tokenize(text);
    std::set<std::string> distinct(tokens.begin(), tokens.end());

    std::map<uint32_t, double> weights;
    double sum = 0.0;
    for (const auto& term : distinct) {
        // Terms the corpus never saw count as appearing in one document
        auto it = doc_freq_.find(term);
        double df = it != doc_freq_.end() ? it->second : 1.0;
        double idf = std::log((static_cast<double>(n_docs_) + 1.0) / (df + 0.5));
        weights[indexOf(term)] += idf;
        sum += idf;
    }

    out.indices.reserve(weights.size());
    out.values.reserve(weights.size());
    for (const auto& [idx, idf] : weights) {
        out.indices.push_back(idx);
        out.values.push_back(static_cast<float>(sum > 0.0 ? idf / sum : 0.0));
    }
    return out;
}

Result<void> BM25Encoder::save(const std::filesystem::path& path) const {
    if (!fitted_) {
        return Error{ErrorCode::InvalidState, "BM25 encoder has not been fitted"};
    }

    json vocab = json::array();
    for (const auto& [term, df] : doc_freq_) {
        vocab.push_back(json::array({term, df}));
    }
    json j{{"format", kFormatTag}, {"version", kFormatVersion}, {"k1", params_.k1},
           {"b", params_.b},       {"n_docs", n_docs_},         {"avgdl", avgdl_},
           {"vocabulary", std::move(vocab)}};

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError,
                         sme::format("Cannot open {} for writing", tmp.string())};
        }
        out << j.dump();
        out.flush();
        if (!out) {
            return Error{ErrorCode::WriteError, sme::format("Failed writing {}", tmp.string())};
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     sme::format("Cannot replace {}: {}", path.string(), ec.message())};
    }
    spdlog::info("Saved BM25 model to {}", path.string());
    return Result<void>();
}

Result<BM25Encoder> BM25Encoder::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::MissingArtifact,
                     sme::format("BM25 model not found at {}; run ingestion first",
                                 path.string())};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::MissingArtifact,
                     sme::format("Cannot open BM25 model {}", path.string())};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        auto j = json::parse(buffer.str());
        if (j.value("format", std::string{}) != kFormatTag) {
            return Error{ErrorCode::CorruptedData,
                         sme::format("{} is not a BM25 model", path.string())};
        }
        if (j.at("version").get<int>() != kFormatVersion) {
            return Error{ErrorCode::CorruptedData,
                         sme::format("Unsupported BM25 model version in {}", path.string())};
        }

        BM25Encoder encoder(BM25Params{j.at("k1").get<double>(), j.at("b").get<double>()});
        encoder.n_docs_ = j.at("n_docs").get<size_t>();
        encoder.avgdl_ = j.at("avgdl").get<double>();
        const auto& vocab = j.at("vocabulary");
        if (!vocab.is_array()) {
            return Error{ErrorCode::CorruptedData, "BM25 vocabulary is not an array"};
        }
        for (const auto& entry : vocab) {
            if (!entry.is_array() || entry.size() != 2) {
                return Error{ErrorCode::CorruptedData, "Malformed BM25 vocabulary entry"};
            }
            auto [_, inserted] = encoder.doc_freq_.emplace(entry.at(0).get<std::string>(),
                                                            entry.at(1).get<uint32_t>());
            if (!inserted) {
                return Error{ErrorCode::CorruptedData, "Duplicate terms in BM25 vocabulary"};
            }
        }
        encoder.rebuildIndex();
        encoder.fitted_ = true;
        spdlog::debug("Loaded BM25 model {} ({} terms)", path.string(), encoder.doc_freq_.size());
        return encoder;
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData,
                     sme::format("Malformed BM25 model {}: {}", path.string(), e.what())};
    }
}

} // namespace sme::sparse
