#include <sme/core/format.h>
#include <sme/indexing/ingestion_pipeline.h>
#include <sme/ingest/corpus_scanner.h>
#include <sme/ingest/document_loader.h>
#include <sme/ingest/identity_assigner.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace sme::indexing {

namespace {

vector::VectorMetadata toVectorMetadata(const chunking::Chunk& chunk) {
    vector::VectorMetadata m;
    m.text = chunk.text;
    m.source = chunk.metadata.source;
    m.doc_id = chunk.metadata.doc_id;
    m.chunk_size = chunk.metadata.level_size;
    m.chunk_index = chunk.metadata.chunk_index;
    m.parent_chunk_id = chunk.metadata.parent_chunk_id;
    m.parent_doc_id = chunk.metadata.parent_doc_id;
    m.subject = chunk.metadata.subject;
    m.file_path = chunk.metadata.file_path;
    return m;
}

void collectPaths(const std::vector<chunking::Chunk>& chunks, std::set<std::string>& out) {
    for (const auto& c : chunks) {
        out.insert(c.metadata.file_path);
    }
}

} // namespace

IngestionPipeline::IngestionPipeline(IngestionOptions options,
                                     std::shared_ptr<vector::DenseEncoder> encoder,
                                     std::shared_ptr<vector::IVectorStore> store,
                                     std::shared_ptr<extraction::TextExtractorRegistry> extractors)
    : options_(std::move(options)),
      encoder_(std::move(encoder)),
      store_(std::move(store)),
      extractors_(std::move(extractors)) {
    if (!extractors_) {
        extractors_ = extraction::TextExtractorRegistry::withDefaults();
    }
}

Result<void> IngestionPipeline::preflight(index::IndexWriter& writer) {
    if (options_.models.empty()) {
        return Error{ErrorCode::ConfigurationError, "No embedding models configured"};
    }

    size_t indexDimension = 0;
    for (const auto& model : options_.models) {
        auto dim = encoder_->dimension(model);
        if (!dim) {
            return Error{isFatal(dim.error().code) ? dim.error().code : ErrorCode::ConfigurationError,
                         sme::format("Cannot load model '{}': {}", model, dim.error().message)};
        }
        if (indexDimension == 0) {
            indexDimension = dim.value();
        } else if (dim.value() != indexDimension) {
            return Error{ErrorCode::ConfigurationError,
                         sme::format("Model '{}' has dimension {}, but '{}' has {}; all models "
                                     "share one index",
                                     model, dim.value(), options_.models.front(), indexDimension)};
        }
    }
    return writer.ensureIndex(indexDimension);
}

IngestionPipeline::NamespaceOutcome
IngestionPipeline::buildNamespace(const std::string& model, const chunking::ChunkLevels& levels,
                                  const sparse::BM25Encoder& bm25, index::IndexWriter& writer) {
    NamespaceOutcome outcome;
    const auto ns = index::IndexWriter::namespaceFor(model);

    for (const auto& [levelSize, chunks] : levels) {
        if (chunks.empty()) {
            continue;
        }

        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& c : chunks) {
            texts.push_back(c.text);
        }

        auto dense = encoder_->encode(model, texts);
        if (!dense) {
            spdlog::error("[{}] Encoding level {} failed: {}", ns, levelSize,
                          dense.error().message);
            collectPaths(chunks, outcome.failed_paths);
            continue;
        }

        auto vectors = std::move(dense).value();
        auto sparseVectors = bm25.encodeDocuments(texts);
        std::vector<vector::VectorRecord> records;
        records.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (sparseVectors[i].empty()) {
                spdlog::warn("[{}] Skipping chunk {} with no sparse terms", ns,
                             chunks[i].metadata.chunk_id);
                ++outcome.skipped_empty;
                continue;
            }
            vector::VectorRecord record;
            record.id = chunks[i].metadata.chunk_id;
            record.values = std::move(vectors[i]);
            record.sparse_values = std::move(sparseVectors[i]);
            record.metadata = toVectorMetadata(chunks[i]);
            records.push_back(std::move(record));
        }

        auto written = writer.upsert(records, ns);
        if (!written) {
            spdlog::error("[{}] Upserting level {} failed: {}", ns, levelSize,
                          written.error().message);
            collectPaths(chunks, outcome.failed_paths);
            continue;
        }
        outcome.upserted += written.value();
        spdlog::info("[{}] Level {}: upserted {} vectors", ns, levelSize, written.value());
    }
    return outcome;
}

std::vector<IngestionPipeline::NamespaceOutcome>
IngestionPipeline::buildAll(const chunking::ChunkLevels& levels, const sparse::BM25Encoder& bm25,
                            index::IndexWriter& writer) {
    const auto& models = options_.models;
    std::vector<NamespaceOutcome> outcomes(models.size());

    auto buildOne = [&](size_t i) {
        try {
            outcomes[i] = buildNamespace(models[i], levels, bm25, writer);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Namespace build aborted: {}", models[i], e.what());
            for (const auto& [_, chunks] : levels) {
                collectPaths(chunks, outcomes[i].failed_paths);
            }
        }
    };

    if (!options_.parallel_namespaces || models.size() < 2) {
        for (size_t i = 0; i < models.size(); ++i) {
            buildOne(i);
        }
        return outcomes;
    }

    size_t threads = options_.worker_threads > 0 ? options_.worker_threads : models.size();
    spdlog::debug("Building {} namespaces on {} threads", models.size(), threads);
    boost::asio::thread_pool pool(threads);
    for (size_t i = 0; i < models.size(); ++i) {
        boost::asio::post(pool, [&buildOne, i]() { buildOne(i); });
    }
    pool.join();
    return outcomes;
}

Result<IngestionReport> IngestionPipeline::run() {
    IngestionReport report;

    // 1. Manifest and scan
    const auto previous = manifest::IngestManifest::load(options_.manifest_path);
    ingest::CorpusScanner scanner(ingest::ScanOptions{options_.docs_path, options_.extensions});
    auto scanned = scanner.scan();
    if (!scanned) {
        return scanned.error();
    }

    // 2. Delta
    const auto delta = manifest::ChangeDetector::computeDelta(scanned.value(), previous);
    report.new_files = delta.newPaths.size();
    report.modified_files = delta.modifiedPaths.size();
    report.deleted_files = delta.deletedPaths.size();
    report.unchanged_files = delta.unchanged.size();

    if (!delta.hasChanges()) {
        spdlog::info("Corpus unchanged; nothing to ingest");
        if (auto saved = previous.save(options_.manifest_path); !saved) {
            return saved.error();
        }
        return report;
    }

    index::IndexWriter writer(store_, options_.writer);

    // 3. Models and index are checked before anything is deleted
    if (!delta.toProcess.empty()) {
        if (auto ok = preflight(writer); !ok) {
            spdlog::error("Ingestion aborted: {}", ok.error().message);
            return ok.error();
        }
    }

    // 4. Delete phase
    manifest::CommitOutcome commitOutcome;
    if (!delta.toDelete.empty()) {
        std::vector<std::string> docIds;
        std::map<std::string, std::vector<std::string>> pathsByDocId;
        for (const auto& path : delta.toDelete) {
            auto it = previous.doc_ids.find(path);
            if (it == previous.doc_ids.end()) {
                spdlog::warn("No document id recorded for {}; nothing to delete", path);
                continue;
            }
            if (pathsByDocId[it->second].empty()) {
                docIds.push_back(it->second);
            }
            pathsByDocId[it->second].push_back(path);
        }

        std::vector<std::string> namespaces;
        for (const auto& model : options_.models) {
            namespaces.push_back(index::IndexWriter::namespaceFor(model));
        }
        auto deleted = writer.deleteDocuments(docIds, namespaces);
        for (const auto& docId : deleted.failed_doc_ids) {
            for (const auto& path : pathsByDocId[docId]) {
                commitOutcome.failedDeletePaths.insert(path);
                report.failed_deletes.push_back(path);
            }
        }
    }

    // 5. Build phase: load and chunk the whole current corpus once
    ingest::IdentityAssigner identities(delta.next.doc_ids);
    ingest::DocumentLoader loader(extractors_, identities,
                                  ingest::DocumentLoaderOptions{options_.subject, {}});
    std::vector<std::string> corpusPaths;
    corpusPaths.reserve(delta.currentHashes.size());
    for (const auto& [path, _] : delta.currentHashes) {
        corpusPaths.push_back(path);
    }
    auto loaded = loader.load(corpusPaths);

    const std::set<std::string> toProcess(delta.toProcess.begin(), delta.toProcess.end());
    for (const auto& path : loaded.failedPaths) {
        if (toProcess.count(path)) {
            commitOutcome.failedPaths.insert(path);
        } else {
            spdlog::warn("Unchanged file {} could not be loaded; left out of the sparse model",
                         path);
        }
    }

    chunking::HierarchicalChunker chunker(options_.chunking);
    auto corpusLevels = chunker.chunk(loaded.documents);

    // Sparse model is refit over every coarse-level chunk of the current corpus
    sparse::BM25Encoder bm25;
    const std::vector<chunking::Chunk> noChunks;
    const auto& coarse = corpusLevels.empty() ? noChunks : corpusLevels.begin()->second;
    if (coarse.empty()) {
        spdlog::warn("Corpus has no text; sparse model not refit");
    } else {
        std::vector<std::string> corpusTexts;
        corpusTexts.reserve(coarse.size());
        for (const auto& c : coarse) {
            corpusTexts.push_back(c.text);
        }
        if (auto fit = bm25.fit(corpusTexts); !fit) {
            return fit.error();
        }
        if (auto saved = bm25.save(options_.sparse_model_path); !saved) {
            spdlog::error("Cannot save sparse model: {}", saved.error().message);
            return saved.error();
        }
        report.sparse_model_refit = true;
    }

    // Chunks of files to (re)index whose old vectors are gone
    chunking::ChunkLevels processLevels;
    for (const auto& [levelSize, chunks] : corpusLevels) {
        auto& selected = processLevels[levelSize];
        for (const auto& c : chunks) {
            const auto& path = c.metadata.file_path;
            if (toProcess.count(path) && !commitOutcome.failedPaths.count(path) &&
                !commitOutcome.failedDeletePaths.count(path)) {
                selected.push_back(c);
            }
        }
        report.chunks_per_level[levelSize] = selected.size();
    }

    if (bm25.isFitted()) {
        for (auto& outcome : buildAll(processLevels, bm25, writer)) {
            report.vectors_upserted += outcome.upserted;
            report.skipped_empty_sparse += outcome.skipped_empty;
            commitOutcome.failedPaths.insert(outcome.failed_paths.begin(),
                                             outcome.failed_paths.end());
        }
    }

    // 6. Commit only what succeeded
    commitOutcome.assignedDocIds = identities.documentIds();
    auto committed = manifest::ChangeDetector::commit(previous, delta, commitOutcome);
    if (auto saved = committed.save(options_.manifest_path); !saved) {
        spdlog::error("Cannot save manifest: {}", saved.error().message);
        return saved.error();
    }

    report.failed_paths.assign(commitOutcome.failedPaths.begin(), commitOutcome.failedPaths.end());
    spdlog::info("Ingestion finished: {} new, {} modified, {} deleted, {} vectors upserted, "
                 "{} files failed",
                 report.new_files, report.modified_files, report.deleted_files,
                 report.vectors_upserted, report.failed_paths.size());
    return report;
}

} // namespace sme::indexing
