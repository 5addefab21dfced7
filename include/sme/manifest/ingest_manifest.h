#pragma once

#include <sme/core/types.h>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sme::manifest {

// Hash recorded for a file that could not be read. Never equal to a real digest.
inline constexpr const char* kUnreadableHash = "";

using FileHashes = std::map<std::string, Hash>;         // absolute path -> content hash
using DocumentIds = std::map<std::string, std::string>; // absolute path -> document id

/**
 * Persisted record of what has been ingested.
 *
 * On disk: {"files": {path: hash}, "doc_ids": {path: doc_id}} with two-space indentation.
 * A path keeps its document id across content edits; only deletion drops it.
 */
struct IngestManifest {
    FileHashes files;
    DocumentIds doc_ids;

    // Missing or unparsable files yield an empty manifest; never an error
    static IngestManifest load(const std::filesystem::path& path);

    // Write to "<path>.tmp" then rename over the target
    Result<void> save(const std::filesystem::path& path) const;

    std::string toJson() const;
    static Result<IngestManifest> fromJson(const std::string& text);

    bool empty() const noexcept { return files.empty() && doc_ids.empty(); }

    bool operator==(const IngestManifest& other) const = default;
};

/**
 * Classification of the current corpus against the manifest.
 * A modified path appears in both toDelete and toProcess; all lists are sorted.
 */
struct ManifestDelta {
    std::vector<std::string> newPaths;
    std::vector<std::string> modifiedPaths;
    std::vector<std::string> deletedPaths;

    std::vector<std::string> toDelete;  // modified + deleted
    std::vector<std::string> toProcess; // new + modified
    std::vector<std::string> unchanged;

    FileHashes currentHashes;

    // Candidate next manifest assuming every file is processed successfully
    IngestManifest next;

    bool hasChanges() const noexcept { return !toDelete.empty() || !toProcess.empty(); }
};

// Outcome of an ingestion run, used to commit only the work that succeeded
struct CommitOutcome {
    std::set<std::string> failedPaths;      // processing failed (new or modified)
    std::set<std::string> failedDeletePaths; // vector deletion failed (modified or deleted)
    DocumentIds assignedDocIds;             // identities assigned during this run
};

class ChangeDetector {
public:
    static ManifestDelta computeDelta(const FileHashes& current, const IngestManifest& manifest);

    // Manifest to persist after a run: previous state plus successful changes only
    static IngestManifest commit(const IngestManifest& previous, const ManifestDelta& delta,
                                 const CommitOutcome& outcome);
};

} // namespace sme::manifest
