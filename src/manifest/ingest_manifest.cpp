#include <sme/core/format.h>
#include <sme/manifest/ingest_manifest.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace sme::manifest {

using json = nlohmann::json;

namespace {

Result<std::map<std::string, std::string>> readStringMap(const json& j, const char* key) {
    std::map<std::string, std::string> out;
    auto it = j.find(key);
    if (it == j.end()) {
        return out;
    }
    if (!it->is_object()) {
        return Error{ErrorCode::CorruptedData, sme::format("'{}' is not an object", key)};
    }
    for (const auto& [k, v] : it->items()) {
        if (!v.is_string()) {
            return Error{ErrorCode::CorruptedData,
                         sme::format("'{}' entry for {} is not a string", key, k)};
        }
        out.emplace(k, v.get<std::string>());
    }
    return out;
}

} // namespace

std::string IngestManifest::toJson() const {
    json j;
    j["files"] = json::object();
    j["doc_ids"] = json::object();
    for (const auto& [path, hash] : files) {
        j["files"][path] = hash;
    }
    for (const auto& [path, id] : doc_ids) {
        j["doc_ids"][path] = id;
    }
    return j.dump(2);
}

Result<IngestManifest> IngestManifest::fromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::CorruptedData, e.what()};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::CorruptedData, "manifest root is not an object"};
    }

    auto files = readStringMap(j, "files");
    if (!files) {
        return files.error();
    }
    auto ids = readStringMap(j, "doc_ids");
    if (!ids) {
        return ids.error();
    }

    IngestManifest m;
    m.files = std::move(files).value();
    m.doc_ids = std::move(ids).value();
    return m;
}

IngestManifest IngestManifest::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::info("No manifest at {}, starting fresh", path.string());
        return {};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::warn("Cannot open manifest {}, starting fresh", path.string());
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = fromJson(buffer.str());
    if (!parsed) {
        spdlog::warn("Manifest {} is corrupt ({}), starting fresh", path.string(),
                     parsed.error().message);
        return {};
    }
    spdlog::debug("Loaded manifest {} with {} files", path.string(), parsed.value().files.size());
    return std::move(parsed).value();
}

Result<void> IngestManifest::save(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         sme::format("Cannot create {}: {}", path.parent_path().string(),
                                     ec.message())};
        }
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError,
                         sme::format("Cannot open {} for writing", tmp.string())};
        }
        out << toJson();
        out.flush();
        if (!out) {
            return Error{ErrorCode::WriteError, sme::format("Failed writing {}", tmp.string())};
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Error{ErrorCode::WriteError,
                     sme::format("Cannot replace manifest {}", path.string())};
    }
    return Result<void>();
}

ManifestDelta ChangeDetector::computeDelta(const FileHashes& current,
                                           const IngestManifest& manifest) {
    ManifestDelta delta;
    delta.currentHashes = current;
    delta.next = manifest;

    // std::map iteration keeps every list sorted by path
    for (const auto& [path, hash] : current) {
        auto it = manifest.files.find(path);
        if (it == manifest.files.end()) {
            delta.newPaths.push_back(path);
            delta.toProcess.push_back(path);
            delta.next.files[path] = hash;
        } else if (hash == kUnreadableHash || it->second != hash) {
            delta.modifiedPaths.push_back(path);
            delta.toDelete.push_back(path);
            delta.toProcess.push_back(path);
            delta.next.files[path] = hash;
        } else {
            delta.unchanged.push_back(path);
        }
    }

    for (const auto& [path, hash] : manifest.files) {
        if (!current.count(path)) {
            delta.deletedPaths.push_back(path);
            delta.next.files.erase(path);
            delta.next.doc_ids.erase(path);
        }
    }

    // toDelete = modified + deleted, kept sorted
    std::vector<std::string> merged;
    merged.reserve(delta.toDelete.size() + delta.deletedPaths.size());
    std::merge(delta.toDelete.begin(), delta.toDelete.end(), delta.deletedPaths.begin(),
               delta.deletedPaths.end(), std::back_inserter(merged));
    delta.toDelete = std::move(merged);

    spdlog::info("Change detection: {} new, {} modified, {} deleted, {} unchanged",
                 delta.newPaths.size(), delta.modifiedPaths.size(), delta.deletedPaths.size(),
                 delta.unchanged.size());
    return delta;
}

IngestManifest ChangeDetector::commit(const IngestManifest& previous, const ManifestDelta& delta,
                                      const CommitOutcome& outcome) {
    IngestManifest committed = previous;

    for (const auto& path : delta.deletedPaths) {
        if (outcome.failedDeletePaths.count(path)) {
            spdlog::warn("Keeping manifest entry for {}: vector deletion failed", path);
            continue;
        }
        committed.files.erase(path);
        committed.doc_ids.erase(path);
    }

    for (const auto& path : delta.toProcess) {
        if (outcome.failedPaths.count(path) || outcome.failedDeletePaths.count(path)) {
            // New files stay absent; modified files keep their previous hash
            continue;
        }
        auto hashIt = delta.currentHashes.find(path);
        if (hashIt == delta.currentHashes.end()) {
            continue;
        }
        committed.files[path] = hashIt->second;
        if (auto idIt = outcome.assignedDocIds.find(path); idIt != outcome.assignedDocIds.end()) {
            committed.doc_ids[path] = idIt->second;
        }
    }

    return committed;
}

} // namespace sme::manifest
