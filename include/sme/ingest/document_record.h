#pragma once

#include <cstddef>
#include <string>

namespace sme::ingest {

// One logical document produced by a loader, with its normalized text
struct DocumentRecord {
    std::string text;
    std::string doc_id;
    std::string subject;
    std::string source;    // file name
    std::string file_path; // resolved absolute path
    std::string timestamp; // ISO-8601 local time of ingestion
    size_t doc_seq = 0;    // index of this document within its file
};

} // namespace sme::ingest
