#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sme/chunking/hierarchical_chunker.h>

#include <algorithm>
#include <map>
#include <set>

using namespace sme::chunking;
using sme::ingest::DocumentRecord;

namespace {

DocumentRecord makeDoc(std::string text, std::string docId = "doc-1", size_t seq = 0) {
    DocumentRecord doc;
    doc.text = std::move(text);
    doc.doc_id = std::move(docId);
    doc.subject = "Geology";
    doc.source = "rocks.txt";
    doc.file_path = "/corpus/rocks.txt";
    doc.timestamp = "2024-05-01T13:45:10";
    doc.doc_seq = seq;
    return doc;
}

HierarchicalChunkerConfig config(std::vector<size_t> levels) {
    HierarchicalChunkerConfig c;
    c.levels = std::move(levels);
    c.overlap_ratio = 0.1;
    c.max_overlap = 220;
    return c;
}

std::string longText(size_t words) {
    std::string text;
    for (size_t i = 0; i < words; ++i) {
        text += "mineral" + std::to_string(i % 37) + (i % 11 == 10 ? ". " : " ");
    }
    return text;
}

} // namespace

TEST(HierarchicalChunkerTest, RockCycleExample) {
    HierarchicalChunker chunker(config({40, 15}));
    auto levels = chunker.chunk(
        {makeDoc("The rock cycle transforms igneous rock into sedimentary rock.")});

    const auto& top = levels.at(40);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].text, "The rock cycle transforms igneous rock");
    EXPECT_EQ(top[1].text, "into sedimentary rock.");

    const auto& fine = levels.at(15);
    auto it = std::find_if(fine.begin(), fine.end(),
                           [](const Chunk& c) { return c.text == "igneous rock"; });
    ASSERT_NE(it, fine.end());
    EXPECT_EQ(it->metadata.parent_chunk_id, top[0].metadata.chunk_id);
    EXPECT_LT(it->text.size(), top[0].text.size());
}

TEST(HierarchicalChunkerTest, ChildrenNestInsideParents) {
    HierarchicalChunker chunker(config({2048, 512, 128}));
    auto levels = chunker.chunk({makeDoc(longText(1500))});

    std::vector<size_t> sizes{2048, 512, 128};
    for (size_t li = 1; li < sizes.size(); ++li) {
        std::map<std::string, const Chunk*> parents;
        for (const auto& p : levels.at(sizes[li - 1])) {
            parents[p.metadata.chunk_id] = &p;
        }
        ASSERT_FALSE(levels.at(sizes[li]).empty());
        for (const auto& child : levels.at(sizes[li])) {
            auto parent = parents.find(child.metadata.parent_chunk_id);
            ASSERT_NE(parent, parents.end());
            EXPECT_EQ(parent->second->text.substr(child.metadata.start_offset, child.text.size()),
                      child.text);
            EXPECT_LE(child.text.size(), sizes[li]);
        }
    }
}

TEST(HierarchicalChunkerTest, MetadataIsInheritedAndSet) {
    HierarchicalChunker chunker(config({200, 50}));
    auto levels = chunker.chunk({makeDoc(longText(100))});

    for (const auto& [size, chunks] : levels) {
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& md = chunks[i].metadata;
            EXPECT_EQ(md.level_size, size);
            EXPECT_EQ(md.doc_id, "doc-1");
            EXPECT_EQ(md.parent_doc_id, "doc-1");
            EXPECT_EQ(md.subject, "Geology");
            EXPECT_EQ(md.source, "rocks.txt");
            EXPECT_EQ(md.file_path, "/corpus/rocks.txt");
            EXPECT_EQ(md.timestamp, "2024-05-01T13:45:10");
        }
    }
    EXPECT_TRUE(levels.at(200).front().metadata.parent_chunk_id.empty());
    EXPECT_EQ(levels.at(200)[1].metadata.chunk_index, 1u);
}

TEST(HierarchicalChunkerTest, ChunkIdsAreDeterministicAndUnique) {
    HierarchicalChunker chunker(config({300, 80}));
    auto docs = std::vector<DocumentRecord>{makeDoc(longText(400))};

    auto first = chunker.chunk(docs);
    auto second = chunker.chunk(docs);

    std::set<std::string> ids;
    for (const auto& [size, chunks] : first) {
        const auto& again = second.at(size);
        ASSERT_EQ(chunks.size(), again.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            EXPECT_EQ(chunks[i].metadata.chunk_id, again[i].metadata.chunk_id);
            ids.insert(chunks[i].metadata.chunk_id);
        }
    }
    EXPECT_EQ(ids.size(), first.at(300).size() + first.at(80).size());
}

TEST(HierarchicalChunkerTest, DocumentsOfOneFileGetDistinctIds) {
    HierarchicalChunker chunker(config({100}));
    auto levels = chunker.chunk({makeDoc("same text", "doc-1", 0), makeDoc("same text", "doc-1", 1)});

    const auto& top = levels.at(100);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_NE(top[0].metadata.chunk_id, top[1].metadata.chunk_id);
    EXPECT_EQ(top[1].metadata.doc_seq, 1u);
}

TEST(HierarchicalChunkerTest, EmptyDocumentsAreSkipped) {
    HierarchicalChunker chunker(config({100, 20}));
    auto levels = chunker.chunk({makeDoc("   "), makeDoc("")});

    ASSERT_EQ(levels.size(), 2u);
    EXPECT_TRUE(levels.at(100).empty());
    EXPECT_TRUE(levels.at(20).empty());
}

TEST(HierarchicalChunkerTest, OverlapScalesWithLevelAndIsCapped) {
    HierarchicalChunker chunker(config({2048, 512, 40}));
    EXPECT_EQ(chunker.overlapFor(2048), 204u);
    EXPECT_EQ(chunker.overlapFor(512), 51u);
    EXPECT_EQ(chunker.overlapFor(40), 4u);

    auto capped = config({4096});
    HierarchicalChunker cappedChunker(capped);
    EXPECT_EQ(cappedChunker.overlapFor(4096), 220u);
}

TEST(HierarchicalChunkerTest, LevelsAreSortedAndDeduplicated) {
    HierarchicalChunker chunker(config({128, 2048, 512, 128, 0}));
    EXPECT_THAT(chunker.levels(), ::testing::ElementsAre(2048u, 512u, 128u));
}
