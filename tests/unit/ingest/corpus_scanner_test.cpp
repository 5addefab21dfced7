#include "test_helpers.h"
#include <gtest/gtest.h>
#include <sme/crypto/hasher.h>
#include <sme/ingest/corpus_scanner.h>
#include <sme/ingest/document_loader.h>
#include <sme/ingest/identity_assigner.h>

using namespace sme;
using namespace sme::ingest;
using namespace sme::test;

class CorpusScannerTest : public SmeTest {};

TEST_F(CorpusScannerTest, HashesSupportedFilesRecursively) {
    auto a = writeFile("docs/a.txt", "alpha");
    auto b = writeFile("docs/nested/b.MD", "beta");
    writeFile("docs/image.png", "binary");

    CorpusScanner scanner(ScanOptions{testDir / "docs", {".txt", ".md"}});
    auto hashes = scanner.scan();
    ASSERT_TRUE(hashes);

    ASSERT_EQ(hashes.value().size(), 2u);
    EXPECT_EQ(hashes.value().at(IdentityAssigner::resolvePath(a)),
              crypto::DigestHasher::sha256Hex("alpha"));
    EXPECT_TRUE(hashes.value().count(IdentityAssigner::resolvePath(b)));
}

TEST_F(CorpusScannerTest, MissingRootIsAnError) {
    CorpusScanner scanner(ScanOptions{testDir / "nope"});
    EXPECT_THAT(scanner.scan(), HasErrorCode(ErrorCode::FileNotFound));
}

TEST_F(CorpusScannerTest, ExtensionMatchingIsCaseInsensitive) {
    CorpusScanner scanner(ScanOptions{testDir, {"TXT"}});
    EXPECT_TRUE(scanner.isSupported("notes.txt"));
    EXPECT_TRUE(scanner.isSupported("NOTES.Txt"));
    EXPECT_FALSE(scanner.isSupported("notes.md"));
}

class DocumentLoaderTest : public SmeTest {};

TEST_F(DocumentLoaderTest, LoadsAndStampsDocuments) {
    auto file = writeFile("Docs/rocks.txt", "\xEF\xBB\xBFIgneous   rock\r\nforms from magma.");
    IdentityAssigner identities;
    DocumentLoader loader(extraction::TextExtractorRegistry::withDefaults(), identities,
                          DocumentLoaderOptions{"Geology", {}});

    auto result = loader.load({file.string()});

    ASSERT_EQ(result.documents.size(), 1u);
    EXPECT_TRUE(result.failedPaths.empty());
    const auto& doc = result.documents.front();
    EXPECT_EQ(doc.subject, "Geology");
    EXPECT_EQ(doc.source, "rocks.txt");
    EXPECT_EQ(doc.file_path, IdentityAssigner::resolvePath(file));
    EXPECT_EQ(doc.doc_id, identities.documentId(file));
    EXPECT_EQ(doc.doc_seq, 0u);
    EXPECT_EQ(doc.text.find("\xEF\xBB\xBF"), std::string::npos);
    EXPECT_EQ(doc.text.find('\r'), std::string::npos);
    EXPECT_FALSE(doc.timestamp.empty());
}

TEST_F(DocumentLoaderTest, BinaryFileIsReportedNotFatal) {
    auto good = writeFile("good.txt", "plain words");
    auto bad = writeFile("bad.txt", std::string("bin\0ary", 7));
    IdentityAssigner identities;
    DocumentLoader loader(extraction::TextExtractorRegistry::withDefaults(), identities);

    auto result = loader.load({good.string(), bad.string()});

    EXPECT_EQ(result.documents.size(), 1u);
    ASSERT_EQ(result.failedPaths.size(), 1u);
    EXPECT_EQ(result.failedPaths.front(), bad.string());
}
