#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <thread>
#include "cache_manager.hpp"
#include "faiss_vector_store.hpp"
#include "language_analyzer.hpp"
#include "vector/vector_store.hpp"

using namespace code_intelligence;

namespace {

const char* kParserSource =
    "def parse_config(path):\n"
    "    \"\"\"Reads the config file.\"\"\"\n"
    "    return open(path).read()\n"
    "\n"
    "class ConfigLoader:\n"
    "    def load(self):\n"
    "        return parse_config(self.path)\n";

const char* kLexerSource =
    "def tokenize_stream(stream):\n"
    "    return [lexeme for lexeme in stream.split()]\n"
    "\n"
    "def count_lexemes(stream):\n"
    "    return len(tokenize_stream(stream))\n";

// Primary backend that cannot be reached.
class UnreachableBackend : public VectorBackend {
public:
    std::string name() const override { return "unreachable"; }
    bool initialize(int) override { return false; }
    bool upsert(const CodeEmbedding&) override { return false; }
    std::vector<SearchResult> query(const std::vector<float>&, size_t, const SearchFilters&) override { return {}; }
    bool remove(const std::string&) override { return false; }
    size_t remove_file(const std::string&) override { return 0; }
    size_t clear() override { return 0; }
    size_t count() override { return 0; }
};

// Model embedder that always fails.
class BrokenEmbedder : public Embedder {
public:
    std::string name() const override { return "broken"; }
    bool is_available() const override { return true; }
    int dimension() const override { return 256; }
    std::vector<float> embed(const std::string&) override { throw std::runtime_error("offline"); }
};

EmbeddingConfig small_config() {
    EmbeddingConfig cfg;
    cfg.use_model = false;
    cfg.dimension = 256;
    return cfg;
}

} // namespace

class VectorStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        embeddings_ = std::make_shared<EmbeddingService>(small_config());
        store_ = std::make_shared<VectorSemanticStore>(embeddings_, nullptr);
        ASSERT_TRUE(store_->initialize());

        FileAnalysis a = analyzer_.analyze("src/a.py", kParserSource);
        FileAnalysis b = analyzer_.analyze("src/b.py", kLexerSource);
        a_count_ = store_->embed_file(a, kParserSource);
        b_count_ = store_->embed_file(b, kLexerSource);
    }

    LanguageAnalyzer analyzer_;
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<VectorSemanticStore> store_;
    size_t a_count_ = 0;
    size_t b_count_ = 0;
};

TEST_F(VectorStoreTest, EmbedsFileAndSymbolFragments) {
    // file + parse_config + ConfigLoader + load
    EXPECT_EQ(a_count_, 4u);
    // file + tokenize_stream + count_lexemes
    EXPECT_EQ(b_count_, 3u);
    EXPECT_EQ(store_->stats().total_embeddings, 7u);
    EXPECT_EQ(store_->backend_name(), "faiss");
    EXPECT_EQ(store_->stats().embedding_method, "hash");
}

TEST_F(VectorStoreTest, FileFilterRestrictsResults) {
    SearchFilters filters;
    filters.file_filter = "a.py";
    auto results = store_->search("tokenize_stream lexemes", 10, filters);

    ASSERT_FALSE(results.empty());
    for (const auto& r : results) EXPECT_NE(r.file_path.find("a.py"), std::string::npos) << r.file_path;
}

TEST_F(VectorStoreTest, SymbolTypeFilterMatchesExactly) {
    SearchFilters filters;
    filters.symbol_type_filter = "class";
    auto results = store_->search("ConfigLoader", 10, filters);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].symbol_name, "ConfigLoader");
}

TEST_F(VectorStoreTest, RanksSharedIdentifiersFirst) {
    auto results = store_->search("tokenize_stream stream lexeme", 3);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].file_path, "src/b.py");
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_GE(results[i - 1].similarity_score, results[i].similarity_score);
    }
    for (const auto& r : results) {
        EXPECT_GE(r.similarity_score, 0.0);
        EXPECT_LE(r.similarity_score, 1.0);
    }
}

TEST_F(VectorStoreTest, ConcurrentReadersSeeConsistentResults) {
    const auto baseline = store_->search("tokenize_stream stream lexeme", 3);
    ASSERT_FALSE(baseline.empty());

    std::atomic<int> mismatches{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                auto results = store_->search("tokenize_stream stream lexeme", 3);
                bool same = results.size() == baseline.size() &&
                            std::equal(results.begin(), results.end(), baseline.begin(),
                                       [](const SearchResult& a, const SearchResult& b) { return a.id == b.id; });
                if (!same || store_->stats().total_embeddings != 7u) mismatches.fetch_add(1);
            }
        });
    }
    for (auto& reader : readers) reader.join();
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(VectorStoreTest, ZeroKOrNoMatchYieldsEmpty) {
    EXPECT_TRUE(store_->search("parse_config", 0).empty());
    SearchFilters filters;
    filters.file_filter = "missing.py";
    EXPECT_TRUE(store_->search("parse_config", 5, filters).empty());
}

TEST_F(VectorStoreTest, ReembeddingAFileReplacesItsFragments) {
    FileAnalysis a = analyzer_.analyze("src/a.py", "def only_one():\n    return 1\n");
    EXPECT_EQ(store_->embed_file(a, "def only_one():\n    return 1\n"), 2u);
    EXPECT_EQ(store_->stats().total_embeddings, 5u);

    SearchFilters filters;
    filters.file_filter = "src/a.py";
    auto results = store_->search("parse_config", 10, filters);
    for (const auto& r : results) EXPECT_NE(r.symbol_name, "parse_config");
}

TEST_F(VectorStoreTest, RemovesByIdAndByFile) {
    EXPECT_TRUE(store_->remove("file:src/b.py"));
    EXPECT_FALSE(store_->remove("file:src/b.py"));
    EXPECT_EQ(store_->stats().total_embeddings, 6u);

    EXPECT_EQ(store_->remove_file("src/a.py"), 4u);
    EXPECT_EQ(store_->stats().total_embeddings, 2u);

    EXPECT_EQ(store_->clear(), 2u);
    EXPECT_TRUE(store_->search("tokenize_stream", 5).empty());
}

TEST(VectorStoreFallback, UnreachablePrimaryFallsBackToFaiss) {
    auto embeddings = std::make_shared<EmbeddingService>(small_config());
    VectorSemanticStore store(embeddings, std::make_shared<UnreachableBackend>());

    EXPECT_TRUE(store.initialize());
    EXPECT_EQ(store.backend_name(), "faiss");
    auto diags = store.diagnostics();
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].kind, ErrorKind::BackendUnavailable);

    CodeEmbedding e;
    e.id = "function:x.py:run:1";
    e.content = "def run(): pass";
    e.file_path = "x.py";
    e.symbol_type = "function";
    EXPECT_TRUE(store.embed_and_store(e));
    EXPECT_EQ(store.search("run", 1).size(), 1u);
}

TEST(EmbeddingServiceTest, FailingModelFallsBackToHashVectors) {
    auto embeddings = std::make_shared<EmbeddingService>(small_config(), std::make_shared<BrokenEmbedder>());
    EmbeddingResult result = embeddings->embed("def run(): pass");

    EXPECT_EQ(result.method, "hash");
    ASSERT_EQ(result.vector.size(), 256u);
    EXPECT_EQ(embeddings->fallback_count(), 1);

    double norm = 0.0;
    for (float v : result.vector) norm += static_cast<double>(v) * v;
    EXPECT_NEAR(std::sqrt(norm), 1.0, 1e-5);
}

TEST(EmbeddingServiceTest, PreprocessCollapsesWhitespace) {
    EmbeddingService embeddings(small_config());
    EXPECT_EQ(embeddings.preprocess("def  run():\n\n    pass"), "def run(): pass");
}

TEST(FaissVectorStoreTest, RejectsWrongDimension) {
    FaissVectorStore faiss_store;
    ASSERT_TRUE(faiss_store.initialize(4));
    CodeEmbedding e;
    e.id = "a";
    e.vector = {1.0f, 0.0f, 0.0f};
    EXPECT_FALSE(faiss_store.upsert(e));
    e.vector = {1.0f, 0.0f, 0.0f, 0.0f};
    EXPECT_TRUE(faiss_store.upsert(e));
    EXPECT_TRUE(faiss_store.query({1.0f, 0.0f, 0.0f}, 1, {}).empty());
    EXPECT_EQ(faiss_store.query({1.0f, 0.0f, 0.0f, 0.0f}, 1, {}).size(), 1u);
}

TEST(EmbeddingServiceTest, ModelVectorsAreCachedPerText) {
    class CountingEmbedder : public Embedder {
    public:
        std::string name() const override { return "counting"; }
        bool is_available() const override { return true; }
        int dimension() const override { return 256; }
        std::vector<float> embed(const std::string&) override {
            ++calls;
            std::vector<float> v(256, 0.0f);
            v[0] = 1.0f;
            return v;
        }
        int calls = 0;
    };

    auto model = std::make_shared<CountingEmbedder>();
    EmbeddingService embeddings(small_config(), model);
    EXPECT_FALSE(embeddings.embed("def run():   pass").from_cache);
    EmbeddingResult second = embeddings.embed("def run(): pass");
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(second.method, "counting");
    EXPECT_EQ(model->calls, 1);
    EXPECT_EQ(embeddings.cache_hits(), 1);

    embeddings.embed("def stop(): pass");
    EXPECT_EQ(model->calls, 2);
}

TEST(LRUCacheTest, EvictsLeastRecentlyUsed) {
    LRUCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());
    cache.set("c", 3);
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(cache.get("a").value_or(0), 1);
    EXPECT_EQ(cache.get("c").value_or(0), 3);
    EXPECT_EQ(cache.size(), 2u);
}
