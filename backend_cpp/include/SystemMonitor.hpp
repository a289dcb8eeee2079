#pragma once
#include <atomic>
#include <chrono>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

namespace code_intelligence {

struct TelemetryData {
    // Process
    size_t rss_mb = 0;

    // Latency of the last call per backend
    double vector_latency_ms = 0.0;
    double embedding_latency_ms = 0.0;
    double graph_latency_ms = 0.0;
    double llm_generation_ms = 0.0;

    // Throughput
    int output_token_count = 0;
    double tokens_per_second = 0.0;
    int graph_nodes_scanned = 0;
    long long files_indexed = 0;
    long long embeddings_fallback = 0;

    nlohmann::json to_json() const {
        return {
            {"rss_mb", rss_mb},
            {"vector_latency_ms", vector_latency_ms},
            {"embedding_latency_ms", embedding_latency_ms},
            {"graph_latency_ms", graph_latency_ms},
            {"llm_generation_ms", llm_generation_ms},
            {"output_token_count", output_token_count},
            {"tokens_per_second", tokens_per_second},
            {"graph_nodes_scanned", graph_nodes_scanned},
            {"files_indexed", files_indexed},
            {"embeddings_fallback", embeddings_fallback}
        };
    }
};

class SystemMonitor {
public:
    // Global Atomic Metrics
    inline static std::atomic<double> global_vector_latency_ms{0.0};
    inline static std::atomic<double> global_embedding_latency_ms{0.0};
    inline static std::atomic<double> global_graph_latency_ms{0.0};
    inline static std::atomic<double> global_llm_generation_ms{0.0};
    inline static std::atomic<int> global_output_tokens{0};
    inline static std::atomic<int> global_graph_nodes_scanned{0};
    inline static std::atomic<long long> global_files_indexed{0};
    inline static std::atomic<long long> global_embedding_fallbacks{0};

    static TelemetryData snapshot() {
        TelemetryData snap;
        snap.rss_mb = resident_memory_mb();
        snap.vector_latency_ms = global_vector_latency_ms.load();
        snap.embedding_latency_ms = global_embedding_latency_ms.load();
        snap.graph_latency_ms = global_graph_latency_ms.load();
        snap.llm_generation_ms = global_llm_generation_ms.load();
        snap.output_token_count = global_output_tokens.load();
        snap.graph_nodes_scanned = global_graph_nodes_scanned.load();
        snap.files_indexed = global_files_indexed.load();
        snap.embeddings_fallback = global_embedding_fallbacks.load();

        if (snap.llm_generation_ms > 0) {
            snap.tokens_per_second = (snap.output_token_count / snap.llm_generation_ms) * 1000.0;
        }
        return snap;
    }

    // RAII timer storing elapsed milliseconds into one of the atomics above.
    class ScopedLatency {
    public:
        explicit ScopedLatency(std::atomic<double>& target)
            : target_(target), start_(std::chrono::steady_clock::now()) {}
        ~ScopedLatency() { target_.store(elapsed_ms()); }

        double elapsed_ms() const {
            return std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start_).count();
        }

    private:
        std::atomic<double>& target_;
        std::chrono::steady_clock::time_point start_;
    };

private:
    static size_t resident_memory_mb() {
        // Linux: second field of /proc/self/statm is resident pages.
        std::ifstream statm("/proc/self/statm");
        size_t pages_total = 0, pages_resident = 0;
        if (!(statm >> pages_total >> pages_resident)) return 0;
        return pages_resident * 4096 / 1024 / 1024;
    }
};

}
