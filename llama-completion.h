#pragma once

#include "collaborators.h"

#include <mutex>
#include <string>
#include <vector>

// Forward declarations for LLaMA
struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

struct LlamaConfig {
    std::string model_path = "models/llama-7b-q4_0.gguf";
    int n_threads = 4;
    int n_ctx = 4096;
    int n_batch = 512;
    int n_gpu_layers = 999;
    int max_tokens = 512;
    float temperature = 0.3f;
    float top_p = 0.8f;
    int top_k = 5;
    bool use_gpu = true;
    bool verbose = false;
};

// Streaming chat completion on a preloaded llama.cpp model. Every request
// re-decodes the full history on a cleared sequence, so sessions never share
// KV state; requests are serialized on the single context.
class LlamaCompletion : public CompletionService {
public:
    LlamaCompletion();
    ~LlamaCompletion() override;

    LlamaCompletion(const LlamaCompletion&) = delete;
    LlamaCompletion& operator=(const LlamaCompletion&) = delete;

    bool load(const LlamaConfig& config);
    void unload();
    bool is_loaded() const { return ctx_ != nullptr; }

    bool stream(const CompletionRequest& request,
                const std::function<bool(const CompletionChunk&)>& on_chunk,
                std::string& error) override;

private:
    std::string format_prompt(const CompletionRequest& request) const;
    bool decode_prompt(const std::vector<int>& tokens, std::string& error);
    bool decode_token(int token, int pos);

    LlamaConfig config_;
    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;
    const llama_vocab* vocab_ = nullptr;
    std::mutex mutex_;
};
