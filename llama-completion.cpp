#include "llama-completion.h"
#include "function-directive.h"

// LLaMA includes
#include "llama.h"

#include <algorithm>
#include <iostream>

// Helpers to match current llama.cpp API
static std::vector<llama_token> tokenize_text(const llama_vocab* vocab, const std::string& text,
                                              bool add_bos, bool parse_special) {
    int n_tokens = (int)text.size() + (add_bos ? 1 : 0);
    std::vector<llama_token> tokens(n_tokens);
    int r = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(), tokens.data(), (int32_t)tokens.size(),
                           add_bos, parse_special);
    if (r < 0) {
        tokens.resize(-r);
        r = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(), tokens.data(), (int32_t)tokens.size(),
                           add_bos, parse_special);
        if (r < 0) {
            tokens.clear();
            return tokens;
        }
    }
    tokens.resize(r);
    return tokens;
}

static std::string token_to_piece(const llama_vocab* vocab, llama_token token) {
    std::vector<char> buf(8, 0);
    int r = llama_token_to_piece(vocab, token, buf.data(), (int32_t)buf.size(), /*lstrip*/ 0, /*special*/ false);
    if (r < 0) {
        buf.resize(-r);
        r = llama_token_to_piece(vocab, token, buf.data(), (int32_t)buf.size(), 0, false);
        if (r < 0) return std::string();
    }
    return std::string(buf.data(), r);
}

LlamaCompletion::LlamaCompletion() = default;

LlamaCompletion::~LlamaCompletion() {
    unload();
}

bool LlamaCompletion::load(const LlamaConfig& config) {
    config_ = config;

    auto t0 = std::chrono::steady_clock::now();
    std::cout << "⏳ Preloading LLaMA model: " << config_.model_path << std::endl;
    llama_backend_init();

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.use_gpu ? config_.n_gpu_layers : 0;
    model_ = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!model_) {
        std::cout << "❌ Failed to load LLaMA model: " << config_.model_path << std::endl;
        return false;
    }

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_batch = config_.n_batch;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_seq_max = 1;
    ctx_ = llama_init_from_model(model_, ctx_params);
    if (!ctx_) {
        std::cout << "❌ Failed to create LLaMA context" << std::endl;
        llama_model_free(model_);
        model_ = nullptr;
        return false;
    }
    vocab_ = llama_model_get_vocab(model_);

    sampler_ = llama_sampler_chain_init(llama_sampler_chain_default_params());
    if (config_.temperature > 0.0f) {
        llama_sampler_chain_add(sampler_, llama_sampler_init_top_k(config_.top_k));
        llama_sampler_chain_add(sampler_, llama_sampler_init_top_p(config_.top_p, 1));
        llama_sampler_chain_add(sampler_, llama_sampler_init_temp(config_.temperature));
        llama_sampler_chain_add(sampler_, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    } else {
        llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "✅ LLaMA model preloaded in " << ms << " ms" << std::endl;
    return true;
}

void LlamaCompletion::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sampler_) { llama_sampler_free(sampler_); sampler_ = nullptr; }
    if (ctx_) { llama_free(ctx_); ctx_ = nullptr; }
    if (model_) {
        llama_model_free(model_);
        model_ = nullptr;
        llama_backend_free();
    }
    vocab_ = nullptr;
}

std::string LlamaCompletion::format_prompt(const CompletionRequest& request) const {
    // Fold the function instructions into the system message
    std::vector<std::string> contents;
    std::vector<llama_chat_message> chat;
    contents.reserve(request.messages.size() + 1);
    bool have_system = false;
    for (const ChatMessage& m : request.messages) {
        std::string content = m.content;
        if (m.role == "system" && !have_system) {
            have_system = true;
            if (request.allow_function_calls) {
                content += "\n\n" + function_call_instructions();
            }
        }
        contents.push_back(content);
    }
    if (!have_system && request.allow_function_calls) {
        contents.insert(contents.begin(), function_call_instructions());
        chat.push_back({"system", contents.front().c_str()});
    }
    size_t offset = chat.size();
    for (size_t i = 0; i < request.messages.size(); ++i) {
        chat.push_back({request.messages[i].role.c_str(), contents[i + offset].c_str()});
    }

    const char* tmpl = llama_model_chat_template(model_, /*name*/ nullptr);
    if (tmpl) {
        std::vector<char> buf(4096);
        int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), /*add_ass*/ true,
                                              buf.data(), (int32_t)buf.size());
        if (n > (int32_t)buf.size()) {
            buf.resize(n);
            n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(), (int32_t)buf.size());
        }
        if (n >= 0) {
            return std::string(buf.data(), n);
        }
        std::cout << "⚠️ Model chat template not supported, using plain transcript format" << std::endl;
    }

    // Plain transcript format for models without a usable template
    std::string prompt;
    for (const llama_chat_message& m : chat) {
        std::string role = m.role;
        if (role == "system") {
            prompt += std::string(m.content) + "\n\n";
        } else {
            prompt += (role == "user" ? "User: " : "Assistant: ") + std::string(m.content) + "\n";
        }
    }
    prompt += "Assistant: ";
    return prompt;
}

bool LlamaCompletion::decode_prompt(const std::vector<int>& tokens, std::string& error) {
    llama_batch batch = llama_batch_init(config_.n_batch, 0, 1);
    int n_past = 0;
    bool ok = true;
    while (n_past < (int)tokens.size()) {
        int n = std::min(config_.n_batch, (int)tokens.size() - n_past);
        batch.n_tokens = n;
        for (int i = 0; i < n; ++i) {
            batch.token[i] = tokens[n_past + i];
            batch.pos[i] = n_past + i;
            batch.n_seq_id[i] = 1;
            batch.seq_id[i][0] = 0;
            batch.logits[i] = (n_past + i == (int)tokens.size() - 1);
        }
        if (llama_decode(ctx_, batch) != 0) {
            error = "failed to decode prompt";
            ok = false;
            break;
        }
        n_past += n;
    }
    llama_batch_free(batch);
    return ok;
}

bool LlamaCompletion::decode_token(int token, int pos) {
    llama_batch batch = llama_batch_init(1, 0, 1);
    batch.n_tokens = 1;
    batch.token[0] = token;
    batch.pos[0] = pos;
    batch.n_seq_id[0] = 1;
    batch.seq_id[0][0] = 0;
    batch.logits[0] = true;
    bool ok = llama_decode(ctx_, batch) == 0;
    llama_batch_free(batch);
    return ok;
}

bool LlamaCompletion::stream(const CompletionRequest& request,
                             const std::function<bool(const CompletionChunk&)>& on_chunk,
                             std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ctx_ || !sampler_) {
        error = "llama model not loaded";
        return false;
    }

    std::string prompt = format_prompt(request);
    std::vector<llama_token> tokens = tokenize_text(vocab_, prompt, /*add_bos*/ true, /*parse_special*/ true);
    if (tokens.empty()) {
        error = "failed to tokenize prompt";
        return false;
    }
    if ((int)tokens.size() + 16 >= config_.n_ctx) {
        error = "prompt of " + std::to_string(tokens.size()) + " tokens does not fit context of " +
                std::to_string(config_.n_ctx);
        return false;
    }

    // Fresh sequence per request
    llama_memory_seq_rm(llama_get_memory(ctx_), 0, 0, -1);
    llama_sampler_reset(sampler_);

    auto t0 = std::chrono::steady_clock::now();
    if (!decode_prompt(tokens, error)) {
        return false;
    }
    if (config_.verbose) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        std::cout << "🦙 Prompt of " << tokens.size() << " tokens decoded in " << ms << " ms" << std::endl;
    }

    DirectiveExtractor extractor;
    std::vector<CompletionChunk> chunks;
    int n_past = (int)tokens.size();
    bool stopped = false;

    auto deliver = [&]() -> bool {
        for (const CompletionChunk& chunk : chunks) {
            // Text after a directive is not part of the answer
            if (!on_chunk(chunk) || !chunk.function_name.empty()) {
                chunks.clear();
                return false;
            }
        }
        chunks.clear();
        return true;
    };

    for (int i = 0; i < config_.max_tokens; ++i) {
        if (std::chrono::steady_clock::now() > request.deadline) {
            error = "generation deadline passed";
            return false;
        }

        llama_token id = llama_sampler_sample(sampler_, ctx_, -1);
        if (llama_vocab_is_eog(vocab_, id)) {
            break;
        }

        extractor.feed(token_to_piece(vocab_, id), chunks);
        if (!deliver()) {
            stopped = true;
            break;
        }

        if (n_past >= config_.n_ctx - 1) {
            std::cout << "⚠️ LLaMA context full, ending response" << std::endl;
            break;
        }
        if (!decode_token(id, n_past)) {
            error = "failed to decode generated token";
            return false;
        }
        n_past++;
    }

    if (!stopped) {
        extractor.finish(chunks);
        deliver();
    }
    return true;
}
