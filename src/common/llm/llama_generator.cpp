// common/llm/llama_generator.cpp
#include "common/llm/llama_generator.h"
#include "common/utils/log.h"
#include "common/utils/template_renderer.h"
#include <stdexcept>

namespace blockflow {

LlamaGenerator::LlamaGenerator(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99;

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw std::runtime_error("Failed to create llama context");
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    log_info("Loaded model " + config_.model_path);
}

LlamaGenerator::~LlamaGenerator() = default;

std::vector<llama_token> LlamaGenerator::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // 第一次调用返回所需 token 数的负值
    const int32_t needed = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                           nullptr, 0, add_bos, true);
    if (needed <= 0) return {};

    std::vector<llama_token> tokens(static_cast<size_t>(needed));
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), needed, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaGenerator::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    const int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, static_cast<size_t>(n));
}

std::string LlamaGenerator::complete(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Every step starts from an empty context.
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw GenerationError("tokenization failed");
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw GenerationError("prompt evaluation failed");
    }

    std::string response;
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token next = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, next)) {
            break;
        }
        response += detokenize(next);

        batch = llama_batch_get_one(&next, 1);
        if (llama_decode(ctx_.get(), batch)) {
            log_warning("llama_decode failed after " + std::to_string(i + 1) + " tokens, returning partial output");
            break;
        }
    }
    llama_sampler_reset(sampler_.get());
    return response;
}

Content LlamaGenerator::generate(const ExecutionStep& step) {
    Value data = {
        {"step", {{"id", step.id}, {"description", step.description}, {"parameters", step.parameters}}},
        {"approach", config_.approach}
    };

    std::string prompt;
    try {
        prompt = TemplateRenderer::render(config_.prompt_template, data);
    } catch (const std::runtime_error& e) {
        throw GenerationError(std::string("prompt rendering failed: ") + e.what());
    }

    Content content;
    content.text = complete(prompt);
    if (content.text.empty()) {
        throw GenerationError("model produced no output for step " + step.id);
    }
    if (step.parameters.contains("target") && step.parameters["target"].is_string()) {
        content.target = step.parameters["target"].get<std::string>();
    }
    if (step.parameters.contains("region") && step.parameters["region"].is_array()) {
        content.region = step.parameters["region"].get<LineRange>();
    }
    content.metadata = {{"model", config_.model_path}};
    return content;
}

} // namespace blockflow
