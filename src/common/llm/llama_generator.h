#ifndef BLOCKFLOW_LLM_LLAMA_GENERATOR_H
#define BLOCKFLOW_LLM_LLAMA_GENERATOR_H

#include "modules/collaborators/collaborators.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace blockflow {

// Generation collaborator backed by a local llama.cpp model. One model and
// context per instance; concurrent generate() calls are serialized.
class LlamaGenerator : public GenerationCollaborator {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
        // Rendered with {step: {id, description, parameters}, approach: ...}
        std::string prompt_template =
            "Implement step {{ step.id }}: {{ step.description }}\n"
            "Parameters: {{ step.parameters }}\n"
            "Approach: {{ approach }}\n";
        Value approach = Value::object();
        Config() = default;
    };

    explicit LlamaGenerator(const Config& config);
    ~LlamaGenerator() override;

    // Throws GenerationError. parameters.target / parameters.region become the content target.
    Content generate(const ExecutionStep& step) override;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex mutex_;

    std::string complete(const std::string& prompt);
    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace blockflow

#endif // BLOCKFLOW_LLM_LLAMA_GENERATOR_H
