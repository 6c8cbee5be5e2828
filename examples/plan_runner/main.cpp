// main.cpp
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "blockflow/orchestrator.h"
#include "common/config/config_loader.h"
#ifdef BLOCKFLOW_HAVE_LLAMA
#include "common/llm/llama_generator.h"
#endif
#include <string>
#include <vector>

namespace {

// Echoes each step back as its content; stands in for a real code generator.
class EchoGenerator : public blockflow::GenerationCollaborator {
public:
    blockflow::Content generate(const blockflow::ExecutionStep& step) override {
        blockflow::Content content;
        content.text = "// " + step.id + ": " + step.description + "\n";
        if (step.parameters.contains("target") && step.parameters["target"].is_string()) {
            content.target = step.parameters["target"].get<std::string>();
        }
        return content;
    }
};

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::string model_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--model" && i + 1 < argc) {
            model_path = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty() || positional.size() > 2) {
        std::cerr << "Usage: " << argv[0] << " <plan.yaml> [config.yaml] [--model <model.gguf>]\n";
        return 1;
    }

    try {
        // 1. 配置与计划
        blockflow::OrchestratorConfig config;
        if (positional.size() == 2) {
            config = blockflow::load_config(positional[1]);
        }
        const blockflow::Plan plan = blockflow::PlanLoader{}.parse_from_file(positional[0]);

        std::shared_ptr<blockflow::GenerationCollaborator> generator = std::make_shared<EchoGenerator>();
        if (!model_path.empty()) {
#ifdef BLOCKFLOW_HAVE_LLAMA
            blockflow::LlamaGenerator::Config llama_config;
            llama_config.model_path = model_path;
            generator = std::make_shared<blockflow::LlamaGenerator>(llama_config);
#else
            std::cerr << "[ERROR] built without llama.cpp, --model is not available\n";
            return 1;
#endif
        }

        // 2. 执行
        blockflow::Orchestrator orchestrator(config, generator);
        const blockflow::RunReport report = orchestrator.run(plan);

        // 3. 输出结果
        std::cout << report.summary << "\n";
        for (const auto& warning : report.warnings) {
            std::cerr << "[WARNING] " << warning << "\n";
        }

        // 4. 导出 Trace
        nlohmann::json trace_json = nlohmann::json::array();
        for (const auto& tr : orchestrator.traces()) {
            trace_json.push_back(nlohmann::json(tr));
        }
        std::ofstream trace_file("execution_trace.json");
        trace_file << trace_json.dump(2) << std::endl;
        std::cout << "Trace exported to execution_trace.json (" << trace_json.size() << " records)\n";

        return report.success ? 0 : 2;
    } catch (const blockflow::OrchestrationError& e) {
        std::cerr << "[ERROR] " << blockflow::describe(e.error()) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
