#ifndef BLOCKFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define BLOCKFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace blockflow {

// inja 环境，禁用 include
class TemplateRenderer {
public:
    TemplateRenderer();

    // Shared default environment.
    static std::string render(std::string_view template_str, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    std::mutex mutex_; // inja::Environment is not safe for concurrent rendering
    void configure_security();
};

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
