// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <filesystem>
#include <stdexcept>

namespace blockflow {

TemplateRenderer::TemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void TemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled.", inja::SourceLocation{});
    });
}

std::string TemplateRenderer::render(std::string_view template_str, const Value& data) {
    static TemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string TemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace blockflow
