#include "template_store.hpp"
#include "compiler.hpp"
#include <spdlog/spdlog.h>

namespace lattice {

Result<void> TemplateStore::reload(const std::string& markup) {
    auto res = Compiler::compile(markup);
    if (!res) {
        spdlog::error("TemplateStore: reload failed, keeping generation {}: {}", generation(), error_msg(res));
        return Err<void>("TemplateStore::reload", res);
    }
    publish(*res);
    spdlog::info("TemplateStore: published generation {}", generation());
    return Ok();
}

void TemplateStore::publish(TemplatePtr tmpl) {
    _current.store(std::move(tmpl));
    _generation.fetch_add(1);
}

TemplatePtr TemplateStore::snapshot() const {
    return _current.load();
}

} // namespace lattice
