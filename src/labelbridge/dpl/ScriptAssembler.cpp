#include <labelbridge/dpl/ScriptAssembler.hpp>

#include <labelbridge/dpl/DplCommands.hpp>

#include <algorithm>

namespace LB::Dpl {

void ScriptAssembler::storeImage(ImageRecord const& record) {
    storage_ += Dpl::storeImage(record.name, record.hex);
    stored_names_.push_back(record.name);
}

void ScriptAssembler::addLayout(std::string command) {
    if (command.empty()) {
        return;
    }
    layout_ += command;
    ++layout_count_;
}

auto ScriptAssembler::hasImage(std::string_view name) const -> bool {
    return std::find(stored_names_.begin(), stored_names_.end(), name) != stored_names_.end();
}

auto ScriptAssembler::finish() const -> std::string {
    auto const header = labelHeader();
    auto const footer = labelFooter();
    std::string script;
    script.reserve(header.size() + storage_.size() + layout_.size() + footer.size());
    script += header;
    script += storage_;
    script += layout_;
    script += footer;
    return script;
}

} // namespace LB::Dpl
