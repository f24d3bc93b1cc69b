#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace LB::Dpl {

struct ImageRecord {
    std::string name;
    std::string hex;
};

// Collects one label in two independent buffers: image storage commands and
// layout commands. finish() always emits every storage command before the first
// layout command so that recalls only reference resident images.
class ScriptAssembler {
public:
    void storeImage(ImageRecord const& record);
    void addLayout(std::string command);

    [[nodiscard]] auto hasImage(std::string_view name) const -> bool;
    [[nodiscard]] auto imageCount() const -> std::size_t { return stored_names_.size(); }
    [[nodiscard]] auto layoutCount() const -> std::size_t { return layout_count_; }

    [[nodiscard]] auto finish() const -> std::string;

private:
    std::string storage_;
    std::string layout_;
    std::vector<std::string> stored_names_;
    std::size_t layout_count_ = 0;
};

} // namespace LB::Dpl
