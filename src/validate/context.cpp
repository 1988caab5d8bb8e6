#include <framecheck/validate/context.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace framecheck::validate {

auto ValidationContext::path() const -> std::string {
    std::string out;
    for (const auto& segment : path_) {
        std::visit(
            [&out](const auto& seg) {
                using T = std::decay_t<decltype(seg)>;
                if constexpr (std::is_same_v<T, ArgSegment>) {
                    if (!out.empty()) {
                        out.push_back('.');
                    }
                    out.append(seg.name);
                } else if constexpr (std::is_same_v<T, PositionSegment>) {
                    out.append(fmt::format("[{}]", seg.position));
                } else if constexpr (std::is_same_v<T, KeySegment>) {
                    out.append(fmt::format("[\"{}\"]", seg.key));
                } else {
                    if (!out.empty()) {
                        out.push_back('.');
                    }
                    out.append("return");
                }
            },
            segment);
    }
    return out;
}

}  // namespace framecheck::validate
