#include "SectionMap.hpp"
#include <algorithm>
#include <string>
#include "core/ConfigParsers.hpp"
#include "core/Logger.hpp"

namespace lf {

Result<SectionMap> SectionMap::create(const SectionsConfig& config) {
    SectionMap map;
    map.spans_ = config.spans;
    map.styles_ = config.styles;

    std::sort(map.spans_.begin(),
              map.spans_.end(),
              [](const SectionSpan& a, const SectionSpan& b) {
                  return a.start < b.start;
              });

    for (usize i = 0; i < map.spans_.size(); ++i) {
        const SectionSpan& span = map.spans_[i];
        const std::string name = ConfigParsers::toString(span.kind);
        if (span.start < 0.0 || span.end <= span.start) {
            return Result<SectionMap>::err(
                    ErrorKind::InvalidArgument,
                    "Section " + name + " has an empty time range (" +
                            std::to_string(span.start) + " to " +
                            std::to_string(span.end) + ")");
        }
        if (i > 0 && span.start < map.spans_[i - 1].end) {
            return Result<SectionMap>::err(
                    ErrorKind::InvalidArgument,
                    "Section " + name + " at " + std::to_string(span.start) +
                            "s overlaps the previous section");
        }
    }

    for (const auto& span : map.spans_) {
        LOG_DEBUG("Section {:.2f}s - {:.2f}s: {}",
                  span.start,
                  span.end,
                  ConfigParsers::toString(span.kind));
    }
    return Result<SectionMap>::ok(std::move(map));
}

SectionKind SectionMap::sectionAt(f64 t) const {
    // First span starting after t; its predecessor is the only candidate
    auto it = std::upper_bound(spans_.begin(),
                               spans_.end(),
                               t,
                               [](f64 value, const SectionSpan& span) {
                                   return value < span.start;
                               });
    if (it == spans_.begin())
        return kDefaultKind;
    --it;
    return t < it->end ? it->kind : kDefaultKind;
}

std::vector<SectionKind> SectionMap::sectionsBetween(f64 start, f64 end) const {
    std::vector<SectionKind> out;
    auto add = [&out](SectionKind kind) {
        if (std::find(out.begin(), out.end(), kind) == out.end())
            out.push_back(kind);
    };

    f64 covered = start;
    for (const auto& span : spans_) {
        if (span.end <= start)
            continue;
        if (span.start >= end)
            break;
        if (span.start > covered)
            add(kDefaultKind);
        add(span.kind);
        covered = std::max(covered, span.end);
    }
    if (covered < end || out.empty())
        add(kDefaultKind);
    return out;
}

std::vector<SectionKind> SectionMap::kinds() const {
    std::vector<SectionKind> out{kDefaultKind};
    for (const auto& span : spans_) {
        if (std::find(out.begin(), out.end(), span.kind) == out.end())
            out.push_back(span.kind);
    }
    return out;
}

const SectionStyle& SectionMap::style(SectionKind kind) const {
    static const SectionStyle neutral;
    auto it = styles_.find(kind);
    return it != styles_.end() ? it->second : neutral;
}

} // namespace lf
