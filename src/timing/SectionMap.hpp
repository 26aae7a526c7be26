/**
 * @file SectionMap.hpp
 * @brief Song structure: which section (verse, chorus, ...) plays when.
 *
 * Spans are half-open [start, end) and may not overlap. Time not covered
 * by any span belongs to the verse. Like TimingModel the map is built once
 * per job and only read afterwards.
 *
 * @section Dependencies
 * - ConfigData (SectionSpan, SectionStyle)
 */

#pragma once
#include <map>
#include <vector>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace lf {

class SectionMap {
public:
    static constexpr SectionKind kDefaultKind = SectionKind::Verse;

    // Empty map: every frame is a verse with unmodified style
    SectionMap() = default;

    // Fails with InvalidArgument on an empty or negative span, or on spans
    // that overlap
    static Result<SectionMap> create(const SectionsConfig& config);

    SectionKind sectionAt(f64 t) const;

    // Kinds met anywhere in [start, end), in order of first appearance
    std::vector<SectionKind> sectionsBetween(f64 start, f64 end) const;

    // Every kind a frame can resolve to
    std::vector<SectionKind> kinds() const;

    const SectionStyle& style(SectionKind kind) const;

    const std::vector<SectionSpan>& spans() const {
        return spans_;
    }
    bool empty() const {
        return spans_.empty();
    }

private:
    std::vector<SectionSpan> spans_; // sorted by start
    std::map<SectionKind, SectionStyle> styles_;
};

} // namespace lf
